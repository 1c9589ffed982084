#include "cutgraph/CutSet.h"

#include "cutgraph/Errors.h"
#include "cutgraph/Logging.h"
#include "cutgraph/Serialization.h"

#include <stdexcept>
#include <utility>

namespace cutgraph {

CutSet::CutSet(std::vector<AnyCut> cuts) {
    cuts_.reserve(cuts.size());
    for (auto& cut : cuts) {
        add(std::move(cut));
    }
}

CutSet CutSet::from_json(const std::string& path) {
    const nlohmann::json j = read_json_file(path);
    if (!j.is_array()) {
        throw std::runtime_error("Cut manifest is not an array of records: " + path);
    }

    // Parse everything before building the set, so a bad record leaves nothing behind.
    std::vector<AnyCut> cuts;
    cuts.reserve(j.size());
    for (const auto& record : j) {
        cuts.push_back(cut_from_json(record));
    }

    CutSet set(std::move(cuts));
    log_message(LogLevel::Info, "CutSet", "Read " + std::to_string(set.size()) + " cuts from " + path);
    return set;
}

void CutSet::to_json(const std::string& path) const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& cut : cuts_) {
        records.push_back(cut_to_json(cut));
    }
    write_json_file(path, records);
    log_message(LogLevel::Info, "CutSet", "Wrote " + std::to_string(cuts_.size()) + " cuts to " + path);
}

void CutSet::add(AnyCut cut) {
    const std::string id = cut_id(cut);
    bindings_.erase(id);
    const auto it = index_.find(id);
    if (it != index_.end()) {
        cuts_[it->second] = std::move(cut);
        return;
    }
    index_.emplace(id, cuts_.size());
    cuts_.push_back(std::move(cut));
}

bool CutSet::contains(const std::string& id) const {
    return index_.count(id) > 0;
}

const AnyCut* CutSet::find(const std::string& id) const {
    const auto it = index_.find(id);
    return it == index_.end() ? nullptr : &cuts_[it->second];
}

const AnyCut& CutSet::at(const std::string& id) const {
    const AnyCut* cut = find(id);
    if (!cut) {
        throw UnresolvedReferenceError("Cut '" + id + "' is not present in the resolving CutSet (" +
                                       std::to_string(cuts_.size()) + " cuts)");
    }
    return *cut;
}

std::vector<std::string> CutSet::ids() const {
    std::vector<std::string> out;
    out.reserve(cuts_.size());
    for (const auto& cut : cuts_) out.push_back(cut_id(cut));
    return out;
}

std::vector<const Cut*> CutSet::simple_cuts() const {
    std::vector<const Cut*> out;
    for (const auto& cut : cuts_) {
        if (const auto* c = std::get_if<Cut>(&cut)) out.push_back(c);
    }
    return out;
}

std::vector<const MixedCut*> CutSet::mixed_cuts() const {
    std::vector<const MixedCut*> out;
    for (const auto& cut : cuts_) {
        if (const auto* c = std::get_if<MixedCut>(&cut)) out.push_back(c);
    }
    return out;
}

CutSet& CutSet::with_source_cuts_from(const CutSet& source) {
    source_ = (&source == this) ? nullptr : &source;
    bindings_.clear();
    return *this;
}

const CutSet& CutSet::source_for(const std::string& id) const {
    const auto it = bindings_.find(id);
    return it == bindings_.end() ? source() : *it->second;
}

Seconds CutSet::duration(const std::string& id) const {
    return cut_duration(at(id), source_for(id));
}

std::vector<SupervisionSegment> CutSet::supervisions(const std::string& id) const {
    return cut_supervisions(at(id), source_for(id));
}

FeatureMatrix CutSet::load_features(const std::string& id, const std::optional<std::string>& rootDir) const {
    return load_cut_features(at(id), source_for(id), rootDir);
}

CutSet operator+(const CutSet& lhs, const CutSet& rhs) {
    CutSet merged;
    merged.cuts_.reserve(lhs.size() + rhs.size());
    auto merge = [&](const CutSet& from) {
        for (const auto& cut : from) {
            merged.add(cut);
            if (!std::holds_alternative<MixedCut>(cut)) continue;
            const std::string& id = cut_id(cut);
            const CutSet& source = from.source_for(id);
            if (&source != &lhs && &source != &rhs) {
                merged.bindings_[id] = &source;
            }
        }
    };
    merge(lhs);
    merge(rhs);
    return merged;
}

}  // namespace cutgraph
