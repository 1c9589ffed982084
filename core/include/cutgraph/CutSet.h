#pragma once

#include "cutgraph/Cut.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cutgraph {

/**
 * CutSet: id-keyed registry of cuts and mixed cuts
 *
 * Keeps insertion order for iteration and serialization. MixedCuts held here
 * resolve their operand ids against the source set (this set unless rebound
 * with with_source_cuts_from()). A union carries each mix's binding over
 * from the operand it came from, so a single set may hold mixes bound to
 * different sources.
 */
class CutSet {
  public:
    using const_iterator = std::vector<AnyCut>::const_iterator;

    CutSet() = default;
    explicit CutSet(std::vector<AnyCut> cuts);

    /**
     * Read a JSON manifest: an array of records tagged with "type".
     * @throws UnknownCutTypeError on an unexpected type tag
     */
    static CutSet from_json(const std::string& path);
    void to_json(const std::string& path) const;

    // Inserts or replaces by id. Replacement keeps the original position and
    // drops any per-mix binding held for that id.
    void add(AnyCut cut);

    bool contains(const std::string& id) const;
    const AnyCut* find(const std::string& id) const;

    // @throws UnresolvedReferenceError if the id is not held
    const AnyCut& at(const std::string& id) const;

    std::size_t size() const { return cuts_.size(); }
    bool empty() const { return cuts_.empty(); }

    const_iterator begin() const { return cuts_.begin(); }
    const_iterator end() const { return cuts_.end(); }

    std::vector<std::string> ids() const;
    std::vector<const Cut*> simple_cuts() const;
    std::vector<const MixedCut*> mixed_cuts() const;

    /**
     * Resolve all of this set's MixedCuts against `source` from now on,
     * replacing every earlier binding. Binding to this set itself restores
     * the default. The source must outlive the binding.
     */
    CutSet& with_source_cuts_from(const CutSet& source);
    bool has_external_source() const { return source_ != nullptr; }

    // Collection MixedCuts are resolved against.
    const CutSet& source() const { return source_ ? *source_ : *this; }

    // Collection the operands of the mix `id` are resolved against: its own
    // binding if a union carried one over, source() otherwise.
    const CutSet& source_for(const std::string& id) const;

    Seconds duration(const std::string& id) const;
    std::vector<SupervisionSegment> supervisions(const std::string& id) const;
    FeatureMatrix load_features(const std::string& id,
                                const std::optional<std::string>& rootDir = std::nullopt) const;

    /**
     * Union of both mappings; on a shared id the right-hand cut wins.
     * Each mix keeps the source it had in its operand. Mixes that resolved
     * against either operand resolve against the union instead.
     */
    friend CutSet operator+(const CutSet& lhs, const CutSet& rhs);

  private:
    std::vector<AnyCut> cuts_;
    std::unordered_map<std::string, std::size_t> index_;
    const CutSet* source_{nullptr};
    std::unordered_map<std::string, const CutSet*> bindings_;
};

}  // namespace cutgraph
