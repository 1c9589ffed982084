#include "cutgraph/Cut.h"

#include "cutgraph/CoreContract.h"
#include "cutgraph/CutSet.h"
#include "cutgraph/Errors.h"
#include "cutgraph/TimeSpan.h"
#include "cutgraph/features/FeatureMixing.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace cutgraph {

namespace {

MixedCut make_mix(const std::string& leftId, const std::string& rightId, Seconds offset, Decibels snr) {
    MixedCut mix;
    mix.id = make_cut_id();
    mix.leftCutId = leftId;
    mix.rightCutId = rightId;
    mix.offsetRightBy = offset;
    mix.snr = snr;
    return mix;
}

}  // namespace

std::string make_cut_id() {
    static boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

// ========== Cut ==========

FeatureMatrix Cut::load_features(const std::optional<std::string>& rootDir) const {
    return features.load(rootDir, start, duration);
}

Cut Cut::truncate(Seconds offset, std::optional<Seconds> until, bool keepExcessiveSupervisions) const {
    if (offset < 0.0) {
        throw PreconditionError("Truncating cut " + id + " with negative offset " + std::to_string(offset) +
                                " would start before the cut");
    }
    const Seconds newStart = start + offset;
    const Seconds newDuration = until ? (*until - offset) : (duration - offset);
    if (!(newDuration > 0.0)) {
        throw PreconditionError("Truncating cut " + id + " with offset " + std::to_string(offset) +
                                " leaves a non-positive duration " + std::to_string(newDuration));
    }
    if (newStart + newDuration > end() + contract::TRUNCATE_END_TOLERANCE_SEC) {
        throw PreconditionError("Truncated cut would end at " + std::to_string(newStart + newDuration) +
                                " s, past the end of cut " + id + " at " + std::to_string(end()) + " s");
    }

    const TimeSpan window = make_span(newStart, newDuration);
    Cut truncated;
    truncated.id = make_cut_id();
    truncated.channel = channel;
    truncated.start = newStart;
    truncated.duration = newDuration;
    truncated.features = features;
    for (const auto& segment : supervisions) {
        const bool keep = keepExcessiveSupervisions ? overlaps(window, segment.span())
                                                    : overspans(window, segment.span());
        if (keep) truncated.supervisions.push_back(segment);
    }
    return truncated;
}

MixedCut Cut::overlay(const Cut& other, Seconds offsetOtherBy, Decibels snr) const {
    return make_mix(id, other.id, offsetOtherBy, snr);
}

MixedCut Cut::overlay(const MixedCut& other, Seconds offsetOtherBy, Decibels snr) const {
    return make_mix(id, other.id, offsetOtherBy, snr);
}

MixedCut Cut::append(const Cut& other, Decibels snr) const {
    return overlay(other, duration, snr);
}

MixedCut Cut::append(const MixedCut& other, Decibels snr) const {
    return overlay(other, duration, snr);
}

// ========== MixedCut ==========

Seconds MixedCut::duration(const CutSet& cuts) const {
    const Seconds left = cut_duration(cuts.at(leftCutId), cuts.source_for(leftCutId));
    const Seconds right = cut_duration(cuts.at(rightCutId), cuts.source_for(rightCutId));
    return std::max(left, offsetRightBy + right);
}

std::vector<SupervisionSegment> MixedCut::supervisions(const CutSet& cuts) const {
    std::vector<SupervisionSegment> result = cut_supervisions(cuts.at(leftCutId), cuts.source_for(leftCutId));
    std::vector<SupervisionSegment> right = cut_supervisions(cuts.at(rightCutId), cuts.source_for(rightCutId));
    result.insert(result.end(), right.begin(), right.end());
    return result;
}

FeatureMatrix MixedCut::load_features(const CutSet& cuts, const std::optional<std::string>& rootDir) const {
    const AnyCut& left = cuts.at(leftCutId);
    const AnyCut& right = cuts.at(rightCutId);
    const CutSet& leftSource = cuts.source_for(leftCutId);
    const CutSet& rightSource = cuts.source_for(rightCutId);

    const features::Features& leftFeats = leaf_features(left, leftSource);
    const features::Features& rightFeats = leaf_features(right, rightSource);
    if (leftFeats.frameLength != rightFeats.frameLength || leftFeats.frameShift != rightFeats.frameShift) {
        throw PreconditionError("Cannot mix cuts " + leftCutId + " and " + rightCutId +
                                " with different framing (frame_length " + std::to_string(leftFeats.frameLength) +
                                " vs " + std::to_string(rightFeats.frameLength) + ", frame_shift " +
                                std::to_string(leftFeats.frameShift) + " vs " +
                                std::to_string(rightFeats.frameShift) + ")");
    }

    FeatureMatrix leftMatrix = load_cut_features(left, leftSource, rootDir);
    FeatureMatrix rightMatrix = load_cut_features(right, rightSource, rootDir);
    const std::size_t leftFrames = leftMatrix.numFrames;
    const std::size_t rightFrames = rightMatrix.numFrames;

    auto padded = features::pad_shorter(std::move(leftMatrix), std::move(rightMatrix));
    const std::size_t numFrames = features::seconds_to_frames(duration(cuts), leftFeats.frameShift);
    return features::overlay_fbank(padded.first, padded.second, snr, offsetRightBy, leftFeats.frameShift,
                                   numFrames, leftFrames, rightFrames);
}

MixedCut MixedCut::overlay(const Cut& other, Seconds offsetOtherBy, Decibels snr) const {
    return make_mix(id, other.id, offsetOtherBy, snr);
}

MixedCut MixedCut::overlay(const MixedCut& other, Seconds offsetOtherBy, Decibels snr) const {
    return make_mix(id, other.id, offsetOtherBy, snr);
}

MixedCut MixedCut::append(const Cut& other, const CutSet& cuts, Decibels snr) const {
    return overlay(other, duration(cuts), snr);
}

MixedCut MixedCut::append(const MixedCut& other, const CutSet& cuts, Decibels snr) const {
    return overlay(other, duration(cuts), snr);
}

// ========== AnyCut dispatch ==========

const std::string& cut_id(const AnyCut& cut) {
    return std::visit([](const auto& c) -> const std::string& { return c.id; }, cut);
}

CutType cut_type(const AnyCut& cut) {
    return std::holds_alternative<MixedCut>(cut) ? CutType::Mixed : CutType::Cut;
}

Seconds cut_duration(const AnyCut& cut, const CutSet& cuts) {
    if (const auto* mix = std::get_if<MixedCut>(&cut)) {
        return mix->duration(cuts);
    }
    return std::get<Cut>(cut).duration;
}

std::vector<SupervisionSegment> cut_supervisions(const AnyCut& cut, const CutSet& cuts) {
    if (const auto* mix = std::get_if<MixedCut>(&cut)) {
        return mix->supervisions(cuts);
    }
    return std::get<Cut>(cut).supervisions;
}

FeatureMatrix load_cut_features(const AnyCut& cut, const CutSet& cuts, const std::optional<std::string>& rootDir) {
    if (const auto* mix = std::get_if<MixedCut>(&cut)) {
        return mix->load_features(cuts, rootDir);
    }
    return std::get<Cut>(cut).load_features(rootDir);
}

const features::Features& leaf_features(const AnyCut& cut, const CutSet& cuts) {
    const AnyCut* current = &cut;
    const CutSet* source = &cuts;
    while (const auto* mix = std::get_if<MixedCut>(current)) {
        const CutSet& holder = *source;
        current = &holder.at(mix->leftCutId);
        source = &holder.source_for(mix->leftCutId);
    }
    return std::get<Cut>(*current).features;
}

bool operator==(const Cut& lhs, const Cut& rhs) {
    return lhs.id == rhs.id && lhs.channel == rhs.channel && lhs.start == rhs.start &&
           lhs.duration == rhs.duration && lhs.features == rhs.features && lhs.supervisions == rhs.supervisions;
}

bool operator!=(const Cut& lhs, const Cut& rhs) {
    return !(lhs == rhs);
}

bool operator==(const MixedCut& lhs, const MixedCut& rhs) {
    return lhs.id == rhs.id && lhs.leftCutId == rhs.leftCutId && lhs.rightCutId == rhs.rightCutId &&
           lhs.offsetRightBy == rhs.offsetRightBy && lhs.snr == rhs.snr;
}

bool operator!=(const MixedCut& lhs, const MixedCut& rhs) {
    return !(lhs == rhs);
}

}  // namespace cutgraph
