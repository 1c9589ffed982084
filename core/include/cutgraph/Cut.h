#pragma once

#include "cutgraph/CutTypes.h"
#include "cutgraph/Supervision.h"
#include "cutgraph/features/Features.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cutgraph {

class CutSet;
struct MixedCut;

/**
 * Cut: a window [start, start + duration) of one channel's precomputed
 * features, with the supervisions attached to it.
 *
 * The features reference may span more than the window; only the window is
 * read by load_features(). Supervisions may extend past the window.
 */
struct Cut {
    std::string id;
    int channel{0};
    Seconds start{0.0};
    Seconds duration{0.0};
    features::Features features;
    std::vector<SupervisionSegment> supervisions;

    Seconds end() const { return start + duration; }

    FeatureMatrix load_features(const std::optional<std::string>& rootDir = std::nullopt) const;

    /**
     * Sub-window of this cut, starting `offset` seconds after start and ending
     * at `until` (relative to start) or at the current end.
     * With keepExcessiveSupervisions, supervisions overlapping the new window
     * are kept; otherwise only the ones fully inside it. Supervision times
     * are left untouched.
     * @throws PreconditionError if offset is negative, the new duration is
     *         not positive or the new end passes the current end
     */
    Cut truncate(Seconds offset = 0.0,
                 std::optional<Seconds> until = std::nullopt,
                 bool keepExcessiveSupervisions = true) const;

    MixedCut overlay(const Cut& other, Seconds offsetOtherBy = 0.0, Decibels snr = 0.0) const;
    MixedCut overlay(const MixedCut& other, Seconds offsetOtherBy = 0.0, Decibels snr = 0.0) const;

    // overlay() with the other cut starting where this one ends.
    MixedCut append(const Cut& other, Decibels snr = 0.0) const;
    MixedCut append(const MixedCut& other, Decibels snr = 0.0) const;
};

/**
 * MixedCut: overlay of two cuts, named by id.
 *
 * Operands are looked up in a CutSet on every access; the mix never owns
 * them. An operand that is itself a mix resolves its own operands through
 * the binding that set holds for it (CutSet::source_for). Mixing happens in
 * load_features().
 */
struct MixedCut {
    std::string id;
    std::string leftCutId;
    std::string rightCutId;
    Seconds offsetRightBy{0.0};
    Decibels snr{0.0};

    // max(left duration, offsetRightBy + right duration)
    Seconds duration(const CutSet& cuts) const;

    // Left supervisions followed by right supervisions, unshifted.
    std::vector<SupervisionSegment> supervisions(const CutSet& cuts) const;

    FeatureMatrix load_features(const CutSet& cuts,
                                const std::optional<std::string>& rootDir = std::nullopt) const;

    MixedCut overlay(const Cut& other, Seconds offsetOtherBy = 0.0, Decibels snr = 0.0) const;
    MixedCut overlay(const MixedCut& other, Seconds offsetOtherBy = 0.0, Decibels snr = 0.0) const;
    // overlay() starting at duration(cuts).
    MixedCut append(const Cut& other, const CutSet& cuts, Decibels snr = 0.0) const;
    MixedCut append(const MixedCut& other, const CutSet& cuts, Decibels snr = 0.0) const;
};

using AnyCut = std::variant<Cut, MixedCut>;

enum class CutType {
    Cut,
    Mixed
};

// Fresh random (UUID v4) identifier.
std::string make_cut_id();

const std::string& cut_id(const AnyCut& cut);
CutType cut_type(const AnyCut& cut);

// Uniform accessors over both kinds; mixes look their operands up in `cuts`.
Seconds cut_duration(const AnyCut& cut, const CutSet& cuts);
std::vector<SupervisionSegment> cut_supervisions(const AnyCut& cut, const CutSet& cuts);
FeatureMatrix load_cut_features(const AnyCut& cut,
                                const CutSet& cuts,
                                const std::optional<std::string>& rootDir = std::nullopt);

// Features of the left-most leaf; defines the framing a mix is loaded with.
const features::Features& leaf_features(const AnyCut& cut, const CutSet& cuts);

bool operator==(const Cut& lhs, const Cut& rhs);
bool operator!=(const Cut& lhs, const Cut& rhs);
bool operator==(const MixedCut& lhs, const MixedCut& rhs);
bool operator!=(const MixedCut& lhs, const MixedCut& rhs);

}  // namespace cutgraph
