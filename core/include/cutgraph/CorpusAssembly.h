#pragma once

#include "cutgraph/CutSet.h"
#include "cutgraph/Supervision.h"
#include "cutgraph/features/Features.h"

namespace cutgraph {

/**
 * One Cut per supervision, spanning exactly the supervision, with the
 * matching features attached and the supervision as its only target.
 * @throws std::runtime_error if a supervision has no matching features
 */
CutSet make_cuts_from_supervisions(const SupervisionSet& supervisions,
                                   const features::FeatureSet& featureSet);

/**
 * Downmix a two-channel CutSet into mono MixedCuts (0 s offset, 0 dB).
 *
 * Cuts are paired by position within each channel, so the input must be
 * ordered by (recording, channel) with matching segmentation on both sides.
 * The result holds only mixes; bind it to the input with
 * with_source_cuts_from() before resolving anything.
 *
 * @throws PreconditionError unless the set has exactly two channels, the same
 *         number of cuts on each, and no mixed cuts
 */
CutSet mix_stereo_cut_set(const CutSet& cuts);

}  // namespace cutgraph
