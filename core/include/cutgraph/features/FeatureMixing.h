#pragma once

#include "../CutTypes.h"

#include <cstddef>
#include <utility>

namespace cutgraph {
namespace features {

// Linear power factor applied to the right operand for a given SNR:
// 10^(-snr/10). Positive SNR attenuates, negative SNR amplifies.
double snr_to_power_gain(Decibels snr);

std::size_t seconds_to_frames(Seconds duration, Seconds frameShift);

/**
 * Pad the shorter matrix with trailing zero frames so both have the same
 * number of frames. Feature dimensions are not touched.
 */
std::pair<FeatureMatrix, FeatureMatrix> pad_shorter(FeatureMatrix lhs, FeatureMatrix rhs);

/**
 * Overlay `right` onto `left`, shifted forward by offsetRightBy.
 *
 * Frames covered by both operands: left + gain * right, gain from snr.
 * Frames covered by one operand only: that operand's value as is.
 * The result spans the shifted extent and is resized to numFrames frames.
 *
 * @throws PreconditionError when the feature dimensions differ
 */
FeatureMatrix overlay_fbank(const FeatureMatrix& left,
                            const FeatureMatrix& right,
                            Decibels snr,
                            Seconds offsetRightBy,
                            Seconds frameShift,
                            std::size_t numFrames);

// Same, for operands already run through pad_shorter(): leftFrames and
// rightFrames are the frame counts before padding. Padding frames never
// count as coverage, so they do not trigger the gain.
FeatureMatrix overlay_fbank(const FeatureMatrix& left,
                            const FeatureMatrix& right,
                            Decibels snr,
                            Seconds offsetRightBy,
                            Seconds frameShift,
                            std::size_t numFrames,
                            std::size_t leftFrames,
                            std::size_t rightFrames);

}  // namespace features
}  // namespace cutgraph
