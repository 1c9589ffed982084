#include "cutgraph/features/FeatureMixing.h"

#include "cutgraph/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace cutgraph {
namespace features {

double snr_to_power_gain(Decibels snr) {
    return std::pow(10.0, -snr / 10.0);
}

std::size_t seconds_to_frames(Seconds duration, Seconds frameShift) {
    if (frameShift <= 0.0) {
        throw PreconditionError("frame_shift must be positive, got " + std::to_string(frameShift));
    }
    const long frames = std::lround(duration / frameShift);
    return frames > 0 ? static_cast<std::size_t>(frames) : 0;
}

std::pair<FeatureMatrix, FeatureMatrix> pad_shorter(FeatureMatrix lhs, FeatureMatrix rhs) {
    FeatureMatrix& shorter = (lhs.numFrames < rhs.numFrames) ? lhs : rhs;
    const std::size_t target = std::max(lhs.numFrames, rhs.numFrames);
    shorter.values.resize(target * shorter.numFeatures, 0.0f);
    shorter.numFrames = target;
    return {std::move(lhs), std::move(rhs)};
}

FeatureMatrix overlay_fbank(const FeatureMatrix& left,
                            const FeatureMatrix& right,
                            Decibels snr,
                            Seconds offsetRightBy,
                            Seconds frameShift,
                            std::size_t numFrames) {
    return overlay_fbank(left, right, snr, offsetRightBy, frameShift, numFrames, left.numFrames, right.numFrames);
}

FeatureMatrix overlay_fbank(const FeatureMatrix& left,
                            const FeatureMatrix& right,
                            Decibels snr,
                            Seconds offsetRightBy,
                            Seconds frameShift,
                            std::size_t numFrames,
                            std::size_t leftFrames,
                            std::size_t rightFrames) {
    if (left.numFeatures != right.numFeatures) {
        throw PreconditionError("Cannot overlay feature matrices with " + std::to_string(left.numFeatures) +
                                " and " + std::to_string(right.numFeatures) + " features per frame");
    }
    if (leftFrames > left.numFrames || rightFrames > right.numFrames) {
        throw PreconditionError("Operand extent exceeds the matrix (" + std::to_string(leftFrames) + "/" +
                                std::to_string(left.numFrames) + " left, " + std::to_string(rightFrames) + "/" +
                                std::to_string(right.numFrames) + " right)");
    }
    const std::size_t D = left.numFeatures;
    const std::size_t offsetFrames = seconds_to_frames(offsetRightBy, frameShift);
    const std::size_t extent = std::max(left.numFrames, offsetFrames + right.numFrames);
    const float gain = static_cast<float>(snr_to_power_gain(snr));

    FeatureMatrix out = FeatureMatrix::zeros(extent, D);
    for (std::size_t t = 0; t < extent; ++t) {
        const bool hasLeft = t < leftFrames;
        const bool hasRight = t >= offsetFrames && (t - offsetFrames) < rightFrames;
        float* dst = out.frame(t);
        if (hasLeft && hasRight) {
            const float* l = left.frame(t);
            const float* r = right.frame(t - offsetFrames);
            for (std::size_t d = 0; d < D; ++d) dst[d] = l[d] + gain * r[d];
        } else if (hasLeft) {
            std::copy(left.frame(t), left.frame(t) + D, dst);
        } else if (hasRight) {
            const float* r = right.frame(t - offsetFrames);
            std::copy(r, r + D, dst);
        }
    }

    out.values.resize(numFrames * D, 0.0f);
    out.numFrames = numFrames;
    return out;
}

}  // namespace features
}  // namespace cutgraph
