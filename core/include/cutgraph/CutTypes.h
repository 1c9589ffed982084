#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cutgraph {

using Seconds = double;
using Decibels = double;

// ========== Time interval ==========
struct TimeSpan {
    Seconds start{0.0};
    Seconds end{0.0};
};

// ========== Feature matrix ==========
// Row-major frames x features block, as produced by a feature extractor
// (e.g. log-mel filterbank energies) or by mixing two such blocks.
struct FeatureMatrix {
    std::size_t numFrames{0};
    std::size_t numFeatures{0};
    std::vector<float> values;          // length = numFrames * numFeatures

    static FeatureMatrix zeros(std::size_t frames, std::size_t features) {
        FeatureMatrix m;
        m.numFrames = frames;
        m.numFeatures = features;
        m.values.assign(frames * features, 0.0f);
        return m;
    }

    float* frame(std::size_t index) { return values.data() + index * numFeatures; }
    const float* frame(std::size_t index) const { return values.data() + index * numFeatures; }

    float at(std::size_t index, std::size_t dim) const { return values[index * numFeatures + dim]; }
};

}  // namespace cutgraph
