#include "cutgraph/features/Features.h"

#include "cutgraph/CoreContract.h"
#include "cutgraph/features/FeatureMixing.h"
#include "cutgraph/features/FeatureStore.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cutgraph {
namespace features {

namespace {

std::string join_root(const std::optional<std::string>& rootDir, const std::string& path) {
    if (!rootDir || rootDir->empty() || (!path.empty() && path.front() == '/')) {
        return path;
    }
    if (rootDir->back() == '/') {
        return *rootDir + path;
    }
    return *rootDir + "/" + path;
}

}  // namespace

FeatureMatrix Features::load(const std::optional<std::string>& rootDir,
                             std::optional<Seconds> start,
                             std::optional<Seconds> duration) const {
    if (storageType != contract::SQLITE_STORAGE_TYPE) {
        throw std::runtime_error("Unsupported feature storage type: '" + storageType + "'");
    }

    const std::string path = join_root(rootDir, storagePath);
    FeatureMatrix full;
    {
        FeatureStore store(path, FeatureStore::Mode::ReadOnly);
        full = store.read_matrix(storageKey);
    }

    const Seconds windowStart = start.value_or(this->start);
    if (windowStart < this->start - contract::TRUNCATE_END_TOLERANCE_SEC) {
        throw std::runtime_error("Requested features from " + std::to_string(windowStart) +
                                 " s, before the stored extent starting at " + std::to_string(this->start) + " s");
    }
    const std::size_t firstFrame = seconds_to_frames(std::max(0.0, windowStart - this->start), frameShift);
    const std::size_t frameCount = duration ? seconds_to_frames(*duration, frameShift)
                                            : full.numFrames - std::min(firstFrame, full.numFrames);
    if (firstFrame + frameCount > full.numFrames) {
        throw std::runtime_error("Requested frames [" + std::to_string(firstFrame) + ", " +
                                 std::to_string(firstFrame + frameCount) + ") of '" + storageKey +
                                 "' which only has " + std::to_string(full.numFrames) + " frames");
    }

    FeatureMatrix window;
    window.numFrames = frameCount;
    window.numFeatures = full.numFeatures;
    const auto first = full.values.begin() + static_cast<std::ptrdiff_t>(firstFrame * full.numFeatures);
    window.values.assign(first, first + static_cast<std::ptrdiff_t>(frameCount * full.numFeatures));
    return window;
}

bool operator==(const Features& lhs, const Features& rhs) {
    return lhs.type == rhs.type && lhs.recordingId == rhs.recordingId && lhs.channelId == rhs.channelId &&
           lhs.start == rhs.start && lhs.duration == rhs.duration && lhs.numFrames == rhs.numFrames &&
           lhs.numFeatures == rhs.numFeatures && lhs.frameLength == rhs.frameLength &&
           lhs.frameShift == rhs.frameShift && lhs.samplingRate == rhs.samplingRate &&
           lhs.storageType == rhs.storageType && lhs.storagePath == rhs.storagePath &&
           lhs.storageKey == rhs.storageKey;
}

bool operator!=(const Features& lhs, const Features& rhs) {
    return !(lhs == rhs);
}

FeatureSet::FeatureSet(std::vector<Features> features) : features_(std::move(features)) {}

void FeatureSet::add(Features features) {
    features_.push_back(std::move(features));
}

const Features& FeatureSet::find(const std::string& recordingId,
                                 int channelId,
                                 Seconds start,
                                 std::optional<Seconds> duration) const {
    const double leeway = contract::FEATURE_EXTENT_LEEWAY_SEC;
    bool startMatched = false;
    for (const auto& f : features_) {
        if (f.recordingId != recordingId || f.channelId != channelId) continue;
        if (!(f.start - leeway <= start && start < f.end() + leeway)) continue;
        startMatched = true;
        if (duration && f.end() < start + *duration - leeway) continue;
        return f;
    }
    if (startMatched) {
        throw std::runtime_error("Requested segment (" + recordingId + ", channel " + std::to_string(channelId) +
                                 ", start " + std::to_string(start) + " s) exceeds the stored features");
    }
    throw std::runtime_error("No features available for recording '" + recordingId + "', channel " +
                             std::to_string(channelId) + " at " + std::to_string(start) + " s");
}

}  // namespace features
}  // namespace cutgraph
