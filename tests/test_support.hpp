#pragma once

#include "cutgraph/Cut.h"
#include "cutgraph/CoreContract.h"
#include "cutgraph/features/FeatureMixing.h"
#include "cutgraph/features/FeatureStore.h"

#include <filesystem>
#include <string>

namespace test_support {

// Unique path under the system temp directory, removed on destruction.
class TempPath {
  public:
    explicit TempPath(const std::string& suffix)
        : path_((std::filesystem::temp_directory_path() / ("cutgraph-" + cutgraph::make_cut_id() + suffix))
                    .string()) {}
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& str() const { return path_; }

  private:
    std::string path_;
};

// Stores a matrix whose every value is `value` and returns a reference to it.
inline cutgraph::features::Features store_constant_features(const std::string& storePath,
                                                            const std::string& key,
                                                            const std::string& recordingId,
                                                            int channel,
                                                            double duration,
                                                            float value,
                                                            double frameShift = 0.01,
                                                            std::size_t numFeatures = 4) {
    cutgraph::features::FeatureStore store(storePath);
    store.initialize();
    const std::size_t frames = cutgraph::features::seconds_to_frames(duration, frameShift);
    cutgraph::FeatureMatrix m = cutgraph::FeatureMatrix::zeros(frames, numFeatures);
    m.values.assign(m.values.size(), value);
    store.write_matrix(key, m);

    cutgraph::features::Features f;
    f.type = "fbank";
    f.recordingId = recordingId;
    f.channelId = channel;
    f.start = 0.0;
    f.duration = duration;
    f.numFrames = frames;
    f.numFeatures = numFeatures;
    f.frameLength = 0.025;
    f.frameShift = frameShift;
    f.samplingRate = 16000;
    f.storageType = cutgraph::contract::SQLITE_STORAGE_TYPE;
    f.storagePath = storePath;
    f.storageKey = key;
    return f;
}

// Matrix where frame t holds t in every dimension.
inline cutgraph::features::Features store_ramp_features(const std::string& storePath,
                                                        const std::string& key,
                                                        const std::string& recordingId,
                                                        int channel,
                                                        double duration,
                                                        double frameShift = 0.01,
                                                        std::size_t numFeatures = 2) {
    cutgraph::features::Features f =
        store_constant_features(storePath, key, recordingId, channel, duration, 0.0f, frameShift, numFeatures);
    cutgraph::FeatureMatrix m = cutgraph::FeatureMatrix::zeros(f.numFrames, numFeatures);
    for (std::size_t t = 0; t < m.numFrames; ++t) {
        for (std::size_t d = 0; d < numFeatures; ++d) m.frame(t)[d] = static_cast<float>(t);
    }
    cutgraph::features::FeatureStore store(storePath);
    store.write_matrix(key, m);
    return f;
}

inline cutgraph::Cut make_cut(const cutgraph::features::Features& features,
                              double start,
                              double duration,
                              int channel = 0) {
    cutgraph::Cut cut;
    cut.id = cutgraph::make_cut_id();
    cut.channel = channel;
    cut.start = start;
    cut.duration = duration;
    cut.features = features;
    return cut;
}

inline cutgraph::SupervisionSegment make_supervision(const std::string& id,
                                                     double start,
                                                     double duration,
                                                     const std::string& recordingId = "rec",
                                                     int channel = 0) {
    cutgraph::SupervisionSegment s;
    s.id = id;
    s.recordingId = recordingId;
    s.start = start;
    s.duration = duration;
    s.channelId = channel;
    return s;
}

}  // namespace test_support
