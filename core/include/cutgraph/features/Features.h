#pragma once

#include "../CutTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace cutgraph {
namespace features {

/**
 * Features: reference to a precomputed feature matrix of one recording channel
 *
 * Holds the extent [start, start + duration) covered by the stored matrix, its
 * framing parameters and where the matrix lives. Nothing is read until load().
 */
struct Features {
    std::string type;                   // extractor name, e.g. "fbank"
    std::string recordingId;
    int channelId{0};
    Seconds start{0.0};
    Seconds duration{0.0};
    std::size_t numFrames{0};
    std::size_t numFeatures{0};
    Seconds frameLength{0.025};
    Seconds frameShift{0.01};
    int samplingRate{16000};
    std::string storageType;            // "sqlite"
    std::string storagePath;            // relative to an optional root dir
    std::string storageKey;             // matrix key inside the storage

    Seconds end() const { return start + duration; }

    /**
     * Load the frames covering [start, start + duration) of the recording
     * timeline. Unset start/duration default to this reference's own extent.
     * @param rootDir Optional prefix prepended to storagePath
     * @throws std::runtime_error on unknown storage, I/O failure, or a window
     *         outside the stored matrix
     */
    FeatureMatrix load(const std::optional<std::string>& rootDir = std::nullopt,
                       std::optional<Seconds> start = std::nullopt,
                       std::optional<Seconds> duration = std::nullopt) const;
};

bool operator==(const Features& lhs, const Features& rhs);
bool operator!=(const Features& lhs, const Features& rhs);

/**
 * FeatureSet: index of the feature references available for a corpus
 */
class FeatureSet {
  public:
    FeatureSet() = default;
    explicit FeatureSet(std::vector<Features> features);

    void add(Features features);

    /**
     * Find the features of (recordingId, channelId) covering the requested
     * window, within contract::FEATURE_EXTENT_LEEWAY_SEC.
     * @throws std::runtime_error when nothing matches
     */
    const Features& find(const std::string& recordingId,
                         int channelId,
                         Seconds start,
                         std::optional<Seconds> duration = std::nullopt) const;

    std::size_t size() const { return features_.size(); }
    bool empty() const { return features_.empty(); }

    std::vector<Features>::const_iterator begin() const { return features_.begin(); }
    std::vector<Features>::const_iterator end() const { return features_.end(); }

  private:
    std::vector<Features> features_;
};

}  // namespace features
}  // namespace cutgraph
