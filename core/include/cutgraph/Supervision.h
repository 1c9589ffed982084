#pragma once

#include "cutgraph/CutTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace cutgraph {

// A labeled time interval on one channel of a recording, used as a training
// target. Times are on the recording timeline, independent of any cut.
struct SupervisionSegment {
    std::string id;
    std::string recordingId;
    Seconds start{0.0};
    Seconds duration{0.0};
    int channelId{0};
    std::optional<std::string> text;
    std::optional<std::string> language;
    std::optional<std::string> speaker;
    std::optional<std::string> gender;

    Seconds end() const { return start + duration; }
    TimeSpan span() const { return TimeSpan{start, start + duration}; }
};

bool operator==(const SupervisionSegment& lhs, const SupervisionSegment& rhs);
bool operator!=(const SupervisionSegment& lhs, const SupervisionSegment& rhs);

class SupervisionSet {
  public:
    SupervisionSet() = default;
    explicit SupervisionSet(std::vector<SupervisionSegment> segments);

    static SupervisionSet from_json(const std::string& path);
    void to_json(const std::string& path) const;

    void add(SupervisionSegment segment);

    std::size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }

    std::vector<SupervisionSegment>::const_iterator begin() const { return segments_.begin(); }
    std::vector<SupervisionSegment>::const_iterator end() const { return segments_.end(); }

  private:
    std::vector<SupervisionSegment> segments_;
};

}  // namespace cutgraph
