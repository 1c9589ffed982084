#include "cutgraph/Supervision.h"

#include "cutgraph/Logging.h"
#include "cutgraph/Serialization.h"

#include <stdexcept>
#include <utility>

namespace cutgraph {

bool operator==(const SupervisionSegment& lhs, const SupervisionSegment& rhs) {
    return lhs.id == rhs.id && lhs.recordingId == rhs.recordingId && lhs.start == rhs.start &&
           lhs.duration == rhs.duration && lhs.channelId == rhs.channelId && lhs.text == rhs.text &&
           lhs.language == rhs.language && lhs.speaker == rhs.speaker && lhs.gender == rhs.gender;
}

bool operator!=(const SupervisionSegment& lhs, const SupervisionSegment& rhs) {
    return !(lhs == rhs);
}

SupervisionSet::SupervisionSet(std::vector<SupervisionSegment> segments)
    : segments_(std::move(segments)) {}

void SupervisionSet::add(SupervisionSegment segment) {
    segments_.push_back(std::move(segment));
}

SupervisionSet SupervisionSet::from_json(const std::string& path) {
    const nlohmann::json j = read_json_file(path);
    if (!j.is_array()) {
        throw std::runtime_error("Supervision manifest is not an array: " + path);
    }
    SupervisionSet set(j.get<std::vector<SupervisionSegment>>());
    log_message(LogLevel::Debug, "SupervisionSet",
                "Read " + std::to_string(set.size()) + " supervisions from " + path);
    return set;
}

void SupervisionSet::to_json(const std::string& path) const {
    write_json_file(path, nlohmann::json(segments_));
    log_message(LogLevel::Debug, "SupervisionSet",
                "Wrote " + std::to_string(segments_.size()) + " supervisions to " + path);
}

}  // namespace cutgraph
