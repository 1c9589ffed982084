#include "cutgraph/Serialization.h"

#include "cutgraph/CoreContract.h"
#include "cutgraph/Utility.h"

#include <fstream>

namespace cutgraph {

using nlohmann::json;

namespace {

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

std::optional<std::string> get_optional(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

void to_json(json& j, const SupervisionSegment& segment) {
    j = json{
        {"id", segment.id},
        {"recording_id", segment.recordingId},
        {"start", segment.start},
        {"duration", segment.duration},
        {"channel_id", segment.channelId},
    };
    put_optional(j, "text", segment.text);
    put_optional(j, "language", segment.language);
    put_optional(j, "speaker", segment.speaker);
    put_optional(j, "gender", segment.gender);
}

void from_json(const json& j, SupervisionSegment& segment) {
    j.at("id").get_to(segment.id);
    j.at("recording_id").get_to(segment.recordingId);
    j.at("start").get_to(segment.start);
    j.at("duration").get_to(segment.duration);
    segment.channelId = j.value("channel_id", 0);
    segment.text = get_optional(j, "text");
    segment.language = get_optional(j, "language");
    segment.speaker = get_optional(j, "speaker");
    segment.gender = get_optional(j, "gender");
}

void to_json(json& j, const Cut& cut) {
    j = json{
        {"id", cut.id},
        {"channel", cut.channel},
        {"start", cut.start},
        {"duration", cut.duration},
        {"features", cut.features},
    };
    if (!cut.supervisions.empty()) {
        j["supervisions"] = cut.supervisions;
    }
}

void from_json(const json& j, Cut& cut) {
    j.at("id").get_to(cut.id);
    j.at("channel").get_to(cut.channel);
    j.at("start").get_to(cut.start);
    j.at("duration").get_to(cut.duration);
    j.at("features").get_to(cut.features);
    cut.supervisions.clear();
    const auto it = j.find("supervisions");
    if (it != j.end() && !it->is_null()) {
        it->get_to(cut.supervisions);
    }
}

void to_json(json& j, const MixedCut& cut) {
    j = json{
        {"id", cut.id},
        {"left_cut_id", cut.leftCutId},
        {"right_cut_id", cut.rightCutId},
        {"offset_right_by", cut.offsetRightBy},
        {"snr", cut.snr},
    };
}

void from_json(const json& j, MixedCut& cut) {
    j.at("id").get_to(cut.id);
    j.at("left_cut_id").get_to(cut.leftCutId);
    j.at("right_cut_id").get_to(cut.rightCutId);
    cut.offsetRightBy = j.value("offset_right_by", 0.0);
    cut.snr = j.value("snr", 0.0);
}

json cut_to_json(const AnyCut& cut) {
    json j = std::visit([](const auto& c) { return json(c); }, cut);
    j[contract::CUT_TYPE_KEY] = cut_type_to_string(cut_type(cut));
    return j;
}

AnyCut cut_from_json(const json& j) {
    const CutType type = cut_type_from_string(j.at(contract::CUT_TYPE_KEY).get<std::string>());
    if (type == CutType::Mixed) {
        return j.get<MixedCut>();
    }
    return j.get<Cut>();
}

json read_json_file(const std::string& path) {
    std::ifstream in;
    in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    in.open(path);
    json j;
    in >> j;
    return j;
}

void write_json_file(const std::string& path, const json& j) {
    std::ofstream out;
    out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    out.open(path, std::ios::trunc);
    out << j.dump(2);
}

namespace features {

void to_json(json& j, const Features& features) {
    j = json{
        {"type", features.type},
        {"recording_id", features.recordingId},
        {"channel_id", features.channelId},
        {"start", features.start},
        {"duration", features.duration},
        {"num_frames", features.numFrames},
        {"num_features", features.numFeatures},
        {"frame_length", features.frameLength},
        {"frame_shift", features.frameShift},
        {"sampling_rate", features.samplingRate},
        {"storage_type", features.storageType},
        {"storage_path", features.storagePath},
        {"storage_key", features.storageKey},
    };
}

void from_json(const json& j, Features& features) {
    features.type = j.value("type", std::string());
    j.at("recording_id").get_to(features.recordingId);
    features.channelId = j.value("channel_id", 0);
    j.at("start").get_to(features.start);
    j.at("duration").get_to(features.duration);
    features.numFrames = j.value("num_frames", std::size_t{0});
    features.numFeatures = j.value("num_features", std::size_t{0});
    j.at("frame_length").get_to(features.frameLength);
    j.at("frame_shift").get_to(features.frameShift);
    features.samplingRate = j.value("sampling_rate", 16000);
    j.at("storage_type").get_to(features.storageType);
    j.at("storage_path").get_to(features.storagePath);
    features.storageKey = j.value("storage_key", std::string());
}

}  // namespace features

}  // namespace cutgraph
