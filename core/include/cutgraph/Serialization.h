#pragma once

#include "cutgraph/Cut.h"
#include "cutgraph/Supervision.h"
#include "cutgraph/features/Features.h"

#include <nlohmann/json.hpp>

#include <string>

namespace cutgraph {

// Absent optionals are omitted on write and read back as nullopt.
void to_json(nlohmann::json& j, const SupervisionSegment& segment);
void from_json(const nlohmann::json& j, SupervisionSegment& segment);

void to_json(nlohmann::json& j, const Cut& cut);
void from_json(const nlohmann::json& j, Cut& cut);

void to_json(nlohmann::json& j, const MixedCut& cut);
void from_json(const nlohmann::json& j, MixedCut& cut);

// Tagged record: the kind's fields plus "type".
nlohmann::json cut_to_json(const AnyCut& cut);
AnyCut cut_from_json(const nlohmann::json& j);

nlohmann::json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const nlohmann::json& j);

namespace features {

void to_json(nlohmann::json& j, const Features& features);
void from_json(const nlohmann::json& j, Features& features);

}  // namespace features

}  // namespace cutgraph
