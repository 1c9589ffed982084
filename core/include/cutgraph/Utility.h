#pragma once

#include "cutgraph/Cut.h"

#include <string>

namespace cutgraph {

// Manifest tags: "Cut" / "MixedCut".
std::string cut_type_to_string(CutType type);
CutType cut_type_from_string(const std::string& value);

}  // namespace cutgraph
