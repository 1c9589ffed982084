#include "cutgraph/Utility.h"

#include "cutgraph/Errors.h"

namespace cutgraph {

std::string cut_type_to_string(CutType type) {
    switch (type) {
        case CutType::Cut:
            return "Cut";
        case CutType::Mixed:
            return "MixedCut";
    }
    return "Cut";
}

CutType cut_type_from_string(const std::string& value) {
    if (value == "Cut" || value == "Segment") {
        return CutType::Cut;
    }
    if (value == "MixedCut" || value == "Mix") {
        return CutType::Mixed;
    }
    throw UnknownCutTypeError("Unexpected cut type during deserialization: '" + value + "'");
}

}  // namespace cutgraph
