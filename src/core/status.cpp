#include "core/status.hpp"

namespace mtm {

const char* toString(MatchStatus status) {
    switch (status) {
        case MatchStatus::Ok: return "ok";
        case MatchStatus::EmptyImage: return "empty_image";
        case MatchStatus::ShapeMismatch: return "shape_mismatch";
        case MatchStatus::InvalidThreshold: return "invalid_threshold";
        case MatchStatus::InvalidMaxObjects: return "invalid_max_objects";
        case MatchStatus::InvalidOverlap: return "invalid_overlap";
        case MatchStatus::InvalidDownscaling: return "invalid_downscaling";
        case MatchStatus::InvalidSearchBox: return "invalid_search_box";
        case MatchStatus::LabelCountMismatch: return "label_count_mismatch";
    }
    return "unknown";
}

bool fail(MatchError& error, MatchStatus status, const std::string& message) {
    error.status = status;
    error.message = message;
    return false;
}

void clearError(MatchError& error) {
    error.status = MatchStatus::Ok;
    error.message.clear();
}

}  // namespace mtm
