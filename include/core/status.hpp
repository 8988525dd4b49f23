#pragma once

#include <string>

namespace mtm {

enum class MatchStatus {
    Ok,
    EmptyImage,
    ShapeMismatch,
    InvalidThreshold,
    InvalidMaxObjects,
    InvalidOverlap,
    InvalidDownscaling,
    InvalidSearchBox,
    LabelCountMismatch,
};

struct MatchError {
    MatchStatus status{MatchStatus::Ok};
    std::string message;

    bool ok() const { return status == MatchStatus::Ok; }
};

const char* toString(MatchStatus status);

// Fills `error` and returns false so call sites can `return fail(...)`.
bool fail(MatchError& error, MatchStatus status, const std::string& message);
void clearError(MatchError& error);

}  // namespace mtm
