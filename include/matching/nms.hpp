#pragma once

#include <optional>
#include <vector>

#include "core/status.hpp"
#include "core/types.hpp"

namespace mtm {

struct NmsParams {
    double max_overlap{0.5};          // in [0, 1]
    std::optional<int> max_objects;   // nullopt = unbounded, must be >= 0
    OverlapMode mode{OverlapMode::Smaller};
};

bool validateNmsParams(const NmsParams& params, MatchError& error);

// Greedy overlap-based non-maximum suppression. Detections are visited by
// descending score, ties in pool order. A detection is dropped when its
// overlap ratio with an already kept one exceeds max_overlap. `pool` is not
// modified.
bool suppress(
    const std::vector<Detection>& pool,
    const NmsParams& params,
    std::vector<Detection>& out,
    MatchError& error);

}  // namespace mtm
