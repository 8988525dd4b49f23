#include "matching/nms.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <string>

namespace mtm {

bool validateNmsParams(const NmsParams& params, MatchError& error) {
    if (!std::isfinite(params.max_overlap) || params.max_overlap < 0.0 || params.max_overlap > 1.0) {
        return fail(error, MatchStatus::InvalidOverlap, "max_overlap must be in [0,1]");
    }
    if (params.max_objects && *params.max_objects < 0) {
        return fail(error, MatchStatus::InvalidMaxObjects,
                    "max_objects must be >= 0, got " + std::to_string(*params.max_objects));
    }
    return true;
}

bool suppress(
    const std::vector<Detection>& pool,
    const NmsParams& params,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    if (!validateNmsParams(params, error)) {
        return false;
    }

    const std::size_t limit = params.max_objects
        ? static_cast<std::size_t>(*params.max_objects)
        : pool.size();

    std::vector<std::size_t> order(pool.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&pool](std::size_t a, std::size_t b) {
        return pool[a].score() > pool[b].score();
    });

    std::vector<bool> eligible(order.size(), true);
    for (std::size_t i = 0; i < order.size() && out.size() < limit; ++i) {
        if (!eligible[i]) {
            continue;
        }
        const Detection& kept = pool[order[i]];
        out.push_back(kept);

        for (std::size_t j = i + 1; j < order.size(); ++j) {
            if (!eligible[j]) {
                continue;
            }
            if (kept.overlapRatio(pool[order[j]], params.mode) > params.max_overlap) {
                eligible[j] = false;
            }
        }
    }
    return true;
}

}  // namespace mtm
