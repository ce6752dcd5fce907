/**
 * @file granularity.cpp
 */

#include <rota/engine/granularity.hpp>

namespace rota::engine {

auto normalize_granularity(const assignment& row,
                           const core::time_window& requested,
                           const engine_config& config)
    -> std::vector<assignment> {
    if (row.window == requested || !row.window.contains(requested) ||
        !requested.is_valid()) {
        return {row};
    }

    auto piece = [&](core::time_of_day start, core::time_of_day end) {
        assignment copy = row;
        copy.window = core::time_window{start, end};
        return copy;
    };

    const auto boundary = config.half_day_boundary;
    if (config.is_full_day(row.window) &&
        (requested.end <= boundary || requested.start >= boundary)) {
        std::vector<assignment> halves{piece(row.window.start, boundary),
                                       piece(boundary, row.window.end)};
        // The requested window may still be finer than a half
        auto& half = requested.end <= boundary ? halves.front() : halves.back();
        if (half.window == requested) return halves;

        std::vector<assignment> result;
        for (const auto& h : halves) {
            if (h.window.contains(requested)) {
                auto sub = normalize_granularity(h, requested, config);
                result.insert(result.end(), sub.begin(), sub.end());
            } else {
                result.push_back(h);
            }
        }
        return result;
    }

    std::vector<assignment> result;
    if (row.window.start < requested.start) {
        result.push_back(piece(row.window.start, requested.start));
    }
    result.push_back(piece(requested.start, requested.end));
    if (requested.end < row.window.end) {
        result.push_back(piece(requested.end, row.window.end));
    }
    return result;
}

}  // namespace rota::engine
