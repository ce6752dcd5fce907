/**
 * @file engine_config.hpp
 * @brief Tunables shared by the generator, detector and reassignment code
 */

#pragma once

#include <rota/core/calendar.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace rota::engine {

struct engine_config {
    /**
     * @brief Category tiers, most urgent first
     *
     * Matched case-insensitively against a work item's category. Categories
     * in no tier sort after every listed tier.
     */
    std::vector<std::vector<std::string>> category_tiers{
        {"ward", "eau"},
        {"dispensary"},
        {"clinic", "pharmacy"},
        {"management"}};

    /// Locations where a day is never split between two people
    std::vector<std::string> continuity_locations{"EAU",
                                                  "Emergency Assessment Unit"};

    /// Working day used for full-day duties
    core::time_window working_day{core::time_of_day::from_hm(9, 0),
                                  core::time_of_day::from_hm(17, 0)};

    /// Boundary between the morning and afternoon halves
    core::time_of_day half_day_boundary{core::time_of_day::from_hm(13, 0)};

    /// Clinics are staffed ahead of ordinary duties
    int clinic_difficulty{10};

    int role_difficulty{5};

    /// Rank of @p category in category_tiers (0 is most urgent)
    [[nodiscard]] auto category_rank(std::string_view category) const -> int;

    /// True when @p location contains any continuity location
    [[nodiscard]] auto is_continuity_sensitive(std::string_view location) const
        -> bool;

    /// True when @p window spans both halves of the working day
    [[nodiscard]] auto is_full_day(const core::time_window& window) const
        -> bool {
        return window.start < half_day_boundary && window.end > half_day_boundary;
    }
};

}  // namespace rota::engine
