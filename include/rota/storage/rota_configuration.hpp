/**
 * @file rota_configuration.hpp
 * @brief Resumable generation settings for one week
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/engine/reference_data.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rota::storage {

/**
 * @brief Operator choices made before generating a week
 *
 * Saved whenever the operator adjusts parameters so the setup can be
 * resumed. Regeneration updates it in place; it is never deleted by
 * generation.
 */
struct rota_configuration {
    /// Monday of the configured week (primary key)
    core::date week_start;

    std::vector<std::string> staff_ids;
    std::vector<std::string> clinic_ids;

    /// Weekdays to generate (c_encoding values)
    std::set<unsigned> weekdays;

    /// Per-staff working-day sets replacing the reference data
    std::map<std::string, std::set<unsigned>> working_days_override;

    /// Per-staff unavailability rule indices ignored for this week
    std::map<std::string, std::set<std::size_t>> ignored_rules;

    /// Per-staff unavailability added for this week only
    std::map<std::string, std::vector<engine::unavailability_rule>> extra_unavailability;

    std::chrono::system_clock::time_point last_modified;
    std::string last_modified_by;

    std::optional<std::chrono::system_clock::time_point> generated_at;

    /// Once set it stays set, even when parameters change afterwards
    bool is_generated{false};
};

}  // namespace rota::storage
