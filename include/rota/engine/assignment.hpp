/**
 * @file assignment.hpp
 * @brief Assignment rows, coverage targets and conflicts
 */

#pragma once

#include <rota/core/calendar.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rota::engine {

/**
 * @brief Kind of duty an assignment row covers
 */
enum class assignment_type {
    ward,
    dispensary,
    clinic,
    management,
    role
};

[[nodiscard]] auto to_string(assignment_type type) -> std::string;

[[nodiscard]] auto parse_assignment_type(std::string_view str)
    -> std::optional<assignment_type>;

/**
 * @brief One staff member (or an open gap) on one duty for one window
 *
 * A row with no staff_id is an unfilled position and is kept so that the
 * gap stays visible.
 */
struct assignment {
    std::optional<std::string> staff_id;
    assignment_type type{assignment_type::ward};
    std::string location;
    core::date date;
    core::time_window window;
    std::string category;

    /// Overlapping rows for the same staff member are allowed when both set
    bool split_shareable{false};

    /// The holder of this row takes no other duty on the same date
    bool do_not_split{false};

    [[nodiscard]] auto is_filled() const noexcept -> bool {
        return staff_id.has_value();
    }

    [[nodiscard]] auto held_by(std::string_view id) const -> bool {
        return staff_id && *staff_id == id;
    }

    bool operator==(const assignment&) const = default;
};

/**
 * @brief Staffing target recorded for a work item on one date
 *
 * Kept on the document so that conflicts can be re-derived after edits.
 */
struct coverage_target {
    assignment_type type{assignment_type::ward};
    std::string location;
    std::string category;
    core::time_window window;
    int min_staff{1};
    int ideal_staff{1};
    bool do_not_split{false};

    bool operator==(const coverage_target&) const = default;
};

enum class conflict_severity {
    warning,
    error
};

[[nodiscard]] auto to_string(conflict_severity severity) -> std::string;

[[nodiscard]] auto parse_conflict_severity(std::string_view str)
    -> std::optional<conflict_severity>;

enum class conflict_type {
    understaffed,
    below_ideal,
    double_booking,
    training_mismatch
};

[[nodiscard]] auto to_string(conflict_type type) -> std::string;

[[nodiscard]] auto parse_conflict_type(std::string_view str)
    -> std::optional<conflict_type>;

struct conflict {
    conflict_type type{conflict_type::understaffed};
    std::string description;
    conflict_severity severity{conflict_severity::warning};

    /// Location the conflict concerns, empty for staff-wide conflicts
    std::string location;

    std::optional<std::string> staff_id;

    bool operator==(const conflict&) const = default;
};

}  // namespace rota::engine
