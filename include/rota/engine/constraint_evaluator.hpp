/**
 * @file constraint_evaluator.hpp
 * @brief Eligibility of one staff member for one work item on one date
 *
 * Checks run in a fixed order and stop at the first failure:
 *   1. working day
 *   2. unavailability rules (unless the rule is ignored for this rota)
 *   3. training
 *   4. do-not-split exclusivity
 *
 * Evaluation has no side effects.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/engine/work_item.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rota::engine {

enum class ineligibility_reason {
    not_working_day,
    unavailable,
    missing_training,
    exclusive_commitment
};

[[nodiscard]] auto to_string(ineligibility_reason reason) -> std::string;

struct eligibility {
    bool eligible{true};
    std::optional<ineligibility_reason> reason;
    std::string detail;

    [[nodiscard]] static auto yes() -> eligibility { return {}; }

    [[nodiscard]] static auto no(ineligibility_reason why, std::string detail)
        -> eligibility {
        return eligibility{false, why, std::move(detail)};
    }

    explicit operator bool() const noexcept { return eligible; }
};

/**
 * @brief Duty a staff member already holds on the date being evaluated
 */
struct day_commitment {
    core::time_window window;
    bool do_not_split{false};
};

/**
 * @brief Per-rota overrides and the member's existing commitments that day
 */
struct evaluation_context {
    /// Indices into staff_member::unavailability to disregard
    std::set<std::size_t> ignored_rules;

    /// Replaces staff_member::working_days when set
    std::optional<std::set<unsigned>> working_days_override;

    /// Week-specific rules added to the member's own; never ignored
    std::vector<unavailability_rule> extra_unavailability;

    std::vector<day_commitment> commitments;
};

[[nodiscard]] auto is_eligible(const staff_member& staff, const work_item& item,
                               const core::date& date,
                               const evaluation_context& context = {})
    -> eligibility;

}  // namespace rota::engine
