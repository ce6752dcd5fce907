/**
 * @file assignment_generator.hpp
 * @brief Greedy weekly rota generation
 *
 * For each selected date the generator builds a work list (requirements,
 * clinics, ad hoc roles), orders it by difficulty and category, and fills
 * each item from a deterministic candidate order. It never invents cover:
 * positions it cannot fill become placeholder rows for the conflict
 * detector to report.
 */

#pragma once

#include <rota/core/result.hpp>
#include <rota/engine/constraint_evaluator.hpp>
#include <rota/engine/engine_config.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/engine/rota_document.hpp>
#include <rota/engine/work_item.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rota::engine {

/**
 * @brief Input for one week's generation
 */
struct generation_request {
    /// Must be a Monday
    core::date week_start;

    /// Roster for the week; every id must exist in the snapshot
    std::vector<std::string> staff_ids;

    /// Weekdays to staff (c_encoding values)
    std::set<unsigned> selected_weekdays;

    /// Clinic ids; each clinic runs on its own weekday
    std::vector<std::string> selected_clinic_ids;

    /// Extra roles keyed by weekday (c_encoding)
    std::map<unsigned, std::vector<role_request>> extra_roles_by_weekday;

    /// Per-staff replacement for the working-day set
    std::map<std::string, std::set<unsigned>> working_days_override;

    /// Per-staff unavailability rule indices to disregard this week
    std::map<std::string, std::set<std::size_t>> ignored_rules;

    /// Per-staff unavailability for this week only, on top of their own rules
    std::map<std::string, std::vector<unavailability_rule>> extra_unavailability;

    std::string generated_by;
    std::chrono::system_clock::time_point generated_at;
};

class assignment_generator {
public:
    explicit assignment_generator(engine_config config = {});

    /**
     * @brief Generate the seven documents of a week
     *
     * Dates outside the selected weekdays get empty documents. Fails only
     * on malformed input; nothing is written anywhere.
     *
     * @return Seven draft documents, Monday first
     */
    [[nodiscard]] auto generate(const generation_request& request,
                                const reference_snapshot& snapshot) const
        -> Result<std::vector<rota_document>>;

    /**
     * @brief Ordered work list for one date
     */
    [[nodiscard]] auto build_work_list(const core::date& date,
                                       const generation_request& request,
                                       const reference_snapshot& snapshot) const
        -> std::vector<work_item>;

    [[nodiscard]] auto config() const noexcept -> const engine_config& {
        return config_;
    }

private:
    [[nodiscard]] auto validate(const generation_request& request,
                                const reference_snapshot& snapshot) const
        -> VoidResult;

    [[nodiscard]] auto staff_day(const core::date& date,
                                 const generation_request& request,
                                 const std::vector<const staff_member*>& roster,
                                 const reference_snapshot& snapshot) const
        -> std::pair<std::vector<assignment>, std::vector<coverage_target>>;

    engine_config config_;
};

}  // namespace rota::engine
