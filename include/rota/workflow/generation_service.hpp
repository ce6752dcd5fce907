/**
 * @file generation_service.hpp
 * @brief Request-level rota generation against the document store
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/engine/assignment_generator.hpp>
#include <rota/engine/conflict_detector.hpp>
#include <rota/engine/engine_config.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/storage/rota_database.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rota::workflow {

struct generate_week_request {
    core::date week_start;
    std::vector<std::string> staff_ids;

    /// c_encoding values
    std::set<unsigned> selected_weekdays;

    std::map<std::string, std::set<unsigned>> working_days_override;
    std::map<std::string, std::set<std::size_t>> ignored_rules;
    std::map<std::string, std::vector<engine::unavailability_rule>> extra_unavailability;
    std::map<unsigned, std::vector<engine::role_request>> extra_roles_by_weekday;
    std::vector<std::string> selected_clinic_ids;

    /// Drop selected weekdays that fall on an English bank holiday
    bool exclude_bank_holidays{false};

    std::string requested_by;
};

struct generate_week_response {
    std::map<core::date, std::int64_t> rota_ids_by_date;

    /// Every assignment of the week, Monday first, in document order
    std::vector<engine::assignment> assignments;

    std::vector<engine::conflict> conflicts;
};

/**
 * @brief Generates, annotates and stores a week's draft rota
 *
 * Regeneration replaces the week's drafts. A crash between clearing and
 * writing leaves the week without drafts; running generation again
 * recovers.
 */
class generation_service {
public:
    generation_service(storage::rota_database& db,
                       engine::reference_data_source& reference_data,
                       engine::engine_config config = {});

    /**
     * @brief Store the operator's settings for a week without generating
     */
    [[nodiscard]] auto save_configuration(storage::rota_configuration config,
                                          std::chrono::system_clock::time_point now =
                                              std::chrono::system_clock::now())
        -> VoidResult;

    [[nodiscard]] auto generate_week(const generate_week_request& request,
                                     std::chrono::system_clock::time_point now =
                                         std::chrono::system_clock::now())
        -> Result<generate_week_response>;

    /// Current assignments of one stored document
    [[nodiscard]] auto get_assignments(std::int64_t rota_id) const
        -> Result<std::vector<engine::assignment>>;

private:
    [[nodiscard]] auto effective_weekdays(const generate_week_request& request) const
        -> std::set<unsigned>;

    storage::rota_database& db_;
    engine::reference_data_source& reference_data_;
    engine::assignment_generator generator_;
};

}  // namespace rota::workflow
