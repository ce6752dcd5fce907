/**
 * @file reference_data.hpp
 * @brief Staff, requirement and clinic records consumed by the engine
 *
 * These records belong to the reference data store. The engine receives
 * them as an immutable reference_snapshot taken once per request and never
 * writes them back.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/engine/assignment.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rota::engine {

/**
 * @brief Recurring weekly period during which a staff member cannot work
 */
struct unavailability_rule {
    std::chrono::weekday weekday{std::chrono::Monday};
    core::time_window window;

    bool operator==(const unavailability_rule&) const = default;
};

/**
 * @brief A pharmacist or technician who can be rostered
 */
struct staff_member {
    /// Stable identifier, also the final ordering tie-break
    std::string id;

    std::string display_name;

    /// Role band, e.g. "Band 5"
    std::string role_band;

    /// Locations and directorates the member has been signed off for
    std::set<std::string> trained_locations;

    /// Specialist training tags ("aseptic", "cytotoxic", ...)
    std::set<std::string> training_tags;

    bool warfarin_trained{false};

    /// Days normally worked; nullopt means no data, treated as available
    std::optional<std::set<unsigned>> working_days;

    std::vector<unavailability_rule> unavailability;

    /// Part of the default roster; preferred over ad hoc staff
    bool default_roster{false};

    [[nodiscard]] auto works_on(std::chrono::weekday wd) const -> bool {
        return !working_days || working_days->count(wd.c_encoding()) > 0;
    }

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !id.empty();
    }
};

/**
 * @brief A named duty with staffing targets
 */
struct duty_requirement {
    std::string name;

    /// Directorate or category ("Ward", "EAU", "Dispensary", ...)
    std::string category;

    assignment_type type{assignment_type::ward};

    int min_staff{1};
    int ideal_staff{1};

    /// 1 (easy) to 10 (hard); harder duties are filled first
    int difficulty{5};

    std::optional<std::string> required_training;

    /// Staff placed here are not placed anywhere else that day
    bool do_not_split{false};

    /// Restricts the duty to these weekdays (c_encoding values)
    std::optional<std::set<unsigned>> allowed_weekdays;

    bool active{true};

    /// Several staff may hold overlapping rows for this duty
    bool split_shareable{false};

    core::time_window window{core::time_of_day::from_hm(9, 0),
                             core::time_of_day::from_hm(17, 0)};

    [[nodiscard]] auto runs_on(std::chrono::weekday wd) const -> bool {
        return !allowed_weekdays || allowed_weekdays->count(wd.c_encoding()) > 0;
    }
};

/**
 * @brief A recurring clinic session on a fixed weekday
 */
struct clinic_slot {
    std::string id;
    std::string name;
    std::chrono::weekday weekday{std::chrono::Monday};
    core::time_window window;
    bool requires_warfarin{false};
    bool active{true};

    /// Soft preference, highest priority first
    std::vector<std::string> preferred_staff;
};

/**
 * @brief Ad hoc role requested for one date (e.g. an extra checker)
 */
struct role_request {
    std::string name;
    core::time_window window{core::time_of_day::from_hm(9, 0),
                             core::time_of_day::from_hm(17, 0)};
    int count{1};
    std::optional<std::string> required_training;
};

/**
 * @brief Immutable copy of reference data for one request
 */
struct reference_snapshot {
    std::vector<staff_member> staff;
    std::vector<duty_requirement> requirements;
    std::vector<clinic_slot> clinics;

    [[nodiscard]] auto find_staff(std::string_view id) const
        -> const staff_member*;

    [[nodiscard]] auto find_clinic(std::string_view id) const
        -> const clinic_slot*;
};

/**
 * @brief Source of reference data
 *
 * The reference data store is owned elsewhere; implementations load a
 * fresh snapshot for every request.
 */
class reference_data_source {
public:
    virtual ~reference_data_source() = default;

    [[nodiscard]] virtual auto load_snapshot() -> Result<reference_snapshot> = 0;
};

/**
 * @brief reference_data_source backed by a snapshot held in memory
 */
class in_memory_reference_data final : public reference_data_source {
public:
    explicit in_memory_reference_data(reference_snapshot snapshot)
        : snapshot_(std::move(snapshot)) {}

    [[nodiscard]] auto load_snapshot() -> Result<reference_snapshot> override {
        return snapshot_;
    }

    void replace(reference_snapshot snapshot) { snapshot_ = std::move(snapshot); }

private:
    reference_snapshot snapshot_;
};

}  // namespace rota::engine
