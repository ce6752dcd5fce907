/**
 * @file work_item.hpp
 * @brief Uniform view of requirements, clinics and role requests
 *
 * The generator and constraint evaluator treat every kind of duty the same
 * way once it has been flattened into a work_item for a specific date.
 */

#pragma once

#include <rota/engine/assignment.hpp>
#include <rota/engine/engine_config.hpp>
#include <rota/engine/reference_data.hpp>

#include <optional>
#include <string>
#include <vector>

namespace rota::engine {

struct work_item {
    assignment_type type{assignment_type::ward};

    /// Location or clinic name; becomes assignment::location
    std::string name;
    std::string category;
    core::time_window window;

    int min_staff{1};
    int ideal_staff{1};
    int difficulty{5};

    std::optional<std::string> required_training;
    bool requires_warfarin{false};
    bool do_not_split{false};
    bool split_shareable{false};

    /// Tried before everyone else, in order
    std::vector<std::string> preferred_staff;

    [[nodiscard]] static auto from_requirement(const duty_requirement& req)
        -> work_item;

    [[nodiscard]] static auto from_clinic(const clinic_slot& clinic,
                                          const engine_config& config)
        -> work_item;

    [[nodiscard]] static auto from_role(const role_request& role,
                                        const engine_config& config)
        -> work_item;

    [[nodiscard]] auto target() const -> coverage_target;
};

}  // namespace rota::engine
