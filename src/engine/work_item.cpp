/**
 * @file work_item.cpp
 */

#include <rota/engine/work_item.hpp>

#include <algorithm>

namespace rota::engine {

auto work_item::from_requirement(const duty_requirement& req) -> work_item {
    work_item item;
    item.type = req.type;
    item.name = req.name;
    item.category = req.category;
    item.window = req.window;
    item.min_staff = req.min_staff;
    item.ideal_staff = std::max(req.ideal_staff, req.min_staff);
    item.difficulty = req.difficulty;
    item.required_training = req.required_training;
    item.do_not_split = req.do_not_split;
    item.split_shareable = req.split_shareable;
    return item;
}

auto work_item::from_clinic(const clinic_slot& clinic, const engine_config& config)
    -> work_item {
    work_item item;
    item.type = assignment_type::clinic;
    item.name = clinic.name;
    item.category = "Clinic";
    item.window = clinic.window;
    item.min_staff = 1;
    item.ideal_staff = 1;
    item.difficulty = config.clinic_difficulty;
    item.requires_warfarin = clinic.requires_warfarin;
    item.preferred_staff = clinic.preferred_staff;
    return item;
}

auto work_item::from_role(const role_request& role, const engine_config& config)
    -> work_item {
    work_item item;
    item.type = assignment_type::role;
    item.name = role.name;
    item.category = "Role";
    item.window = role.window;
    item.min_staff = role.count;
    item.ideal_staff = role.count;
    item.difficulty = config.role_difficulty;
    item.required_training = role.required_training;
    return item;
}

auto work_item::target() const -> coverage_target {
    return coverage_target{type,      name,        category,    window,
                           min_staff, ideal_staff, do_not_split};
}

}  // namespace rota::engine
