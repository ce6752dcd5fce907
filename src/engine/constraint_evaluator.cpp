/**
 * @file constraint_evaluator.cpp
 * @brief Eligibility checks for staff placement
 */

#include <rota/engine/constraint_evaluator.hpp>

#include <rota/compat/format.hpp>

#include <algorithm>

namespace rota::engine {

auto to_string(ineligibility_reason reason) -> std::string {
    switch (reason) {
        case ineligibility_reason::not_working_day:
            return "not_working_day";
        case ineligibility_reason::unavailable:
            return "unavailable";
        case ineligibility_reason::missing_training:
            return "missing_training";
        case ineligibility_reason::exclusive_commitment:
            return "exclusive_commitment";
    }
    return "unknown";
}

auto is_eligible(const staff_member& staff, const work_item& item,
                 const core::date& date, const evaluation_context& context)
    -> eligibility {
    const auto wd = core::weekday_of(date);

    // 1. Working day. No data at all means the member is assumed available.
    const auto& working_days = context.working_days_override
                                   ? context.working_days_override
                                   : staff.working_days;
    if (working_days && working_days->count(wd.c_encoding()) == 0) {
        return eligibility::no(
            ineligibility_reason::not_working_day,
            compat::format("{} does not work on {}", staff.display_name,
                           core::weekday_name(wd)));
    }

    // 2. Unavailability
    for (std::size_t i = 0; i < staff.unavailability.size(); ++i) {
        const auto& rule = staff.unavailability[i];
        if (rule.weekday != wd || context.ignored_rules.count(i) > 0) {
            continue;
        }
        if (rule.window.overlaps(item.window)) {
            return eligibility::no(
                ineligibility_reason::unavailable,
                compat::format("{} is unavailable {} {}", staff.display_name,
                               core::weekday_name(wd), rule.window.to_string()));
        }
    }
    for (const auto& rule : context.extra_unavailability) {
        if (rule.weekday == wd && rule.window.overlaps(item.window)) {
            return eligibility::no(
                ineligibility_reason::unavailable,
                compat::format("{} is unavailable this week {} {}",
                               staff.display_name, core::weekday_name(wd),
                               rule.window.to_string()));
        }
    }

    // 3. Training
    if (item.required_training) {
        const auto& tag = *item.required_training;
        bool holds = staff.training_tags.count(tag) > 0 ||
                     (tag == "warfarin" && staff.warfarin_trained);
        if (!holds) {
            return eligibility::no(
                ineligibility_reason::missing_training,
                compat::format("{} lacks {} training for {}", staff.display_name,
                               tag, item.name));
        }
    }
    if (item.requires_warfarin && !staff.warfarin_trained) {
        return eligibility::no(
            ineligibility_reason::missing_training,
            compat::format("{} is not warfarin trained for {}",
                           staff.display_name, item.name));
    }

    // 4. Exclusivity
    bool held_exclusive =
        std::any_of(context.commitments.begin(), context.commitments.end(),
                    [](const day_commitment& c) { return c.do_not_split; });
    if (held_exclusive) {
        return eligibility::no(
            ineligibility_reason::exclusive_commitment,
            compat::format("{} is committed to a do-not-split duty",
                           staff.display_name));
    }
    if (item.do_not_split && !context.commitments.empty()) {
        return eligibility::no(
            ineligibility_reason::exclusive_commitment,
            compat::format("{} already has duties and {} cannot be split",
                           staff.display_name, item.name));
    }

    return eligibility::yes();
}

}  // namespace rota::engine
