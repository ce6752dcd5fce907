/**
 * @file assignment_generator.cpp
 * @brief Implementation of the greedy weekly generator
 */

#include <rota/engine/assignment_generator.hpp>

#include <algorithm>
#include <unordered_map>

namespace rota::engine {

namespace {

/// A duty the generator has placed a staff member on for the current day
struct placement {
    core::time_window window;
    bool do_not_split{false};
    bool split_shareable{false};
};

/// Mutable bookkeeping for one date
struct day_state {
    std::unordered_map<std::string, std::vector<placement>> placements;

    [[nodiscard]] auto count(const std::string& id) const -> std::size_t {
        auto it = placements.find(id);
        return it == placements.end() ? 0 : it->second.size();
    }

    [[nodiscard]] auto has_capacity(const std::string& id,
                                    const work_item& item) const -> bool {
        auto it = placements.find(id);
        if (it == placements.end()) return true;
        return std::none_of(it->second.begin(), it->second.end(),
                            [&](const placement& p) {
                                return p.window.overlaps(item.window) &&
                                       !(p.split_shareable && item.split_shareable);
                            });
    }

    [[nodiscard]] auto commitments(const std::string& id) const
        -> std::vector<day_commitment> {
        std::vector<day_commitment> result;
        auto it = placements.find(id);
        if (it == placements.end()) return result;
        for (const auto& p : it->second) {
            result.push_back(day_commitment{p.window, p.do_not_split});
        }
        return result;
    }
};

}  // namespace

assignment_generator::assignment_generator(engine_config config)
    : config_(std::move(config)) {}

auto assignment_generator::validate(const generation_request& request,
                                    const reference_snapshot& snapshot) const
    -> VoidResult {
    if (request.staff_ids.empty()) {
        return rota_void_error(error_codes::no_staff_selected,
                               "No staff selected for generation");
    }
    if (request.selected_weekdays.empty()) {
        return rota_void_error(error_codes::no_weekday_selected,
                               "No weekday selected for generation");
    }
    if (!request.week_start.ok() || !core::is_week_start(request.week_start)) {
        return rota_void_error(
            error_codes::invalid_week_start,
            "Week start must be a Monday",
            request.week_start.ok() ? core::format_date(request.week_start) : "");
    }
    for (const auto& id : request.staff_ids) {
        if (snapshot.find_staff(id) == nullptr) {
            return rota_void_error(error_codes::staff_not_found,
                                   "Selected staff member not found", id);
        }
    }
    for (const auto& id : request.selected_clinic_ids) {
        if (snapshot.find_clinic(id) == nullptr) {
            return rota_void_error(error_codes::not_found,
                                   "Selected clinic not found", id);
        }
    }
    return ok();
}

auto assignment_generator::build_work_list(const core::date& date,
                                           const generation_request& request,
                                           const reference_snapshot& snapshot) const
    -> std::vector<work_item> {
    const auto wd = core::weekday_of(date);
    std::vector<work_item> items;

    for (const auto& req : snapshot.requirements) {
        if (req.active && req.runs_on(wd)) {
            items.push_back(work_item::from_requirement(req));
        }
    }
    for (const auto& id : request.selected_clinic_ids) {
        const auto* clinic = snapshot.find_clinic(id);
        if (clinic != nullptr && clinic->active && clinic->weekday == wd) {
            items.push_back(work_item::from_clinic(*clinic, config_));
        }
    }
    auto roles = request.extra_roles_by_weekday.find(wd.c_encoding());
    if (roles != request.extra_roles_by_weekday.end()) {
        for (const auto& role : roles->second) {
            if (role.count > 0) {
                items.push_back(work_item::from_role(role, config_));
            }
        }
    }

    std::stable_sort(items.begin(), items.end(),
                     [this](const work_item& lhs, const work_item& rhs) {
                         if (lhs.difficulty != rhs.difficulty) {
                             return lhs.difficulty > rhs.difficulty;
                         }
                         return config_.category_rank(lhs.category) <
                                config_.category_rank(rhs.category);
                     });
    return items;
}

auto assignment_generator::staff_day(const core::date& date,
                                     const generation_request& request,
                                     const std::vector<const staff_member*>& roster,
                                     const reference_snapshot& snapshot) const
    -> std::pair<std::vector<assignment>, std::vector<coverage_target>> {
    auto items = build_work_list(date, request, snapshot);
    day_state state;
    std::vector<std::vector<std::string>> filled(items.size());

    auto context_for = [&](const staff_member& staff) {
        evaluation_context ctx;
        if (auto it = request.ignored_rules.find(staff.id);
            it != request.ignored_rules.end()) {
            ctx.ignored_rules = it->second;
        }
        if (auto it = request.extra_unavailability.find(staff.id);
            it != request.extra_unavailability.end()) {
            ctx.extra_unavailability = it->second;
        }
        if (auto it = request.working_days_override.find(staff.id);
            it != request.working_days_override.end()) {
            ctx.working_days_override = it->second;
        }
        ctx.commitments = state.commitments(staff.id);
        return ctx;
    };

    auto candidates_for = [&](const work_item& item) {
        std::vector<const staff_member*> ordered;
        for (const auto& preferred : item.preferred_staff) {
            auto it = std::find_if(roster.begin(), roster.end(),
                                   [&](const staff_member* s) {
                                       return s->id == preferred;
                                   });
            if (it != roster.end() &&
                std::find(ordered.begin(), ordered.end(), *it) == ordered.end()) {
                ordered.push_back(*it);
            }
        }
        std::vector<const staff_member*> rest;
        for (const auto* staff : roster) {
            if (std::find(ordered.begin(), ordered.end(), staff) == ordered.end()) {
                rest.push_back(staff);
            }
        }
        std::sort(rest.begin(), rest.end(),
                  [&](const staff_member* lhs, const staff_member* rhs) {
                      if (lhs->default_roster != rhs->default_roster) {
                          return lhs->default_roster;
                      }
                      auto lc = state.count(lhs->id);
                      auto rc = state.count(rhs->id);
                      if (lc != rc) return lc < rc;
                      if (lhs->display_name != rhs->display_name) {
                          return lhs->display_name < rhs->display_name;
                      }
                      return lhs->id < rhs->id;
                  });
        ordered.insert(ordered.end(), rest.begin(), rest.end());
        return ordered;
    };

    auto fill_to = [&](std::size_t index, int wanted) {
        const auto& item = items[index];
        auto& taken = filled[index];
        if (static_cast<int>(taken.size()) >= wanted) return;
        for (const auto* staff : candidates_for(item)) {
            if (static_cast<int>(taken.size()) >= wanted) break;
            if (std::find(taken.begin(), taken.end(), staff->id) != taken.end()) {
                continue;
            }
            if (!state.has_capacity(staff->id, item)) continue;
            if (!is_eligible(*staff, item, date, context_for(*staff))) continue;

            taken.push_back(staff->id);
            state.placements[staff->id].push_back(
                placement{item.window, item.do_not_split, item.split_shareable});
        }
    };

    // Minimum cover everywhere first, then top up towards ideal
    for (std::size_t i = 0; i < items.size(); ++i) {
        fill_to(i, items[i].min_staff);
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        fill_to(i, items[i].ideal_staff);
    }

    std::vector<assignment> rows;
    std::vector<coverage_target> targets;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        targets.push_back(item.target());

        auto make_row = [&](std::optional<std::string> staff_id) {
            return assignment{std::move(staff_id), item.type,  item.name, date,
                              item.window,         item.category,
                              item.split_shareable, item.do_not_split};
        };
        for (const auto& id : filled[i]) {
            rows.push_back(make_row(id));
        }
        for (int gap = static_cast<int>(filled[i].size()); gap < item.min_staff;
             ++gap) {
            rows.push_back(make_row(std::nullopt));
        }
    }
    return {std::move(rows), std::move(targets)};
}

auto assignment_generator::generate(const generation_request& request,
                                    const reference_snapshot& snapshot) const
    -> Result<std::vector<rota_document>> {
    auto valid = validate(request, snapshot);
    if (valid.is_err()) {
        return Result<std::vector<rota_document>>(valid.error());
    }

    std::vector<const staff_member*> roster;
    for (const auto& id : request.staff_ids) {
        const auto* staff = snapshot.find_staff(id);
        if (std::find(roster.begin(), roster.end(), staff) == roster.end()) {
            roster.push_back(staff);
        }
    }

    std::vector<rota_document> week;
    for (const auto& date : core::week_dates(request.week_start)) {
        rota_document doc;
        doc.date = date;
        doc.week_start = request.week_start;
        doc.status = rota_status::draft;
        doc.generated_by = request.generated_by;
        doc.generated_at = request.generated_at;
        doc.included_weekdays = request.selected_weekdays;

        if (request.selected_weekdays.count(core::weekday_of(date).c_encoding()) > 0) {
            auto [rows, targets] = staff_day(date, request, roster, snapshot);
            doc.assignments = std::move(rows);
            doc.targets = std::move(targets);
        }
        week.push_back(std::move(doc));
    }
    return week;
}

}  // namespace rota::engine
