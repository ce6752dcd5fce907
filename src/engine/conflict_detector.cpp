/**
 * @file conflict_detector.cpp
 * @brief Implementation of the rota conflict rules
 */

#include <rota/engine/conflict_detector.hpp>

#include <rota/compat/format.hpp>

#include <algorithm>
#include <limits>

namespace rota::engine {

namespace {

auto staff_label(const std::vector<staff_member>& staff, const std::string& id)
    -> std::string {
    auto it = std::find_if(staff.begin(), staff.end(),
                           [&](const staff_member& s) { return s.id == id; });
    if (it == staff.end() || it->display_name.empty()) return id;
    return it->display_name;
}

}  // namespace

conflict_detector::conflict_detector(std::vector<staff_member> staff,
                                     engine_config config)
    : staff_(std::move(staff)), config_(std::move(config)) {}

auto conflict_detector::coverage(const coverage_target& target,
                                 const std::vector<assignment>& rows) -> int {
    std::vector<int> cuts{target.window.start.minutes, target.window.end.minutes};
    for (const auto& row : rows) {
        if (row.location != target.location || row.type != target.type) continue;
        for (int edge : {row.window.start.minutes, row.window.end.minutes}) {
            if (edge > target.window.start.minutes &&
                edge < target.window.end.minutes) {
                cuts.push_back(edge);
            }
        }
    }
    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

    int lowest = std::numeric_limits<int>::max();
    for (std::size_t i = 0; i + 1 < cuts.size(); ++i) {
        core::time_window segment{core::time_of_day{cuts[i]},
                                  core::time_of_day{cuts[i + 1]}};
        auto covering = std::count_if(rows.begin(), rows.end(),
                                      [&](const assignment& row) {
                                          return row.is_filled() &&
                                                 row.location == target.location &&
                                                 row.type == target.type &&
                                                 row.window.contains(segment);
                                      });
        lowest = std::min(lowest, static_cast<int>(covering));
    }
    return lowest == std::numeric_limits<int>::max() ? 0 : lowest;
}

auto conflict_detector::detect(const rota_document& document) const
    -> std::vector<conflict> {
    std::vector<conflict> conflicts;
    check_staffing(document, conflicts);
    check_double_booking(document, conflicts);
    check_training(document, conflicts);
    return conflicts;
}

void conflict_detector::check_staffing(const rota_document& document,
                                       std::vector<conflict>& out) const {
    const auto day = core::format_date(document.date);
    for (const auto& target : document.targets) {
        auto filled = coverage(target, document.assignments);
        if (filled < target.min_staff) {
            out.push_back(conflict{
                conflict_type::understaffed,
                compat::format("{} {} has {} of {} required staff on {}",
                               target.location, target.window.to_string(),
                               filled, target.min_staff, day),
                conflict_severity::error, target.location, std::nullopt});
        } else if (filled < target.ideal_staff) {
            out.push_back(conflict{
                conflict_type::below_ideal,
                compat::format("{} {} is below ideal staffing on {} ({} of {})",
                               target.location, target.window.to_string(), day,
                               filled, target.ideal_staff),
                conflict_severity::warning, target.location, std::nullopt});
        }
    }
}

void conflict_detector::check_double_booking(const rota_document& document,
                                             std::vector<conflict>& out) const {
    const auto& rows = document.assignments;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (!rows[i].is_filled()) continue;
        for (std::size_t j = i + 1; j < rows.size(); ++j) {
            if (!rows[j].held_by(*rows[i].staff_id)) continue;
            if (!rows[i].window.overlaps(rows[j].window)) continue;
            if (rows[i].split_shareable && rows[j].split_shareable) continue;

            const auto& id = *rows[i].staff_id;
            out.push_back(conflict{
                conflict_type::double_booking,
                compat::format("{} is booked at {} {} and {} {} on {}",
                               staff_label(staff_, id), rows[i].location,
                               rows[i].window.to_string(), rows[j].location,
                               rows[j].window.to_string(),
                               core::format_date(document.date)),
                conflict_severity::error, rows[j].location, id});
        }
    }
}

void conflict_detector::check_training(const rota_document& document,
                                       std::vector<conflict>& out) const {
    for (const auto& row : document.assignments) {
        if (!row.is_filled()) continue;
        if (row.type == assignment_type::management ||
            row.type == assignment_type::clinic) {
            continue;
        }
        auto it = std::find_if(staff_.begin(), staff_.end(),
                               [&](const staff_member& s) {
                                   return s.id == *row.staff_id;
                               });
        // No training record means nothing to audit against
        if (it == staff_.end() || it->trained_locations.empty()) continue;
        if (it->trained_locations.count(row.location) > 0 ||
            it->trained_locations.count(row.category) > 0) {
            continue;
        }
        out.push_back(conflict{
            conflict_type::training_mismatch,
            compat::format("{} is not trained for {} ({})", staff_label(staff_, it->id),
                           row.location, core::format_date(document.date)),
            conflict_severity::warning, row.location, it->id});
    }
}

}  // namespace rota::engine
