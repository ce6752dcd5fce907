/**
 * @file rota_types.cpp
 * @brief String conversions for assignment and rota document types
 */

#include <rota/engine/assignment.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/engine/rota_document.hpp>

#include <algorithm>

namespace rota::engine {

auto to_string(assignment_type type) -> std::string {
    switch (type) {
        case assignment_type::ward:
            return "ward";
        case assignment_type::dispensary:
            return "dispensary";
        case assignment_type::clinic:
            return "clinic";
        case assignment_type::management:
            return "management";
        case assignment_type::role:
            return "role";
    }
    return "ward";
}

auto parse_assignment_type(std::string_view str)
    -> std::optional<assignment_type> {
    if (str == "ward") return assignment_type::ward;
    if (str == "dispensary") return assignment_type::dispensary;
    if (str == "clinic") return assignment_type::clinic;
    if (str == "management") return assignment_type::management;
    if (str == "role") return assignment_type::role;
    return std::nullopt;
}

auto to_string(conflict_severity severity) -> std::string {
    return severity == conflict_severity::error ? "error" : "warning";
}

auto parse_conflict_severity(std::string_view str)
    -> std::optional<conflict_severity> {
    if (str == "warning") return conflict_severity::warning;
    if (str == "error") return conflict_severity::error;
    return std::nullopt;
}

auto to_string(conflict_type type) -> std::string {
    switch (type) {
        case conflict_type::understaffed:
            return "understaffed";
        case conflict_type::below_ideal:
            return "below_ideal";
        case conflict_type::double_booking:
            return "double_booking";
        case conflict_type::training_mismatch:
            return "training_mismatch";
    }
    return "understaffed";
}

auto parse_conflict_type(std::string_view str) -> std::optional<conflict_type> {
    if (str == "understaffed") return conflict_type::understaffed;
    if (str == "below_ideal") return conflict_type::below_ideal;
    if (str == "double_booking") return conflict_type::double_booking;
    if (str == "training_mismatch") return conflict_type::training_mismatch;
    return std::nullopt;
}

auto to_string(rota_status status) -> std::string {
    switch (status) {
        case rota_status::draft:
            return "draft";
        case rota_status::published:
            return "published";
        case rota_status::archived:
            return "archived";
    }
    return "draft";
}

auto parse_rota_status(std::string_view str) -> std::optional<rota_status> {
    if (str == "draft") return rota_status::draft;
    if (str == "published") return rota_status::published;
    if (str == "archived") return rota_status::archived;
    return std::nullopt;
}

// =============================================================================
// cell_key
// =============================================================================

auto cell_key::to_string() const -> std::string {
    if (is_unavailable_note()) {
        return cell_type + "-" + core::format_date(date) + "-" + start + "-" + end;
    }
    return cell_type + "-" + location + "-" + core::format_date(date) + "-" +
           start + "-" + end;
}

auto cell_key::parse(std::string_view text) -> std::optional<cell_key> {
    // Peel "-end", "-start" and "-YYYY-MM-DD" off the right-hand side
    auto end_sep = text.rfind('-');
    if (end_sep == std::string_view::npos) return std::nullopt;
    auto start_sep = text.rfind('-', end_sep == 0 ? 0 : end_sep - 1);
    if (start_sep == std::string_view::npos || start_sep < 11) {
        return std::nullopt;
    }
    auto date_begin = start_sep - 10;
    auto parsed_date = core::parse_date(text.substr(date_begin, 10));
    if (!parsed_date || date_begin == 0 || text[date_begin - 1] != '-') {
        return std::nullopt;
    }

    cell_key key;
    key.date = *parsed_date;
    key.start = std::string{text.substr(start_sep + 1, end_sep - start_sep - 1)};
    key.end = std::string{text.substr(end_sep + 1)};

    auto head = text.substr(0, date_begin - 1);
    auto type_sep = head.find('-');
    if (type_sep == std::string_view::npos) {
        if (head != "unavailable") return std::nullopt;
        key.cell_type = std::string{head};
    } else {
        key.cell_type = std::string{head.substr(0, type_sep)};
        key.location = std::string{head.substr(type_sep + 1)};
    }
    if (key.cell_type.empty() || key.start.empty() || key.end.empty()) {
        return std::nullopt;
    }
    if (!key.is_unavailable_note() && key.location.empty()) {
        return std::nullopt;
    }
    return key;
}

// =============================================================================
// rota_document / reference_snapshot
// =============================================================================

auto rota_document::has_errors() const -> bool {
    return std::any_of(conflicts.begin(), conflicts.end(), [](const conflict& c) {
        return c.severity == conflict_severity::error;
    });
}

auto reference_snapshot::find_staff(std::string_view id) const
    -> const staff_member* {
    auto it = std::find_if(staff.begin(), staff.end(),
                           [&](const staff_member& s) { return s.id == id; });
    return it == staff.end() ? nullptr : &*it;
}

auto reference_snapshot::find_clinic(std::string_view id) const
    -> const clinic_slot* {
    auto it = std::find_if(clinics.begin(), clinics.end(),
                           [&](const clinic_slot& c) { return c.id == id; });
    return it == clinics.end() ? nullptr : &*it;
}

}  // namespace rota::engine
