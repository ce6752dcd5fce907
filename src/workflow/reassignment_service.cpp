/**
 * @file reassignment_service.cpp
 */

#include <rota/workflow/reassignment_service.hpp>

#include <rota/engine/granularity.hpp>
#include <rota/integration/logger_adapter.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace rota::workflow {

using integration::logger_adapter;

auto to_string(reassignment_scope scope) -> std::string {
    switch (scope) {
        case reassignment_scope::slot:
            return "slot";
        case reassignment_scope::day:
            return "day";
        case reassignment_scope::week:
            return "week";
    }
    return "slot";
}

auto parse_reassignment_scope(std::string_view str)
    -> std::optional<reassignment_scope> {
    if (str == "slot") return reassignment_scope::slot;
    if (str == "day") return reassignment_scope::day;
    if (str == "week") return reassignment_scope::week;
    return std::nullopt;
}

reassignment_service::reassignment_service(storage::rota_database& db,
                                           engine::reference_data_source& reference_data,
                                           engine::engine_config config)
    : db_(db), reference_data_(reference_data), config_(std::move(config)) {}

// =============================================================================
// Validation and lookup
// =============================================================================

auto reassignment_service::validate(const reassignment_request& request,
                                    const engine::reference_snapshot& snapshot) const
    -> VoidResult {
    if (!request.date.ok()) {
        return rota_void_error(error_codes::invalid_date, "Invalid reassignment date");
    }
    if (request.original_staff_id.empty()) {
        return rota_void_error(error_codes::precondition_failed,
                               "Original staff member is required");
    }
    if (request.new_staff_id) {
        if (*request.new_staff_id == request.original_staff_id) {
            return rota_void_error(error_codes::precondition_failed,
                                   "Original and new staff member are the same",
                                   request.original_staff_id);
        }
        if (snapshot.find_staff(*request.new_staff_id) == nullptr) {
            return rota_void_error(error_codes::staff_not_found,
                                   "Staff member not found", *request.new_staff_id);
        }
    }
    if (request.scope == reassignment_scope::slot) {
        if (!request.location || request.location->empty()) {
            return rota_void_error(error_codes::precondition_failed,
                                   "Slot reassignment needs a location");
        }
        if (!request.start_time) {
            return rota_void_error(error_codes::precondition_failed,
                                   "Slot reassignment needs a start time");
        }
        if (request.end_time && *request.end_time <= *request.start_time) {
            return rota_void_error(error_codes::invalid_time,
                                   "Slot end must be after its start");
        }
    }
    return ok();
}

auto reassignment_service::resolve_document(
    const std::map<core::date, std::int64_t>& rota_ids_by_date,
    const core::date& date) const -> Result<engine::rota_document> {
    const auto day = core::format_date(date);

    if (auto it = rota_ids_by_date.find(date); it != rota_ids_by_date.end()) {
        auto doc = db_.rotas().find_by_id(it->second);
        if (!doc || doc->date != date) {
            return rota_error<engine::rota_document>(
                error_codes::rota_not_found, "Rota not found",
                std::to_string(it->second) + " for " + day);
        }
        return std::move(*doc);
    }

    auto docs = db_.rotas().find_by_date(date);
    if (docs.empty()) {
        return rota_error<engine::rota_document>(error_codes::rota_not_found,
                                                 "No rota for date", day);
    }
    auto editable = std::find_if(docs.begin(), docs.end(),
                                 [](const engine::rota_document& d) {
                                     return d.is_editable();
                                 });
    return std::move(editable != docs.end() ? *editable : docs.front());
}

// =============================================================================
// Row edits
// =============================================================================

auto reassignment_service::check_occupant(
    const engine::rota_document& doc, const std::string& staff_id,
    const std::vector<engine::assignment>& incoming,
    const edit_context& context) const -> VoidResult {
    const bool incoming_exclusive =
        std::any_of(incoming.begin(), incoming.end(),
                    [](const engine::assignment& a) { return a.do_not_split; });

    for (const auto& held : doc.assignments) {
        if (!held.held_by(staff_id)) {
            continue;
        }
        if (context.swapped_location && held.location == *context.swapped_location) {
            continue;
        }
        if (held.do_not_split) {
            return rota_void_error(
                error_codes::do_not_split_violation,
                "Staff member holds a do-not-split duty",
                staff_id + " on " + held.location + " " + held.window.to_string() +
                    " " + core::format_date(doc.date));
        }
        if (incoming_exclusive) {
            return rota_void_error(
                error_codes::do_not_split_violation,
                "Do-not-split duty cannot be combined with other duties",
                staff_id + " already holds " + held.location + " " +
                    held.window.to_string() + " " + core::format_date(doc.date));
        }
        for (const auto& row : incoming) {
            if (!held.window.overlaps(row.window) ||
                (held.split_shareable && row.split_shareable)) {
                continue;
            }
            return rota_void_error(
                error_codes::overlapping_assignment,
                "Staff member is already booked in that window",
                staff_id + " holds " + held.location + " " +
                    held.window.to_string() + " against " + row.location + " " +
                    row.window.to_string() + " " + core::format_date(doc.date));
        }
    }
    return ok();
}

auto reassignment_service::apply_slot(engine::rota_document& doc,
                                      const reassignment_request& request,
                                      const edit_context& context) const
    -> Result<std::size_t> {
    auto& rows = doc.assignments;
    const auto start = *request.start_time;
    auto matches = [&](const engine::assignment& row) {
        return row.held_by(request.original_staff_id) &&
               row.location == *request.location;
    };

    for (auto& row : rows) {
        if (matches(row) && row.window.start == start &&
            (!request.end_time || row.window.end == *request.end_time)) {
            if (request.new_staff_id) {
                auto free = check_occupant(doc, *request.new_staff_id, {row}, context);
                if (free.is_err()) {
                    return Result<std::size_t>(free.error());
                }
            }
            row.staff_id = request.new_staff_id;
            return std::size_t{1};
        }
    }

    // The stored row is coarser than the request
    for (auto it = rows.begin(); it != rows.end(); ++it) {
        if (!matches(*it) || start < it->window.start || start >= it->window.end) {
            continue;
        }
        auto end = it->window.end;
        if (request.end_time) {
            end = *request.end_time;
        } else if (config_.is_full_day(it->window) &&
                   start < config_.half_day_boundary) {
            end = config_.half_day_boundary;
        }
        const core::time_window requested{start, end};
        if (!requested.is_valid() || !it->window.contains(requested)) {
            continue;
        }

        if (request.new_staff_id) {
            auto piece = *it;
            piece.window = requested;
            auto free = check_occupant(doc, *request.new_staff_id, {piece}, context);
            if (free.is_err()) {
                return Result<std::size_t>(free.error());
            }
        }

        auto pieces = engine::normalize_granularity(*it, requested, config_);
        for (auto& piece : pieces) {
            if (piece.window == requested) {
                piece.staff_id = request.new_staff_id;
            }
        }
        logger_adapter::debug("Split {} {} into {} rows for {}", it->location,
                              it->window.to_string(), pieces.size(),
                              requested.to_string());
        it = rows.erase(it);
        rows.insert(it, pieces.begin(), pieces.end());
        return std::size_t{1};
    }

    return rota_error<std::size_t>(
        error_codes::stale_reference, "No stored row matches the requested slot",
        *request.location + " " + core::format_date(doc.date) + " " +
            start.to_string());
}

auto reassignment_service::apply_rows(engine::rota_document& doc,
                                      const reassignment_request& request,
                                      const edit_context& context) const
    -> Result<std::size_t> {
    auto& rows = doc.assignments;
    std::vector<std::size_t> selected;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].held_by(request.original_staff_id) &&
            (!request.location || rows[i].location == *request.location)) {
            selected.push_back(i);
        }
    }
    if (selected.empty()) {
        return std::size_t{0};
    }

    if (request.respect_special_continuity && request.new_staff_id) {
        for (auto i : selected) {
            if (!config_.is_continuity_sensitive(rows[i].location)) {
                continue;
            }
            for (const auto& other : rows) {
                if (!other.held_by(*request.new_staff_id) ||
                    !other.window.overlaps(rows[i].window)) {
                    continue;
                }
                if (context.swapped_location &&
                    other.location == *context.swapped_location) {
                    continue;
                }
                return rota_error<std::size_t>(
                    error_codes::continuity_violation,
                    "Continuity block cannot be split",
                    *request.new_staff_id + " already holds " + other.location +
                        " " + other.window.to_string() + " against " +
                        rows[i].location);
            }
        }
    }

    if (request.new_staff_id) {
        std::vector<engine::assignment> incoming;
        for (auto i : selected) {
            incoming.push_back(rows[i]);
        }
        auto free = check_occupant(doc, *request.new_staff_id, incoming, context);
        if (free.is_err()) {
            return Result<std::size_t>(free.error());
        }
    }

    for (auto i : selected) {
        rows[i].staff_id = request.new_staff_id;
    }
    return selected.size();
}

auto reassignment_service::occupy(engine::rota_document& doc, const slot_ref& slot,
                                  const std::string& staff_id,
                                  const edit_context& context) const
    -> Result<std::size_t> {
    auto open = std::find_if(doc.assignments.begin(), doc.assignments.end(),
                             [&](const engine::assignment& a) {
                                 return !a.is_filled() && a.location == slot.location &&
                                        a.window == slot.window;
                             });
    if (open != doc.assignments.end()) {
        auto free = check_occupant(doc, staff_id, {*open}, context);
        if (free.is_err()) {
            return Result<std::size_t>(free.error());
        }
        open->staff_id = staff_id;
        return std::size_t{1};
    }

    engine::assignment row;
    row.staff_id = staff_id;
    row.location = slot.location;
    row.date = doc.date;
    row.window = slot.window;
    row.type = engine::assignment_type::role;
    row.category = slot.location;

    auto same_location = std::find_if(
        doc.assignments.begin(), doc.assignments.end(),
        [&](const engine::assignment& a) { return a.location == slot.location; });
    if (same_location != doc.assignments.end()) {
        row.type = same_location->type;
        row.category = same_location->category;
        row.split_shareable = same_location->split_shareable;
        row.do_not_split = same_location->do_not_split;
    } else {
        for (const auto& target : doc.targets) {
            if (target.location == slot.location) {
                row.type = target.type;
                row.category = target.category;
                row.do_not_split = target.do_not_split;
                break;
            }
        }
    }

    auto free = check_occupant(doc, staff_id, {row}, context);
    if (free.is_err()) {
        return Result<std::size_t>(free.error());
    }
    doc.assignments.push_back(std::move(row));
    return std::size_t{1};
}

// =============================================================================
// Per-date application
// =============================================================================

auto reassignment_service::commit(engine::rota_document& doc,
                                  const engine::reference_snapshot& snapshot,
                                  std::chrono::system_clock::time_point now)
    -> VoidResult {
    engine::conflict_detector detector(snapshot.staff, config_);
    doc.conflicts = detector.detect(doc);
    doc.last_edited = now;
    return db_.rotas().save(doc);
}

auto reassignment_service::edit_date(const reassignment_request& request,
                                     const core::date& date,
                                     const edit_context& context,
                                     std::chrono::system_clock::time_point now,
                                     reassignment_result& result) -> date_outcome {
    date_outcome outcome;
    outcome.date = date;

    auto doc = resolve_document(request.rota_ids_by_date, date);
    if (doc.is_err()) {
        outcome.error = doc.error();
        return outcome;
    }
    auto& document = doc.value();
    outcome.rota_id = document.id;

    if (!document.is_editable()) {
        outcome.error = error_info{error_codes::immutable_document,
                                   "Archived rotas cannot be changed", "rota"};
        return outcome;
    }

    auto changed = request.scope == reassignment_scope::slot
                       ? apply_slot(document, request, context)
                       : apply_rows(document, request, context);
    if (changed.is_err()) {
        outcome.error = changed.error();
        return outcome;
    }
    outcome.rows_changed = changed.value();
    if (outcome.rows_changed == 0) {
        outcome.success = true;
        return outcome;
    }

    auto saved = commit(document, *context.snapshot, now);
    if (saved.is_err()) {
        outcome.error = saved.error();
        return outcome;
    }

    result.updated_assignments.insert(result.updated_assignments.end(),
                                      document.assignments.begin(),
                                      document.assignments.end());
    outcome.success = true;
    return outcome;
}

auto reassignment_service::run(const reassignment_request& request,
                               const edit_context& context,
                               std::chrono::system_clock::time_point now)
    -> Result<reassignment_result> {
    reassignment_result result;

    if (request.scope != reassignment_scope::week) {
        auto outcome = edit_date(request, request.date, context, now, result);
        if (outcome.error) {
            return Result<reassignment_result>(*outcome.error);
        }
        if (outcome.rows_changed == 0) {
            return rota_error<reassignment_result>(
                error_codes::assignment_not_found,
                "No assignment held by the original staff member",
                request.original_staff_id + " on " + core::format_date(request.date));
        }
        result.outcomes.push_back(std::move(outcome));
        result.success = true;
        return result;
    }

    std::size_t rows_changed = 0;
    for (const auto& date : core::week_dates(core::week_start_of(request.date))) {
        auto outcome = edit_date(request, date, context, now, result);
        if (outcome.error) {
            logger_adapter::warn("Reassignment failed for {}: {}",
                                 core::format_date(date), outcome.error->message);
        }
        rows_changed += outcome.rows_changed;
        result.outcomes.push_back(std::move(outcome));
    }
    result.success = std::all_of(result.outcomes.begin(), result.outcomes.end(),
                                 [](const date_outcome& o) { return o.success; });

    if (result.success && rows_changed == 0) {
        return rota_error<reassignment_result>(
            error_codes::assignment_not_found,
            "No assignment held by the original staff member",
            request.original_staff_id + " in week of " +
                core::format_date(core::week_start_of(request.date)));
    }
    return result;
}

// =============================================================================
// Public operations
// =============================================================================

auto reassignment_service::reassign(const reassignment_request& request,
                                    std::chrono::system_clock::time_point now)
    -> Result<reassignment_result> {
    auto snapshot = reference_data_.load_snapshot();
    if (snapshot.is_err()) {
        return Result<reassignment_result>(snapshot.error());
    }

    auto valid = validate(request, snapshot.value());
    if (valid.is_err()) {
        logger_adapter::log_request_rejected("reassign", valid.error().message);
        return Result<reassignment_result>(valid.error());
    }

    edit_context context;
    context.snapshot = &snapshot.value();
    auto result = run(request, context, now);
    if (result.is_err()) {
        logger_adapter::log_request_rejected("reassign", result.error().message);
        return result;
    }

    const auto& outcomes = result.value().outcomes;
    auto failed = static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [](const date_outcome& o) { return !o.success; }));
    auto updated = static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const date_outcome& o) {
            return o.success && o.rows_changed > 0;
        }));
    logger_adapter::log_reassignment(
        to_string(request.scope) + " " + core::format_date(request.date),
        request.original_staff_id, request.new_staff_id.value_or(""), updated, failed);
    return result;
}

auto reassignment_service::swap(const swap_request& request,
                                std::chrono::system_clock::time_point now)
    -> Result<reassignment_result> {
    const auto& source = request.source;
    const auto& target = request.target;

    if (!source.staff_id) {
        return rota_error<reassignment_result>(error_codes::precondition_failed,
                                               "Source slot has no occupant");
    }
    if (source.date == target.date && source.location == target.location &&
        source.window == target.window) {
        return rota_error<reassignment_result>(error_codes::precondition_failed,
                                               "Source and target are the same slot");
    }
    if (request.scope != reassignment_scope::slot) {
        if (source.location == target.location) {
            return rota_error<reassignment_result>(
                error_codes::precondition_failed,
                "Day and week swaps need two different locations");
        }
        if (!target.staff_id) {
            return rota_error<reassignment_result>(
                error_codes::precondition_failed,
                "An open target can only be swapped at slot scope");
        }
    }

    auto snapshot = reference_data_.load_snapshot();
    if (snapshot.is_err()) {
        return Result<reassignment_result>(snapshot.error());
    }

    auto step = [&](const slot_ref& from, const slot_ref& to) {
        reassignment_request r;
        r.rota_ids_by_date = request.rota_ids_by_date;
        r.location = from.location;
        r.date = from.date;
        r.start_time = from.window.start;
        r.end_time = from.window.end;
        r.original_staff_id = from.staff_id.value_or("");
        r.new_staff_id = to.staff_id;
        r.scope = request.scope;
        r.respect_special_continuity = request.respect_special_continuity;
        r.requested_by = request.requested_by;
        return r;
    };

    auto first = step(source, target);
    auto valid = validate(first, snapshot.value());
    if (valid.is_ok() && target.staff_id) {
        valid = validate(step(target, source), snapshot.value());
    }
    if (valid.is_err()) {
        logger_adapter::log_request_rejected("swap", valid.error().message);
        return Result<reassignment_result>(valid.error());
    }

    // Rows at the partner's location are handed back only on the dates
    // both steps edit
    const bool same_dates =
        request.scope == reassignment_scope::week || source.date == target.date;
    auto swapped = [same_dates](const std::string& location) {
        return same_dates ? std::optional<std::string>{location} : std::nullopt;
    };

    if (!target.staff_id) {
        // The source staff member must fit the open slot before the source
        // is vacated
        auto target_doc = resolve_document(request.rota_ids_by_date, target.date);
        if (target_doc.is_ok()) {
            edit_context trial_context;
            trial_context.snapshot = &snapshot.value();
            trial_context.swapped_location = swapped(source.location);
            auto trial = occupy(target_doc.value(), target, *source.staff_id,
                                trial_context);
            if (trial.is_err()) {
                logger_adapter::log_request_rejected("swap", trial.error().message);
                return Result<reassignment_result>(trial.error());
            }
        }
    }

    edit_context first_context;
    first_context.snapshot = &snapshot.value();
    first_context.swapped_location = swapped(target.location);
    auto moved = run(first, first_context, now);
    if (moved.is_err()) {
        logger_adapter::log_request_rejected("swap", moved.error().message);
        return moved;
    }

    reassignment_result combined = std::move(moved.value());

    if (target.staff_id) {
        edit_context second_context;
        second_context.snapshot = &snapshot.value();
        second_context.swapped_location = swapped(source.location);
        auto back = run(step(target, source), second_context, now);
        if (back.is_err()) {
            date_outcome failure;
            failure.date = target.date;
            failure.error = back.error();
            combined.outcomes.push_back(std::move(failure));
        } else {
            auto& outcomes = back.value().outcomes;
            combined.outcomes.insert(combined.outcomes.end(), outcomes.begin(),
                                     outcomes.end());
        }
    } else {
        date_outcome outcome;
        outcome.date = target.date;
        auto doc = resolve_document(request.rota_ids_by_date, target.date);
        if (doc.is_err()) {
            outcome.error = doc.error();
        } else if (!doc.value().is_editable()) {
            outcome.rota_id = doc.value().id;
            outcome.error = error_info{error_codes::immutable_document,
                                       "Archived rotas cannot be changed", "rota"};
        } else {
            auto& document = doc.value();
            outcome.rota_id = document.id;
            edit_context target_context;
            target_context.snapshot = &snapshot.value();
            target_context.swapped_location = swapped(source.location);
            auto placed = occupy(document, target, *source.staff_id, target_context);
            if (placed.is_err()) {
                outcome.error = placed.error();
            } else {
                outcome.rows_changed = placed.value();
                auto saved = commit(document, snapshot.value(), now);
                if (saved.is_err()) {
                    outcome.error = saved.error();
                } else {
                    outcome.success = true;
                }
            }
        }
        combined.outcomes.push_back(std::move(outcome));
    }

    combined.success = std::all_of(combined.outcomes.begin(), combined.outcomes.end(),
                                   [](const date_outcome& o) { return o.success; });

    // Both steps may have written the same document
    combined.updated_assignments.clear();
    std::set<std::int64_t> written;
    for (const auto& outcome : combined.outcomes) {
        if (!outcome.success || outcome.rows_changed == 0 ||
            !written.insert(outcome.rota_id).second) {
            continue;
        }
        if (auto doc = db_.rotas().find_by_id(outcome.rota_id)) {
            combined.updated_assignments.insert(combined.updated_assignments.end(),
                                                doc->assignments.begin(),
                                                doc->assignments.end());
        }
    }

    auto failed = static_cast<std::size_t>(
        std::count_if(combined.outcomes.begin(), combined.outcomes.end(),
                      [](const date_outcome& o) { return !o.success; }));
    logger_adapter::log_reassignment(
        "swap " + to_string(request.scope) + " " + core::format_date(source.date),
        *source.staff_id, target.staff_id.value_or(""), written.size(), failed);
    return combined;
}

}  // namespace rota::workflow
