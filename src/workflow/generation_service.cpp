/**
 * @file generation_service.cpp
 */

#include <rota/workflow/generation_service.hpp>

#include <rota/core/bank_holidays.hpp>
#include <rota/integration/logger_adapter.hpp>

#include <algorithm>
#include <utility>

namespace rota::workflow {

using integration::logger_adapter;

generation_service::generation_service(storage::rota_database& db,
                                       engine::reference_data_source& reference_data,
                                       engine::engine_config config)
    : db_(db), reference_data_(reference_data), generator_(std::move(config)) {}

auto generation_service::save_configuration(storage::rota_configuration config,
                                            std::chrono::system_clock::time_point now)
    -> VoidResult {
    config.last_modified = now;
    auto saved = db_.configurations().save(config);
    if (saved.is_ok()) {
        logger_adapter::log_configuration_saved(core::format_date(config.week_start),
                                                config.last_modified_by);
    }
    return saved;
}

auto generation_service::effective_weekdays(const generate_week_request& request) const
    -> std::set<unsigned> {
    auto weekdays = request.selected_weekdays;
    if (!request.exclude_bank_holidays) {
        return weekdays;
    }
    for (const auto& date : core::week_dates(request.week_start)) {
        if (core::is_bank_holiday(date)) {
            logger_adapter::debug("Skipping bank holiday {}", core::format_date(date));
            weekdays.erase(core::weekday_of(date).c_encoding());
        }
    }
    return weekdays;
}

auto generation_service::generate_week(const generate_week_request& request,
                                       std::chrono::system_clock::time_point now)
    -> Result<generate_week_response> {
    using result_type = Result<generate_week_response>;
    const auto week = request.week_start.ok() ? core::format_date(request.week_start)
                                              : std::string{"invalid"};

    auto snapshot = reference_data_.load_snapshot();
    if (snapshot.is_err()) {
        logger_adapter::error("Reference data unavailable: {}",
                              snapshot.error().message);
        return result_type(snapshot.error());
    }

    engine::generation_request engine_request;
    engine_request.week_start = request.week_start;
    engine_request.staff_ids = request.staff_ids;
    engine_request.selected_weekdays =
        request.week_start.ok() ? effective_weekdays(request) : request.selected_weekdays;
    engine_request.selected_clinic_ids = request.selected_clinic_ids;
    engine_request.extra_roles_by_weekday = request.extra_roles_by_weekday;
    engine_request.working_days_override = request.working_days_override;
    engine_request.ignored_rules = request.ignored_rules;
    engine_request.extra_unavailability = request.extra_unavailability;
    engine_request.generated_by = request.requested_by;
    engine_request.generated_at = now;

    // Generation is pure, so preconditions are all checked before any write
    auto generated = generator_.generate(engine_request, snapshot.value());
    if (generated.is_err()) {
        logger_adapter::log_request_rejected("generate", generated.error().message);
        return result_type(generated.error());
    }

    if (!db_.rotas()
             .find_by_week(request.week_start, engine::rota_status::published)
             .empty()) {
        logger_adapter::log_request_rejected(
            "generate", "week " + week + " is already published");
        return rota_error<generate_week_response>(
            error_codes::week_already_published,
            "Published rotas cannot be regenerated; use reassignment instead", week);
    }

    storage::rota_configuration config;
    config.week_start = request.week_start;
    config.staff_ids = request.staff_ids;
    config.clinic_ids = request.selected_clinic_ids;
    config.weekdays = request.selected_weekdays;
    config.working_days_override = request.working_days_override;
    config.ignored_rules = request.ignored_rules;
    config.extra_unavailability = request.extra_unavailability;
    config.last_modified_by = request.requested_by;
    auto saved = save_configuration(std::move(config), now);
    if (saved.is_err()) {
        return result_type(saved.error());
    }

    auto cleared = db_.rotas().delete_drafts_for_week(request.week_start);
    if (cleared.is_err()) {
        return result_type(cleared.error());
    }
    if (cleared.value() > 0) {
        logger_adapter::debug("Cleared {} drafts of week {}", cleared.value(), week);
    }

    engine::conflict_detector detector(snapshot.value().staff, generator_.config());
    generate_week_response response;
    std::size_t gaps = 0;
    std::size_t errors = 0;

    for (auto& doc : generated.value()) {
        doc.conflicts = detector.detect(doc);
        auto inserted = db_.rotas().insert(doc);
        if (inserted.is_err()) {
            logger_adapter::error("Failed to store rota {}: {}",
                                  core::format_date(doc.date),
                                  inserted.error().message);
            return result_type(inserted.error());
        }
        doc.id = inserted.value();
        response.rota_ids_by_date[doc.date] = doc.id;

        gaps += static_cast<std::size_t>(
            std::count_if(doc.assignments.begin(), doc.assignments.end(),
                          [](const engine::assignment& a) { return !a.is_filled(); }));
        errors += static_cast<std::size_t>(std::count_if(
            doc.conflicts.begin(), doc.conflicts.end(), [](const engine::conflict& c) {
                return c.severity == engine::conflict_severity::error;
            }));
        response.assignments.insert(response.assignments.end(),
                                    doc.assignments.begin(), doc.assignments.end());
        response.conflicts.insert(response.conflicts.end(), doc.conflicts.begin(),
                                  doc.conflicts.end());
    }

    auto marked = db_.configurations().mark_generated(request.week_start, now);
    if (marked.is_err()) {
        return result_type(marked.error());
    }

    logger_adapter::log_rota_generated(week, response.rota_ids_by_date.size(), gaps,
                                       errors, request.requested_by);
    return response;
}

auto generation_service::get_assignments(std::int64_t rota_id) const
    -> Result<std::vector<engine::assignment>> {
    auto doc = db_.rotas().find_by_id(rota_id);
    if (!doc) {
        return rota_error<std::vector<engine::assignment>>(
            error_codes::rota_not_found, "Rota not found", std::to_string(rota_id));
    }
    return std::move(doc->assignments);
}

}  // namespace rota::workflow
