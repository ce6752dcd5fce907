/**
 * @file rota_lifecycle_manager.cpp
 * @brief Publish, archive and retention handling for rota weeks
 */

#include <rota/workflow/rota_lifecycle_manager.hpp>

#include <rota/compat/format.hpp>
#include <rota/integration/logger_adapter.hpp>

#include <algorithm>
#include <ctime>

namespace rota::workflow {

using integration::logger_adapter;

namespace {

auto format_stamp(std::chrono::system_clock::time_point tp, const std::string& fmt)
    -> std::string {
    auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_value);
#else
    gmtime_r(&time_value, &tm_buf);
#endif
    char buf[64];
    auto len = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm_buf);
    return std::string(buf, len);
}

}  // namespace

auto to_string(week_state state) -> std::string {
    switch (state) {
        case week_state::empty:
            return "empty";
        case week_state::configuring:
            return "configuring";
        case week_state::draft:
            return "draft";
        case week_state::published:
            return "published";
        case week_state::archived:
            return "archived";
    }
    return "empty";
}

rota_lifecycle_manager::rota_lifecycle_manager(storage::rota_database& db,
                                               lifecycle_config config)
    : db_(db), config_(std::move(config)) {}

auto rota_lifecycle_manager::state_of(const core::date& week_start) const
    -> week_state {
    auto docs = db_.rotas().find_by_week(week_start);
    auto has = [&](engine::rota_status status) {
        return std::any_of(docs.begin(), docs.end(),
                           [&](const engine::rota_document& d) {
                               return d.status == status;
                           });
    };
    if (has(engine::rota_status::published)) return week_state::published;
    if (has(engine::rota_status::draft)) return week_state::draft;
    if (has(engine::rota_status::archived)) return week_state::archived;
    if (db_.configurations().find(week_start)) return week_state::configuring;
    return week_state::empty;
}

auto rota_lifecycle_manager::publish(const core::date& week_start,
                                     const std::string& published_by,
                                     std::chrono::system_clock::time_point now)
    -> Result<engine::publication_info> {
    const auto week = core::format_date(week_start);
    if (!core::is_week_start(week_start)) {
        return rota_error<engine::publication_info>(
            error_codes::invalid_week_start, "Week start must be a Monday", week);
    }
    if (published_by.empty()) {
        return rota_error<engine::publication_info>(
            error_codes::precondition_failed, "Publisher identity is required");
    }

    auto state = state_of(week_start);
    if (state != week_state::draft) {
        logger_adapter::log_request_rejected(
            "publish", compat::format("week {} is {}", week, to_string(state)));
        return rota_error<engine::publication_info>(
            error_codes::invalid_transition,
            compat::format("Cannot publish a week in state {}", to_string(state)),
            week);
    }

    engine::publication_info info;
    info.published_by = published_by;
    info.published_at = now;
    info.publish_date = format_stamp(now, config_.publish_date_format);
    info.publish_time = format_stamp(now, config_.publish_time_format);
    info.published_set_id = week + "-" + std::to_string(core::epoch_millis(now));

    auto published = db_.rotas().mark_week_published(week_start, info);
    if (published.is_err()) {
        return Result<engine::publication_info>(published.error());
    }

    logger_adapter::log_rota_published(week, info.published_set_id,
                                       published.value(), published_by);
    return info;
}

auto rota_lifecycle_manager::archive_week(const core::date& week_start)
    -> Result<std::size_t> {
    auto archived = db_.rotas().archive_week(week_start);
    if (archived.is_err()) {
        return archived;
    }
    if (archived.value() == 0) {
        return rota_error<std::size_t>(error_codes::invalid_transition,
                                       "Week has no published rota",
                                       core::format_date(week_start));
    }
    logger_adapter::log_rota_archived(core::format_date(week_start),
                                      archived.value());
    return archived;
}

auto rota_lifecycle_manager::archive_document(std::int64_t rota_id) -> VoidResult {
    auto doc = db_.rotas().find_by_id(rota_id);
    if (!doc) {
        return rota_void_error(error_codes::rota_not_found, "Rota not found",
                               std::to_string(rota_id));
    }
    if (doc->status != engine::rota_status::published) {
        return rota_void_error(
            error_codes::invalid_transition,
            compat::format("Only published rotas can be archived (rota {} is {})",
                           rota_id, engine::to_string(doc->status)));
    }
    auto updated = db_.rotas().update_status(rota_id, engine::rota_status::archived);
    if (updated.is_err()) {
        return updated;
    }
    logger_adapter::log_rota_archived("rota " + std::to_string(rota_id), 1);
    return ok();
}

auto rota_lifecycle_manager::retention_cutoff(const core::date& today) const
    -> core::date {
    return core::subtract_months(today, config_.retention_months);
}

auto rota_lifecycle_manager::sweep_stale_drafts(const core::date& today)
    -> Result<storage::sweep_result> {
    auto cutoff = retention_cutoff(today);
    auto swept = db_.rotas().delete_stale_drafts(cutoff);
    if (swept.is_err()) {
        logger_adapter::error("Stale draft sweep failed: {}", swept.error().message);
        return swept;
    }
    logger_adapter::log_drafts_swept(core::format_date(cutoff),
                                     swept.value().total_found,
                                     swept.value().deleted);
    return swept;
}

auto rota_lifecycle_manager::delete_archived(
    std::string_view confirmation, const std::optional<core::date>& week_start,
    const std::optional<core::date>& before) -> Result<std::size_t> {
    if (confirmation != config_.deletion_confirmation) {
        logger_adapter::log_request_rejected("delete-archived",
                                             "confirmation token mismatch");
        return rota_error<std::size_t>(error_codes::confirmation_required,
                                       "Deletion of archived rotas not confirmed");
    }
    auto deleted = db_.rotas().delete_archived(week_start, before);
    if (deleted.is_ok()) {
        logger_adapter::log_archives_deleted(deleted.value());
    }
    return deleted;
}

auto rota_lifecycle_manager::load_draft(std::int64_t rota_id) const
    -> Result<engine::rota_document> {
    auto doc = db_.rotas().find_by_id(rota_id);
    if (!doc) {
        return rota_error<engine::rota_document>(
            error_codes::rota_not_found, "Rota not found", std::to_string(rota_id));
    }
    if (doc->status != engine::rota_status::draft) {
        return rota_error<engine::rota_document>(
            error_codes::immutable_document,
            compat::format("Rota {} is {}", rota_id, engine::to_string(doc->status)));
    }
    return std::move(*doc);
}

auto rota_lifecycle_manager::set_cell_text(std::int64_t rota_id,
                                           const engine::cell_key& key,
                                           const std::string& text) -> VoidResult {
    auto doc = load_draft(rota_id);
    if (doc.is_err()) {
        return VoidResult(doc.error());
    }
    if (key.date != doc.value().date) {
        return rota_void_error(error_codes::invalid_cell_key,
                               "Cell date does not match the rota date",
                               key.to_string());
    }
    return db_.rotas().set_cell_text(rota_id, key, text);
}

auto rota_lifecycle_manager::save_cell_text(
    std::int64_t rota_id, const std::map<std::string, std::string>& cells)
    -> VoidResult {
    auto loaded = load_draft(rota_id);
    if (loaded.is_err()) {
        return VoidResult(loaded.error());
    }
    auto doc = std::move(loaded.value());

    std::map<engine::cell_key, std::string> parsed;
    for (const auto& [text_key, text] : cells) {
        auto key = engine::cell_key::parse(text_key);
        if (!key || key->date != doc.date) {
            return rota_void_error(error_codes::invalid_cell_key,
                                   "Malformed cell key", text_key);
        }
        if (!text.empty()) {
            parsed[*key] = text;
        }
    }

    doc.cell_text = std::move(parsed);
    return db_.rotas().save(doc);
}

}  // namespace rota::workflow
