/**
 * @file rota_repository.cpp
 * @brief SQLite implementation of the rota document repository
 */

#include <rota/storage/rota_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sstream>

namespace rota::storage {

using detail::get_optional_text;
using detail::get_optional_timestamp;
using detail::get_text;
using detail::statement;
using detail::transaction;

namespace {

constexpr const char* kSelectColumns =
    "SELECT rota_pk, rota_date, week_start, status, generated_by, generated_at, "
    "included_days, published_by, published_at, publish_date, publish_time, "
    "published_set_id, last_edited FROM rotas ";

auto serialize_weekdays(const std::set<unsigned>& days) -> std::string {
    std::ostringstream oss;
    bool first = true;
    for (auto d : days) {
        if (!first) oss << ",";
        first = false;
        oss << d;
    }
    return oss.str();
}

auto deserialize_weekdays(std::string_view text) -> std::set<unsigned> {
    std::set<unsigned> days;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto comma = text.find(',', pos);
        auto token = text.substr(pos, comma == std::string_view::npos
                                          ? std::string_view::npos
                                          : comma - pos);
        if (!token.empty()) {
            days.insert(static_cast<unsigned>(std::stoul(std::string{token})));
        }
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return days;
}

/// Binds the 12 header columns starting at @p first
void bind_header(statement& stmt, const engine::rota_document& doc, int first) {
    stmt.bind(first + 0, core::format_date(doc.date));
    stmt.bind(first + 1, core::format_date(doc.week_start));
    stmt.bind(first + 2, engine::to_string(doc.status));
    stmt.bind(first + 3, doc.generated_by);
    stmt.bind(first + 4, core::to_iso8601(doc.generated_at));
    stmt.bind(first + 5, serialize_weekdays(doc.included_weekdays));
    if (doc.publication) {
        const auto& pub = *doc.publication;
        stmt.bind(first + 6, pub.published_by);
        stmt.bind(first + 7, core::to_iso8601(pub.published_at));
        stmt.bind(first + 8, pub.publish_date);
        stmt.bind(first + 9, pub.publish_time);
        stmt.bind(first + 10, pub.published_set_id);
    } else {
        for (int i = 6; i <= 10; ++i) stmt.bind_null(first + i);
    }
    if (doc.last_edited) {
        stmt.bind(first + 11, core::to_iso8601(*doc.last_edited));
    } else {
        stmt.bind_null(first + 11);
    }
}

auto parse_header(sqlite3_stmt* stmt) -> std::optional<engine::rota_document> {
    engine::rota_document doc;
    doc.id = sqlite3_column_int64(stmt, 0);

    auto date = core::parse_date(get_text(stmt, 1));
    auto week = core::parse_date(get_text(stmt, 2));
    auto status = engine::parse_rota_status(get_text(stmt, 3));
    if (!date || !week || !status) {
        return std::nullopt;
    }
    doc.date = *date;
    doc.week_start = *week;
    doc.status = *status;
    doc.generated_by = get_text(stmt, 4);
    doc.generated_at = get_optional_timestamp(stmt, 5).value_or(
        std::chrono::system_clock::time_point{});
    doc.included_weekdays = deserialize_weekdays(get_text(stmt, 6));

    if (auto set_id = get_optional_text(stmt, 11)) {
        engine::publication_info pub;
        pub.published_by = get_text(stmt, 7);
        pub.published_at = get_optional_timestamp(stmt, 8).value_or(
            std::chrono::system_clock::time_point{});
        pub.publish_date = get_text(stmt, 9);
        pub.publish_time = get_text(stmt, 10);
        pub.published_set_id = *set_id;
        doc.publication = std::move(pub);
    }
    doc.last_edited = get_optional_timestamp(stmt, 12);
    return doc;
}

}  // namespace

rota_repository::rota_repository(sqlite3* db) : db_(db) {}

// =============================================================================
// Writes
// =============================================================================

auto rota_repository::insert(const engine::rota_document& doc)
    -> Result<std::int64_t> {
    transaction txn(db_);
    if (!txn.began()) {
        return Result<std::int64_t>(detail::query_error(db_, "Begin failed"));
    }

    statement stmt(db_,
                   "INSERT INTO rotas (rota_date, week_start, status, "
                   "generated_by, generated_at, included_days, published_by, "
                   "published_at, publish_date, publish_time, published_set_id, "
                   "last_edited) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt.ok()) {
        return Result<std::int64_t>(detail::query_error(db_, "Prepare insert failed"));
    }
    bind_header(stmt, doc, 1);
    if (stmt.step() != SQLITE_DONE) {
        return Result<std::int64_t>(detail::query_error(db_, "Insert rota failed"));
    }

    auto stored = doc;
    stored.id = sqlite3_last_insert_rowid(db_);

    auto children = write_children(stored);
    if (children.is_err()) {
        return Result<std::int64_t>(children.error());
    }
    auto committed = txn.commit();
    if (committed.is_err()) {
        return Result<std::int64_t>(committed.error());
    }
    return stored.id;
}

auto rota_repository::save(const engine::rota_document& doc) -> VoidResult {
    transaction txn(db_);
    if (!txn.began()) {
        return VoidResult(detail::query_error(db_, "Begin failed"));
    }

    statement stmt(db_,
                   "UPDATE rotas SET rota_date = ?, week_start = ?, status = ?, "
                   "generated_by = ?, generated_at = ?, included_days = ?, "
                   "published_by = ?, published_at = ?, publish_date = ?, "
                   "publish_time = ?, published_set_id = ?, last_edited = ? "
                   "WHERE rota_pk = ?;");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare update failed"));
    }
    bind_header(stmt, doc, 1);
    stmt.bind(13, doc.id);
    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Update rota failed"));
    }
    if (sqlite3_changes(db_) == 0) {
        return rota_void_error(error_codes::rota_not_found, "Rota not found",
                               std::to_string(doc.id));
    }

    auto children = write_children(doc);
    if (children.is_err()) {
        return children;
    }
    return txn.commit();
}

auto rota_repository::write_children(const engine::rota_document& doc)
    -> VoidResult {
    for (const char* table : {"rota_assignments", "rota_targets",
                              "rota_conflicts", "rota_cell_text"}) {
        statement del(db_, std::string("DELETE FROM ") + table +
                               " WHERE rota_pk = ?;");
        if (!del.ok()) {
            return VoidResult(detail::query_error(db_, "Prepare delete failed"));
        }
        del.bind(1, doc.id);
        if (del.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Clear child rows failed"));
        }
    }

    statement row_stmt(db_,
                       "INSERT INTO rota_assignments (rota_pk, position, staff_id, "
                       "assignment_type, location, start_time, end_time, category, "
                       "split_shareable, do_not_split) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!row_stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare assignment insert failed"));
    }
    for (std::size_t i = 0; i < doc.assignments.size(); ++i) {
        const auto& row = doc.assignments[i];
        sqlite3_reset(row_stmt.get());
        row_stmt.bind(1, doc.id);
        row_stmt.bind_int(2, static_cast<int>(i));
        row_stmt.bind(3, row.staff_id);
        row_stmt.bind(4, engine::to_string(row.type));
        row_stmt.bind(5, row.location);
        row_stmt.bind(6, row.window.start.to_string());
        row_stmt.bind(7, row.window.end.to_string());
        row_stmt.bind(8, row.category);
        row_stmt.bind_int(9, row.split_shareable ? 1 : 0);
        row_stmt.bind_int(10, row.do_not_split ? 1 : 0);
        if (row_stmt.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Insert assignment failed"));
        }
    }

    statement target_stmt(db_,
                          "INSERT INTO rota_targets (rota_pk, position, "
                          "assignment_type, location, category, start_time, "
                          "end_time, min_staff, ideal_staff, do_not_split) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!target_stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare target insert failed"));
    }
    for (std::size_t i = 0; i < doc.targets.size(); ++i) {
        const auto& target = doc.targets[i];
        sqlite3_reset(target_stmt.get());
        target_stmt.bind(1, doc.id);
        target_stmt.bind_int(2, static_cast<int>(i));
        target_stmt.bind(3, engine::to_string(target.type));
        target_stmt.bind(4, target.location);
        target_stmt.bind(5, target.category);
        target_stmt.bind(6, target.window.start.to_string());
        target_stmt.bind(7, target.window.end.to_string());
        target_stmt.bind_int(8, target.min_staff);
        target_stmt.bind_int(9, target.ideal_staff);
        target_stmt.bind_int(10, target.do_not_split ? 1 : 0);
        if (target_stmt.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Insert target failed"));
        }
    }

    statement conflict_stmt(db_,
                            "INSERT INTO rota_conflicts (rota_pk, position, "
                            "conflict_type, description, severity, location, "
                            "staff_id) VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!conflict_stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare conflict insert failed"));
    }
    for (std::size_t i = 0; i < doc.conflicts.size(); ++i) {
        const auto& c = doc.conflicts[i];
        sqlite3_reset(conflict_stmt.get());
        conflict_stmt.bind(1, doc.id);
        conflict_stmt.bind_int(2, static_cast<int>(i));
        conflict_stmt.bind(3, engine::to_string(c.type));
        conflict_stmt.bind(4, c.description);
        conflict_stmt.bind(5, engine::to_string(c.severity));
        conflict_stmt.bind(6, c.location);
        conflict_stmt.bind(7, c.staff_id);
        if (conflict_stmt.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Insert conflict failed"));
        }
    }

    statement cell_stmt(db_,
                        "INSERT INTO rota_cell_text (rota_pk, cell_type, location, "
                        "cell_date, start_time, end_time, text) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!cell_stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare cell insert failed"));
    }
    for (const auto& [key, text] : doc.cell_text) {
        sqlite3_reset(cell_stmt.get());
        cell_stmt.bind(1, doc.id);
        cell_stmt.bind(2, key.cell_type);
        cell_stmt.bind(3, key.location);
        cell_stmt.bind(4, core::format_date(key.date));
        cell_stmt.bind(5, key.start);
        cell_stmt.bind(6, key.end);
        cell_stmt.bind(7, text);
        if (cell_stmt.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Insert cell text failed"));
        }
    }

    return ok();
}

auto rota_repository::update_status(std::int64_t id, engine::rota_status status)
    -> VoidResult {
    statement stmt(db_, "UPDATE rotas SET status = ? WHERE rota_pk = ?;");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare status update failed"));
    }
    stmt.bind(1, engine::to_string(status));
    stmt.bind(2, id);
    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Status update failed"));
    }
    if (sqlite3_changes(db_) == 0) {
        return rota_void_error(error_codes::rota_not_found, "Rota not found",
                               std::to_string(id));
    }
    return ok();
}

auto rota_repository::mark_week_published(const core::date& week_start,
                                          const engine::publication_info& info)
    -> Result<std::size_t> {
    statement stmt(db_,
                   "UPDATE rotas SET status = 'published', published_by = ?, "
                   "published_at = ?, publish_date = ?, publish_time = ?, "
                   "published_set_id = ? "
                   "WHERE week_start = ? AND status = 'draft';");
    if (!stmt.ok()) {
        return Result<std::size_t>(detail::query_error(db_, "Prepare publish failed"));
    }
    stmt.bind(1, info.published_by);
    stmt.bind(2, core::to_iso8601(info.published_at));
    stmt.bind(3, info.publish_date);
    stmt.bind(4, info.publish_time);
    stmt.bind(5, info.published_set_id);
    stmt.bind(6, core::format_date(week_start));
    if (stmt.step() != SQLITE_DONE) {
        return Result<std::size_t>(detail::query_error(db_, "Publish failed"));
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

auto rota_repository::archive_week(const core::date& week_start)
    -> Result<std::size_t> {
    statement stmt(db_,
                   "UPDATE rotas SET status = 'archived' "
                   "WHERE week_start = ? AND status = 'published';");
    if (!stmt.ok()) {
        return Result<std::size_t>(detail::query_error(db_, "Prepare archive failed"));
    }
    stmt.bind(1, core::format_date(week_start));
    if (stmt.step() != SQLITE_DONE) {
        return Result<std::size_t>(detail::query_error(db_, "Archive failed"));
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

auto rota_repository::execute_delete(const std::string& where_clause,
                                     const std::vector<std::string>& params)
    -> Result<std::size_t> {
    statement stmt(db_, "DELETE FROM rotas WHERE " + where_clause + ";");
    if (!stmt.ok()) {
        return Result<std::size_t>(detail::query_error(db_, "Prepare delete failed"));
    }
    for (std::size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }
    if (stmt.step() != SQLITE_DONE) {
        return Result<std::size_t>(detail::query_error(db_, "Delete failed"));
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

auto rota_repository::delete_drafts_for_week(const core::date& week_start)
    -> Result<std::size_t> {
    return execute_delete("week_start = ? AND status = 'draft'",
                          {core::format_date(week_start)});
}

auto rota_repository::delete_stale_drafts(const core::date& cutoff)
    -> Result<sweep_result> {
    const auto cutoff_text = core::format_date(cutoff);

    statement count_stmt(db_,
                         "SELECT COUNT(*) FROM rotas "
                         "WHERE status = 'draft' AND rota_date < ?;");
    if (!count_stmt.ok()) {
        return Result<sweep_result>(detail::query_error(db_, "Prepare count failed"));
    }
    count_stmt.bind(1, cutoff_text);
    sweep_result result;
    if (count_stmt.step() == SQLITE_ROW) {
        result.total_found =
            static_cast<std::size_t>(sqlite3_column_int64(count_stmt.get(), 0));
    }

    auto deleted = execute_delete("status = 'draft' AND rota_date < ?", {cutoff_text});
    if (deleted.is_err()) {
        return Result<sweep_result>(deleted.error());
    }
    result.deleted = deleted.value();
    return result;
}

auto rota_repository::delete_archived(const std::optional<core::date>& week_start,
                                      const std::optional<core::date>& before)
    -> Result<std::size_t> {
    std::string where = "status = 'archived'";
    std::vector<std::string> params;
    if (week_start) {
        where += " AND week_start = ?";
        params.push_back(core::format_date(*week_start));
    }
    if (before) {
        where += " AND rota_date < ?";
        params.push_back(core::format_date(*before));
    }
    return execute_delete(where, params);
}

auto rota_repository::set_cell_text(std::int64_t id, const engine::cell_key& key,
                                    const std::string& text) -> VoidResult {
    if (text.empty()) {
        statement stmt(db_,
                       "DELETE FROM rota_cell_text WHERE rota_pk = ? AND "
                       "cell_type = ? AND location = ? AND cell_date = ? AND "
                       "start_time = ? AND end_time = ?;");
        if (!stmt.ok()) {
            return VoidResult(detail::query_error(db_, "Prepare cell delete failed"));
        }
        stmt.bind(1, id);
        stmt.bind(2, key.cell_type);
        stmt.bind(3, key.location);
        stmt.bind(4, core::format_date(key.date));
        stmt.bind(5, key.start);
        stmt.bind(6, key.end);
        if (stmt.step() != SQLITE_DONE) {
            return VoidResult(detail::query_error(db_, "Cell delete failed"));
        }
        return ok();
    }

    statement stmt(db_,
                   "INSERT INTO rota_cell_text (rota_pk, cell_type, location, "
                   "cell_date, start_time, end_time, text) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?) "
                   "ON CONFLICT (rota_pk, cell_type, location, cell_date, "
                   "start_time, end_time) DO UPDATE SET text = excluded.text;");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare cell upsert failed"));
    }
    stmt.bind(1, id);
    stmt.bind(2, key.cell_type);
    stmt.bind(3, key.location);
    stmt.bind(4, core::format_date(key.date));
    stmt.bind(5, key.start);
    stmt.bind(6, key.end);
    stmt.bind(7, text);
    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Cell upsert failed"));
    }
    return ok();
}

// =============================================================================
// Reads
// =============================================================================

auto rota_repository::query_documents(const std::string& where_clause,
                                      const std::vector<std::string>& params) const
    -> std::vector<engine::rota_document> {
    std::vector<engine::rota_document> docs;
    statement stmt(db_, std::string(kSelectColumns) + where_clause +
                            " ORDER BY rota_date, rota_pk;");
    if (!stmt.ok()) {
        return docs;
    }
    for (std::size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }
    while (stmt.step() == SQLITE_ROW) {
        if (auto doc = parse_header(stmt.get())) {
            docs.push_back(std::move(*doc));
        }
    }

    // A document whose child rows cannot be read in full is left out, so
    // that a later save never rewrites it from a partial copy.
    std::vector<engine::rota_document> loaded;
    loaded.reserve(docs.size());
    for (auto& doc : docs) {
        if (load_children(doc).is_ok()) {
            loaded.push_back(std::move(doc));
        }
    }
    return loaded;
}

auto rota_repository::load_children(engine::rota_document& doc) const
    -> VoidResult {
    auto unreadable = [&doc](std::string_view table) {
        return rota_void_error(
            error_codes::serialization_error,
            compat::format("Unreadable {} row in rota {}", table, doc.id));
    };

    statement rows(db_,
                   "SELECT staff_id, assignment_type, location, start_time, "
                   "end_time, category, split_shareable, do_not_split "
                   "FROM rota_assignments WHERE rota_pk = ? ORDER BY position;");
    if (!rows.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare assignment select failed"));
    }
    rows.bind(1, doc.id);
    int rc = SQLITE_ROW;
    while ((rc = rows.step()) == SQLITE_ROW) {
        auto* s = rows.get();
        auto type = engine::parse_assignment_type(get_text(s, 1));
        auto start = core::time_of_day::parse(get_text(s, 3));
        auto end = core::time_of_day::parse(get_text(s, 4));
        if (!type || !start || !end) {
            return unreadable("assignment");
        }
        doc.assignments.push_back(engine::assignment{
            get_optional_text(s, 0), *type, get_text(s, 2), doc.date,
            core::time_window{*start, *end}, get_text(s, 5),
            sqlite3_column_int(s, 6) != 0, sqlite3_column_int(s, 7) != 0});
    }
    if (rc != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Read assignments failed"));
    }

    statement targets(db_,
                      "SELECT assignment_type, location, category, start_time, "
                      "end_time, min_staff, ideal_staff, do_not_split "
                      "FROM rota_targets WHERE rota_pk = ? ORDER BY position;");
    if (!targets.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare target select failed"));
    }
    targets.bind(1, doc.id);
    while ((rc = targets.step()) == SQLITE_ROW) {
        auto* s = targets.get();
        auto type = engine::parse_assignment_type(get_text(s, 0));
        auto start = core::time_of_day::parse(get_text(s, 3));
        auto end = core::time_of_day::parse(get_text(s, 4));
        if (!type || !start || !end) {
            return unreadable("target");
        }
        doc.targets.push_back(engine::coverage_target{
            *type, get_text(s, 1), get_text(s, 2), core::time_window{*start, *end},
            sqlite3_column_int(s, 5), sqlite3_column_int(s, 6),
            sqlite3_column_int(s, 7) != 0});
    }
    if (rc != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Read targets failed"));
    }

    statement conflicts(db_,
                        "SELECT conflict_type, description, severity, location, "
                        "staff_id FROM rota_conflicts WHERE rota_pk = ? "
                        "ORDER BY position;");
    if (!conflicts.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare conflict select failed"));
    }
    conflicts.bind(1, doc.id);
    while ((rc = conflicts.step()) == SQLITE_ROW) {
        auto* s = conflicts.get();
        auto type = engine::parse_conflict_type(get_text(s, 0));
        auto severity = engine::parse_conflict_severity(get_text(s, 2));
        if (!type || !severity) {
            return unreadable("conflict");
        }
        doc.conflicts.push_back(engine::conflict{*type, get_text(s, 1), *severity,
                                                 get_text(s, 3),
                                                 get_optional_text(s, 4)});
    }
    if (rc != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Read conflicts failed"));
    }

    statement cells(db_,
                    "SELECT cell_type, location, cell_date, start_time, end_time, "
                    "text FROM rota_cell_text WHERE rota_pk = ?;");
    if (!cells.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare cell select failed"));
    }
    cells.bind(1, doc.id);
    while ((rc = cells.step()) == SQLITE_ROW) {
        auto* s = cells.get();
        auto date = core::parse_date(get_text(s, 2));
        if (!date) {
            return unreadable("cell text");
        }
        engine::cell_key key{get_text(s, 0), get_text(s, 1), *date,
                             get_text(s, 3), get_text(s, 4)};
        doc.cell_text[std::move(key)] = get_text(s, 5);
    }
    if (rc != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Read cell text failed"));
    }
    return ok();
}

auto rota_repository::find_by_id(std::int64_t id) const
    -> std::optional<engine::rota_document> {
    auto docs = query_documents("WHERE rota_pk = ?", {std::to_string(id)});
    if (docs.empty()) return std::nullopt;
    return std::move(docs.front());
}

auto rota_repository::find_by_date(const core::date& date) const
    -> std::vector<engine::rota_document> {
    return query_documents("WHERE rota_date = ?", {core::format_date(date)});
}

auto rota_repository::find_by_week(const core::date& week_start,
                                   std::optional<engine::rota_status> status) const
    -> std::vector<engine::rota_document> {
    if (status) {
        return query_documents("WHERE week_start = ? AND status = ?",
                               {core::format_date(week_start),
                                engine::to_string(*status)});
    }
    return query_documents("WHERE week_start = ?", {core::format_date(week_start)});
}

auto rota_repository::find_by_status(engine::rota_status status) const
    -> std::vector<engine::rota_document> {
    return query_documents("WHERE status = ?", {engine::to_string(status)});
}

auto rota_repository::find_by_published_set(const std::string& set_id) const
    -> std::vector<engine::rota_document> {
    return query_documents("WHERE published_set_id = ?", {set_id});
}

auto rota_repository::count() const -> std::size_t {
    statement stmt(db_, "SELECT COUNT(*) FROM rotas;");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) return 0;
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto rota_repository::count_by_status(engine::rota_status status) const
    -> std::size_t {
    statement stmt(db_, "SELECT COUNT(*) FROM rotas WHERE status = ?;");
    if (!stmt.ok()) return 0;
    stmt.bind(1, engine::to_string(status));
    if (stmt.step() != SQLITE_ROW) return 0;
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace rota::storage
