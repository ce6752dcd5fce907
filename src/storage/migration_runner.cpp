/**
 * @file migration_runner.cpp
 * @brief Rota store schema and migration bookkeeping
 */

#include <rota/storage/migration_runner.hpp>

#include <rota/compat/format.hpp>

#include <sqlite3.h>

namespace rota::storage {

migration_runner::migration_runner() {
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
    migrations_.push_back({2, [this](sqlite3* db) { return migrate_v2(db); }});
    migrations_.push_back({3, [this](sqlite3* db) { return migrate_v3(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return rota_void_error(
            error_codes::database_migration_error,
            compat::format("Target version {} exceeds latest version {}",
                           target_version, LATEST_VERSION));
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);
    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return 0;
    }

    if (sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // NULL on an empty table reads as 0
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<migration_record> {
    std::vector<migration_record> history;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(
            db,
            "SELECT version, description, applied_at FROM schema_version "
            "ORDER BY version;",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);
        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";
        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";
        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )");
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }
    return rota_void_error(
        error_codes::database_migration_error,
        compat::format("Migration for version {} not found", version));
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "INSERT INTO schema_version (version, description) VALUES (?, ?);",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rota_void_error(
            error_codes::database_migration_error,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return rota_void_error(
            error_codes::database_migration_error,
            compat::format("Failed to record migration: {}", sqlite3_errmsg(db)));
    }
    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    std::string statement{sql};
    auto rc = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error_str = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        return rota_void_error(
            error_codes::database_migration_error,
            compat::format("SQL execution failed: {}", error_str));
    }
    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    auto result = execute_sql(db, R"(
        CREATE TABLE rotas (
            rota_pk          INTEGER PRIMARY KEY AUTOINCREMENT,
            rota_date        TEXT NOT NULL,
            week_start       TEXT NOT NULL,
            status           TEXT NOT NULL DEFAULT 'draft'
                             CHECK (status IN ('draft', 'published', 'archived')),
            generated_by     TEXT,
            generated_at     TEXT,
            included_days    TEXT,
            published_by     TEXT,
            published_at     TEXT,
            publish_date     TEXT,
            publish_time     TEXT,
            published_set_id TEXT,
            last_edited      TEXT
        );

        CREATE INDEX idx_rotas_week ON rotas(week_start, status);
        CREATE INDEX idx_rotas_date ON rotas(rota_date);
        CREATE INDEX idx_rotas_status ON rotas(status, rota_date);
        CREATE INDEX idx_rotas_set ON rotas(published_set_id);

        CREATE TABLE rota_assignments (
            rota_pk         INTEGER NOT NULL REFERENCES rotas(rota_pk)
                            ON DELETE CASCADE,
            position        INTEGER NOT NULL,
            staff_id        TEXT,
            assignment_type TEXT NOT NULL,
            location        TEXT NOT NULL,
            start_time      TEXT NOT NULL,
            end_time        TEXT NOT NULL,
            category        TEXT,
            split_shareable INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (rota_pk, position)
        );

        CREATE INDEX idx_assignments_staff ON rota_assignments(staff_id);

        CREATE TABLE rota_targets (
            rota_pk         INTEGER NOT NULL REFERENCES rotas(rota_pk)
                            ON DELETE CASCADE,
            position        INTEGER NOT NULL,
            assignment_type TEXT NOT NULL,
            location        TEXT NOT NULL,
            category        TEXT,
            start_time      TEXT NOT NULL,
            end_time        TEXT NOT NULL,
            min_staff       INTEGER NOT NULL,
            ideal_staff     INTEGER NOT NULL,
            PRIMARY KEY (rota_pk, position)
        );

        CREATE TABLE rota_conflicts (
            rota_pk       INTEGER NOT NULL REFERENCES rotas(rota_pk)
                          ON DELETE CASCADE,
            position      INTEGER NOT NULL,
            conflict_type TEXT NOT NULL,
            description   TEXT NOT NULL,
            severity      TEXT NOT NULL CHECK (severity IN ('warning', 'error')),
            location      TEXT,
            staff_id      TEXT,
            PRIMARY KEY (rota_pk, position)
        );
    )");
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 1, "Rota documents");
}

auto migration_runner::migrate_v2(sqlite3* db) -> VoidResult {
    auto result = execute_sql(db, R"(
        CREATE TABLE rota_configurations (
            week_start         TEXT PRIMARY KEY,
            staff_ids          TEXT NOT NULL DEFAULT '[]',
            clinic_ids         TEXT NOT NULL DEFAULT '[]',
            weekdays           TEXT NOT NULL DEFAULT '[]',
            working_days       TEXT NOT NULL DEFAULT '{}',
            ignored_rules      TEXT NOT NULL DEFAULT '{}',
            last_modified      TEXT NOT NULL,
            last_modified_by   TEXT,
            generated_at       TEXT,
            is_generated       INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE rota_cell_text (
            rota_pk    INTEGER NOT NULL REFERENCES rotas(rota_pk)
                       ON DELETE CASCADE,
            cell_type  TEXT NOT NULL,
            location   TEXT NOT NULL DEFAULT '',
            cell_date  TEXT NOT NULL,
            start_time TEXT NOT NULL,
            end_time   TEXT NOT NULL,
            text       TEXT NOT NULL,
            PRIMARY KEY (rota_pk, cell_type, location, cell_date, start_time, end_time)
        );
    )");
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 2, "Rota configurations and cell text");
}

auto migration_runner::migrate_v3(sqlite3* db) -> VoidResult {
    auto result = execute_sql(db, R"(
        ALTER TABLE rota_assignments
            ADD COLUMN do_not_split INTEGER NOT NULL DEFAULT 0;

        ALTER TABLE rota_targets
            ADD COLUMN do_not_split INTEGER NOT NULL DEFAULT 0;

        ALTER TABLE rota_configurations
            ADD COLUMN extra_unavailability TEXT NOT NULL DEFAULT '{}';
    )");
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 3, "Do-not-split flags and extra unavailability");
}

}  // namespace rota::storage
