/**
 * @file rota_database.cpp
 */

#include <rota/storage/rota_database.hpp>

#include <rota/compat/format.hpp>

#include <sqlite3.h>

namespace rota::storage {

auto rota_database::open(std::string_view db_path, const database_config& config)
    -> Result<std::unique_ptr<rota_database>> {
    using result_type = Result<std::unique_ptr<rota_database>>;
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return rota_error<std::unique_ptr<rota_database>>(
            error_codes::database_open_error,
            compat::format("Failed to open database: {}", error_msg));
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return rota_error<std::unique_ptr<rota_database>>(
            error_codes::database_open_error, "Failed to enable foreign keys");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return rota_error<std::unique_ptr<rota_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode");
        }
    }

    // Negative cache_size is in KiB
    auto cache_sql =
        compat::format("PRAGMA cache_size = -{};", config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return rota_error<std::unique_ptr<rota_database>>(
            error_codes::database_open_error, "Failed to set cache size");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance =
        std::unique_ptr<rota_database>(new rota_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return result_type(error_info{
            error_codes::database_migration_error,
            compat::format("Migration failed: {}", migration_result.error().message),
            "rota"});
    }

    return instance;
}

rota_database::rota_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)), rotas_(db), configurations_(db) {}

rota_database::~rota_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto rota_database::schema_version() const -> int {
    return migration_runner_.get_current_version(db_);
}

}  // namespace rota::storage
