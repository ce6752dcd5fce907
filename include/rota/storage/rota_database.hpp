/**
 * @file rota_database.hpp
 * @brief SQLite-backed document store for rotas and configurations
 */

#pragma once

#include <rota/core/result.hpp>
#include <rota/storage/configuration_repository.hpp>
#include <rota/storage/migration_runner.hpp>
#include <rota/storage/rota_repository.hpp>

#include <memory>
#include <string>
#include <string_view>

struct sqlite3;

namespace rota::storage {

struct database_config {
    /// Write-ahead logging (ignored for ":memory:")
    bool wal_mode{true};

    /// Page cache size in MiB
    int cache_size_mb{16};

    /// Milliseconds to wait on a locked database
    int busy_timeout_ms{5000};
};

/**
 * @brief Owns the SQLite connection and the repositories built on it
 *
 * @code
 * auto db = rota_database::open("rota.db");
 * if (db.is_ok()) {
 *     auto week = db.value()->rotas().find_by_week(week_start);
 * }
 * @endcode
 */
class rota_database {
public:
    /**
     * @brief Open or create a database and apply pending migrations
     * @param db_path File path, or ":memory:"
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config = {})
        -> Result<std::unique_ptr<rota_database>>;

    ~rota_database();

    rota_database(const rota_database&) = delete;
    auto operator=(const rota_database&) -> rota_database& = delete;
    rota_database(rota_database&&) = delete;
    auto operator=(rota_database&&) -> rota_database& = delete;

    [[nodiscard]] auto rotas() noexcept -> rota_repository& { return rotas_; }

    [[nodiscard]] auto configurations() noexcept -> configuration_repository& {
        return configurations_;
    }

    [[nodiscard]] auto schema_version() const -> int;

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

private:
    rota_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    migration_runner migration_runner_;
    rota_repository rotas_;
    configuration_repository configurations_;
};

}  // namespace rota::storage
