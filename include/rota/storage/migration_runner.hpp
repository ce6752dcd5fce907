/**
 * @file migration_runner.hpp
 * @brief Versioned schema migrations for the rota document store
 */

#pragma once

#include <rota/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;

namespace rota::storage {

/**
 * @brief A schema version that has been applied
 */
struct migration_record {
    int version{0};
    std::string description;
    std::string applied_at;
};

using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies pending schema migrations in order
 *
 * The current version is tracked in the schema_version table. Each
 * migration runs in its own transaction and is rolled back on failure.
 *
 * Not thread-safe.
 *
 * @code
 * migration_runner runner;
 * if (runner.needs_migration(db)) {
 *     auto result = runner.run_migrations(db);
 * }
 * @endcode
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    /// 0 when no migration has been applied
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;
    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;
    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    /// Rota documents, assignments, targets and conflicts
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    /// Generation configurations and free-text cell overrides
    [[nodiscard]] auto migrate_v2(sqlite3* db) -> VoidResult;

    /// Do-not-split flags on rows and targets, extra unavailability
    [[nodiscard]] auto migrate_v3(sqlite3* db) -> VoidResult;

    static constexpr int LATEST_VERSION = 3;

    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace rota::storage
