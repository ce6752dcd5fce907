/**
 * @file migration_runner_test.cpp
 * @brief Unit tests for the rota schema migrations
 */

#include <catch2/catch_test_macros.hpp>

#include <rota/storage/migration_runner.hpp>

#include <sqlite3.h>

#include <stdexcept>
#include <string>

using namespace rota::storage;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto exists(const char* type, const char* name) const -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        auto rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

    [[nodiscard]] auto has_column(const std::string& table,
                                  const std::string& column) const -> bool {
        const auto sql = "PRAGMA table_info(" + table + ");";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bool found = false;
        while (!found && sqlite3_step(stmt) == SQLITE_ROW) {
            const auto* name =
                reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            found = name != nullptr && column == name;
        }
        sqlite3_finalize(stmt);
        return found;
    }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

// ============================================================================
// Version Tracking
// ============================================================================

TEST_CASE("migration_runner initial state", "[migration][version]") {
    test_database db;
    migration_runner runner;

    CHECK(runner.get_current_version(db.get()) == 0);
    CHECK(runner.needs_migration(db.get()));
    CHECK(runner.get_latest_version() == 3);
    CHECK(runner.get_history(db.get()).empty());
}

TEST_CASE("migration_runner applies every version", "[migration][execute]") {
    test_database db;
    migration_runner runner;

    REQUIRE(runner.run_migrations(db.get()).is_ok());
    CHECK(runner.get_current_version(db.get()) == 3);
    CHECK_FALSE(runner.needs_migration(db.get()));

    SECTION("document tables") {
        CHECK(db.exists("table", "rotas"));
        CHECK(db.exists("table", "rota_assignments"));
        CHECK(db.exists("table", "rota_targets"));
        CHECK(db.exists("table", "rota_conflicts"));
        CHECK(db.exists("index", "idx_rotas_week"));
        CHECK(db.exists("index", "idx_rotas_set"));
    }

    SECTION("configuration and cell text tables") {
        CHECK(db.exists("table", "rota_configurations"));
        CHECK(db.exists("table", "rota_cell_text"));
    }

    SECTION("do-not-split and extra unavailability columns") {
        CHECK(db.has_column("rota_assignments", "do_not_split"));
        CHECK(db.has_column("rota_targets", "do_not_split"));
        CHECK(db.has_column("rota_configurations", "extra_unavailability"));
    }

    SECTION("history records each version") {
        auto history = runner.get_history(db.get());
        REQUIRE(history.size() == 3);
        CHECK(history[0].version == 1);
        CHECK(history[1].version == 2);
        CHECK(history[2].version == 3);
        CHECK_FALSE(history[0].description.empty());
    }

    SECTION("running again is a no-op") {
        CHECK(runner.run_migrations(db.get()).is_ok());
        CHECK(runner.get_history(db.get()).size() == 3);
    }
}

TEST_CASE("migration_runner stops at a target version", "[migration][execute]") {
    test_database db;
    migration_runner runner;

    REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());
    CHECK(runner.get_current_version(db.get()) == 1);
    CHECK(db.exists("table", "rotas"));
    CHECK_FALSE(db.exists("table", "rota_configurations"));

    REQUIRE(runner.run_migrations_to(db.get(), 2).is_ok());
    CHECK(db.exists("table", "rota_configurations"));
    CHECK_FALSE(db.has_column("rota_assignments", "do_not_split"));

    REQUIRE(runner.run_migrations(db.get()).is_ok());
    CHECK(db.has_column("rota_assignments", "do_not_split"));

    SECTION("an unknown target is refused") {
        CHECK(runner.run_migrations_to(db.get(), 99).is_err());
    }
}
