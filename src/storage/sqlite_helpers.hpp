/**
 * @file sqlite_helpers.hpp
 * @brief Statement and transaction helpers shared by the repositories
 *
 * Internal to the storage library.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>

#include <rota/compat/format.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rota::storage::detail {

/// Owns a prepared statement
class statement {
public:
    statement(sqlite3* db, std::string_view sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                 &stmt_, nullptr);
    }

    ~statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    auto operator=(const statement&) -> statement& = delete;

    [[nodiscard]] auto ok() const noexcept -> bool { return rc_ == SQLITE_OK; }
    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }
    [[nodiscard]] auto error() const -> std::string { return sqlite3_errmsg(db_); }

    void bind(int idx, std::string_view value) {
        sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
    }

    void bind(int idx, const std::string& value) {
        bind(idx, std::string_view{value});
    }

    void bind(int idx, const char* value) { bind(idx, std::string_view{value}); }

    void bind(int idx, std::int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }

    void bind_int(int idx, int value) { sqlite3_bind_int(stmt_, idx, value); }

    void bind(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind(idx, std::string_view{*value});
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }

    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    [[nodiscard]] auto step() -> int { return sqlite3_step(stmt_); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_ERROR};
};

/**
 * @brief BEGIN on construction, ROLLBACK on destruction unless committed
 */
class transaction {
public:
    explicit transaction(sqlite3* db) : db_(db) {
        began_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr,
                              nullptr) == SQLITE_OK;
    }

    ~transaction() {
        if (began_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    transaction(const transaction&) = delete;
    auto operator=(const transaction&) -> transaction& = delete;

    [[nodiscard]] auto began() const noexcept -> bool { return began_; }

    [[nodiscard]] auto commit() -> VoidResult {
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return rota_void_error(
                error_codes::database_transaction_error,
                compat::format("Commit failed: {}", sqlite3_errmsg(db_)));
        }
        committed_ = true;
        return ok();
    }

private:
    sqlite3* db_;
    bool began_{false};
    bool committed_{false};
};

/// Text column, empty for NULL
[[nodiscard]] inline auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

[[nodiscard]] inline auto get_optional_text(sqlite3_stmt* stmt, int col)
    -> std::optional<std::string> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text(stmt, col);
}

[[nodiscard]] inline auto get_optional_timestamp(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point> {
    auto text = get_optional_text(stmt, col);
    if (!text || text->empty()) return std::nullopt;
    return core::from_iso8601(*text);
}

[[nodiscard]] inline auto query_error(sqlite3* db, std::string_view what)
    -> error_info {
    return error_info{error_codes::database_query_error,
                      compat::format("{}: {}", what, sqlite3_errmsg(db)), "rota"};
}

}  // namespace rota::storage::detail
