/**
 * @file logger_adapter.hpp
 * @brief Logging and rota audit trail on top of logger_system
 *
 * Standard logging goes through kcenon::logger with console and rotating
 * file writers. Rota lifecycle events are additionally appended to a JSON
 * lines audit file (audit.json), one object per event.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/rota";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Generating week {}", week);
 * logger_adapter::log_rota_published("2026-10-12", "2026-10-12-1760000000000", 7, "J. Smith");
 *
 * logger_adapter::shutdown();
 * @endcode
 */

#pragma once

#include <rota/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace rota::integration {

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};

    bool enable_file{true};

    /// Append rota lifecycle events to audit.json
    bool enable_audit_log{true};

    /// Rotate the main log after this many megabytes
    std::size_t max_file_size_mb{20};

    std::size_t max_files{5};

    /// Only "json" is written
    std::string audit_log_format{"json"};

    bool async_mode{true};

    std::size_t buffer_size{8192};
};

/**
 * @brief Static logging facade
 *
 * Calls made before initialize() or after shutdown() are dropped.
 * Thread-safe.
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);
    static void shutdown();
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Rota Audit Trail
    // ─────────────────────────────────────────────────────

    static void log_configuration_saved(const std::string& week_start,
                                        const std::string& modified_by);

    /**
     * @param gaps Unfilled positions across the week
     * @param errors Error-severity conflicts across the week
     */
    static void log_rota_generated(const std::string& week_start,
                                   std::size_t documents, std::size_t gaps,
                                   std::size_t errors,
                                   const std::string& generated_by);

    static void log_rota_published(const std::string& week_start,
                                   const std::string& published_set_id,
                                   std::size_t documents,
                                   const std::string& published_by);

    /// @p scope is a week start or a single rota id
    static void log_rota_archived(const std::string& scope, std::size_t documents);

    static void log_reassignment(const std::string& scope,
                                 const std::string& original_staff,
                                 const std::string& new_staff,
                                 std::size_t dates_updated,
                                 std::size_t dates_failed);

    static void log_drafts_swept(const std::string& cutoff, std::size_t found,
                                 std::size_t deleted);

    static void log_archives_deleted(std::size_t documents);

    /// A request refused before anything was written
    static void log_request_rejected(const std::string& operation,
                                     const std::string& reason);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);
    [[nodiscard]] static auto get_min_level() noexcept -> log_level;
    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace rota::integration
