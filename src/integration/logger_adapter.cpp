/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging facade and rota audit trail
 */

#include <rota/integration/logger_adapter.hpp>

#include <rota/core/calendar.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace rota::integration {

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                           config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            auto log_path = config.log_directory / "rota.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(), config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }
        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }
        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type, const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);
        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\""
             << core::to_iso8601(std::chrono::system_clock::now()) << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";
        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }
        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level)
        -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Rota Audit Trail
// =============================================================================

void logger_adapter::log_configuration_saved(const std::string& week_start,
                                             const std::string& modified_by) {
    debug("Configuration saved: week={} by={}", week_start, modified_by);
    write_audit_log("CONFIGURATION_SAVED", "success",
                    {{"week_start", week_start}, {"modified_by", modified_by}});
}

void logger_adapter::log_rota_generated(const std::string& week_start,
                                        std::size_t documents, std::size_t gaps,
                                        std::size_t errors,
                                        const std::string& generated_by) {
    if (errors == 0) {
        info("Rota generated: week={} documents={} by {}", week_start, documents,
             generated_by);
    } else {
        warn("Rota generated with {} errors: week={} gaps={} by {}", errors,
             week_start, gaps, generated_by);
    }
    write_audit_log("ROTA_GENERATED", errors == 0 ? "success" : "incomplete",
                    {{"week_start", week_start},
                     {"documents", std::to_string(documents)},
                     {"gaps", std::to_string(gaps)},
                     {"errors", std::to_string(errors)},
                     {"generated_by", generated_by}});
}

void logger_adapter::log_rota_published(const std::string& week_start,
                                        const std::string& published_set_id,
                                        std::size_t documents,
                                        const std::string& published_by) {
    info("Rota published: week={} set={} documents={} by {}", week_start,
         published_set_id, documents, published_by);
    write_audit_log("ROTA_PUBLISHED", "success",
                    {{"week_start", week_start},
                     {"published_set_id", published_set_id},
                     {"documents", std::to_string(documents)},
                     {"published_by", published_by}});
}

void logger_adapter::log_rota_archived(const std::string& scope,
                                       std::size_t documents) {
    info("Rota archived: {} documents={}", scope, documents);
    write_audit_log("ROTA_ARCHIVED", "success",
                    {{"scope", scope}, {"documents", std::to_string(documents)}});
}

void logger_adapter::log_reassignment(const std::string& scope,
                                      const std::string& original_staff,
                                      const std::string& new_staff,
                                      std::size_t dates_updated,
                                      std::size_t dates_failed) {
    if (dates_failed == 0) {
        info("Reassigned {} -> {} ({} scope, {} dates)", original_staff,
             new_staff, scope, dates_updated);
    } else {
        warn("Partial reassignment {} -> {} ({} scope): {} updated, {} failed",
             original_staff, new_staff, scope, dates_updated, dates_failed);
    }
    std::string outcome = dates_failed == 0    ? "success"
                          : dates_updated == 0 ? "failure"
                                               : "partial";
    write_audit_log("ROTA_REASSIGNED", outcome,
                    {{"scope", scope},
                     {"original_staff", original_staff},
                     {"new_staff", new_staff},
                     {"dates_updated", std::to_string(dates_updated)},
                     {"dates_failed", std::to_string(dates_failed)}});
}

void logger_adapter::log_drafts_swept(const std::string& cutoff, std::size_t found,
                                      std::size_t deleted) {
    info("Stale draft sweep: cutoff={} found={} deleted={}", cutoff, found, deleted);
    write_audit_log("DRAFTS_SWEPT", found == deleted ? "success" : "partial",
                    {{"cutoff", cutoff},
                     {"found", std::to_string(found)},
                     {"deleted", std::to_string(deleted)}});
}

void logger_adapter::log_archives_deleted(std::size_t documents) {
    warn("Archived rotas deleted: {}", documents);
    write_audit_log("ARCHIVES_DELETED", "success",
                    {{"documents", std::to_string(documents)}});
}

void logger_adapter::log_request_rejected(const std::string& operation,
                                          const std::string& reason) {
    warn("{} rejected: {}", operation, reason);
    write_audit_log("REQUEST_REJECTED", "failure",
                    {{"operation", operation}, {"reason", reason}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

void logger_adapter::write_audit_log(const std::string& event_type,
                                     const std::string& outcome,
                                     const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warn:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::fatal:
            return "FATAL";
        case log_level::off:
        default:
            return "OFF";
    }
}

}  // namespace rota::integration
