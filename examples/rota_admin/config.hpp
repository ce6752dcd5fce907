/**
 * @file config.hpp
 * @brief Command line configuration for the rota administration tool
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/integration/logger_adapter.hpp>

#include <optional>
#include <string>

namespace rota::admin {

enum class admin_command {
    status,
    publish,
    archive,
    sweep,
    delete_archived,
    holidays
};

struct admin_config {
    std::string db_path{"rota.db"};
    std::string log_dir{"logs"};
    integration::log_level log_level{integration::log_level::info};

    admin_command command{admin_command::status};

    /// status, publish and archive
    core::date week_start;

    /// publish
    std::string published_by;

    /// sweep; the current UTC date when absent
    std::optional<core::date> today;

    /// delete-archived
    std::string confirmation;
    std::optional<core::date> filter_week;
    std::optional<core::date> filter_before;

    /// holidays
    int year{0};

    /**
     * @brief Parse command line arguments
     * @return Configuration, or nullopt after printing help or an error
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[])
        -> std::optional<admin_config>;

    static void print_help();
};

}  // namespace rota::admin
