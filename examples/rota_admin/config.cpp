/**
 * @file config.cpp
 * @brief Argument parsing for the rota administration tool
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>

namespace rota::admin {

namespace {

auto parse_level(std::string_view level) -> std::optional<integration::log_level> {
    using integration::log_level;
    if (level == "trace") return log_level::trace;
    if (level == "debug") return log_level::debug;
    if (level == "info") return log_level::info;
    if (level == "warn" || level == "warning") return log_level::warn;
    if (level == "error") return log_level::error;
    if (level == "off") return log_level::off;
    return std::nullopt;
}

auto parse_date_arg(std::string_view option, const char* value)
    -> std::optional<core::date> {
    auto date = core::parse_date(value);
    if (!date) {
        std::cerr << "Error: " << option << " expects YYYY-MM-DD, got " << value
                  << "\n";
    }
    return date;
}

}  // namespace

void admin_config::print_help() {
    std::cout << R"(
Rota Admin - pharmacy rota lifecycle maintenance

Usage: rota_admin [OPTIONS] <command> [ARGS]

Commands:
  status <week>                   Show the lifecycle state of a week
  publish <week> --by <name>      Publish the drafts of a week
  archive <week>                  Archive a published week
  sweep [--today <date>]          Delete drafts older than two months
  delete-archived --confirm <token> [--week <week>] [--before <date>]
                                  Permanently delete archived rotas
  holidays <year>                 List English bank holidays

Options:
  --db <path>             SQLite database path (default: ./rota.db)
  --log-dir <dir>         Log directory (default: ./logs)
  --log-level <level>     trace, debug, info, warn, error, off (default: info)
  --help, -h              Show this help message

Weeks and dates are written YYYY-MM-DD; a week is named by its Monday.

Examples:
  rota_admin status 2024-03-04
  rota_admin publish 2024-03-04 --by "Chief Pharmacist"
  rota_admin --db /data/rota.db sweep
  rota_admin delete-archived --confirm CONFIRM_DELETE_ARCHIVED_ROTAS --before 2023-01-01

)";
}

auto admin_config::parse_args(int argc, char* argv[]) -> std::optional<admin_config> {
    admin_config config;
    std::optional<std::string_view> command;
    std::optional<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return std::nullopt;
            }
            const char* value = argv[++i];

            if (arg == "--db") {
                config.db_path = value;
            } else if (arg == "--log-dir") {
                config.log_dir = value;
            } else if (arg == "--log-level") {
                auto level = parse_level(value);
                if (!level) {
                    std::cerr << "Error: Invalid log level: " << value << "\n";
                    return std::nullopt;
                }
                config.log_level = *level;
            } else if (arg == "--by") {
                config.published_by = value;
            } else if (arg == "--today") {
                config.today = parse_date_arg(arg, value);
                if (!config.today) return std::nullopt;
            } else if (arg == "--confirm") {
                config.confirmation = value;
            } else if (arg == "--week") {
                config.filter_week = parse_date_arg(arg, value);
                if (!config.filter_week) return std::nullopt;
            } else if (arg == "--before") {
                config.filter_before = parse_date_arg(arg, value);
                if (!config.filter_before) return std::nullopt;
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information\n";
                return std::nullopt;
            }
            continue;
        }

        if (!command) {
            command = arg;
        } else if (!positional) {
            positional = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!command) {
        print_help();
        return std::nullopt;
    }

    auto need_week = [&]() -> bool {
        if (!positional) {
            std::cerr << "Error: " << *command << " requires a week\n";
            return false;
        }
        auto week = core::parse_date(*positional);
        if (!week) {
            std::cerr << "Error: Invalid week: " << *positional << "\n";
            return false;
        }
        config.week_start = *week;
        return true;
    };

    if (*command == "status") {
        config.command = admin_command::status;
        if (!need_week()) return std::nullopt;
    } else if (*command == "publish") {
        config.command = admin_command::publish;
        if (!need_week()) return std::nullopt;
        if (config.published_by.empty()) {
            std::cerr << "Error: publish requires --by <name>\n";
            return std::nullopt;
        }
    } else if (*command == "archive") {
        config.command = admin_command::archive;
        if (!need_week()) return std::nullopt;
    } else if (*command == "sweep") {
        config.command = admin_command::sweep;
    } else if (*command == "delete-archived") {
        config.command = admin_command::delete_archived;
        if (config.confirmation.empty()) {
            std::cerr << "Error: delete-archived requires --confirm <token>\n";
            return std::nullopt;
        }
    } else if (*command == "holidays") {
        config.command = admin_command::holidays;
        if (!positional) {
            std::cerr << "Error: holidays requires a year\n";
            return std::nullopt;
        }
        try {
            config.year = std::stoi(std::string(*positional));
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid year: " << *positional << "\n";
            return std::nullopt;
        }
    } else {
        std::cerr << "Error: Unknown command: " << *command << "\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace rota::admin
