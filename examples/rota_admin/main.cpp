/**
 * @file main.cpp
 * @brief Entry point for the rota administration tool
 *
 * Runs lifecycle maintenance against a rota database: publishing and
 * archiving weeks, the stale-draft sweep and archive deletion.
 *
 * Usage:
 *   rota_admin [OPTIONS] <command> [ARGS]
 *
 * Exit codes:
 *   0  Success
 *   1  Invalid arguments
 *   2  Database error
 *   3  Operation refused
 */

#include "config.hpp"

#include <rota/core/bank_holidays.hpp>
#include <rota/storage/rota_database.hpp>
#include <rota/workflow/rota_lifecycle_manager.hpp>

#include <iostream>

namespace {

using rota::admin::admin_command;
using rota::admin::admin_config;

auto report(const rota::error_info& error) -> int {
    std::cerr << "Error: " << error.message << " [" << error.code << "]\n";
    return 3;
}

auto run(const admin_config& config, rota::storage::rota_database& db) -> int {
    rota::workflow::rota_lifecycle_manager lifecycle(db);

    switch (config.command) {
        case admin_command::status: {
            auto docs = db.rotas().find_by_week(config.week_start);
            std::cout << "Week " << rota::core::format_date(config.week_start)
                      << ": " << to_string(lifecycle.state_of(config.week_start))
                      << "\n";
            for (const auto& doc : docs) {
                std::cout << "  " << rota::core::format_date(doc.date) << "  "
                          << to_string(doc.status) << "  "
                          << doc.assignments.size() << " rows, "
                          << doc.conflicts.size() << " conflicts";
                if (doc.publication) {
                    std::cout << "  set " << doc.publication->published_set_id;
                }
                std::cout << "\n";
            }
            return 0;
        }
        case admin_command::publish: {
            auto published = lifecycle.publish(config.week_start, config.published_by);
            if (published.is_err()) return report(published.error());
            std::cout << "Published as " << published.value().published_set_id
                      << "\n";
            return 0;
        }
        case admin_command::archive: {
            auto archived = lifecycle.archive_week(config.week_start);
            if (archived.is_err()) return report(archived.error());
            std::cout << "Archived " << archived.value() << " rotas\n";
            return 0;
        }
        case admin_command::sweep: {
            auto today = config.today.value_or(rota::core::today_utc());
            auto swept = lifecycle.sweep_stale_drafts(today);
            if (swept.is_err()) return report(swept.error());
            std::cout << "Drafts before "
                      << rota::core::format_date(lifecycle.retention_cutoff(today))
                      << ": " << swept.value().total_found << " found, "
                      << swept.value().deleted << " deleted\n";
            return 0;
        }
        case admin_command::delete_archived: {
            auto deleted = lifecycle.delete_archived(
                config.confirmation, config.filter_week, config.filter_before);
            if (deleted.is_err()) return report(deleted.error());
            std::cout << "Deleted " << deleted.value() << " archived rotas\n";
            return 0;
        }
        case admin_command::holidays:
            break;
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = admin_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    if (config->command == admin_command::holidays) {
        for (const auto& holiday : rota::core::english_bank_holidays(config->year)) {
            std::cout << rota::core::format_date(holiday.on) << "  " << holiday.name
                      << "\n";
        }
        return 0;
    }

    rota::integration::logger_config log_config;
    log_config.log_directory = config->log_dir;
    log_config.min_level = config->log_level;
    log_config.enable_console = false;
    rota::integration::logger_adapter::initialize(log_config);

    auto db = rota::storage::rota_database::open(config->db_path);
    if (db.is_err()) {
        std::cerr << "Failed to open database " << config->db_path << ": "
                  << db.error().message << "\n";
        rota::integration::logger_adapter::shutdown();
        return 2;
    }

    auto code = run(*config, *db.value());
    rota::integration::logger_adapter::shutdown();
    return code;
}
