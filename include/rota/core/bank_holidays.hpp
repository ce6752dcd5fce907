/**
 * @file bank_holidays.hpp
 * @brief English and Welsh public holiday calendar
 *
 * Used to drop bank holidays from the weekdays selected for generation.
 * Substitute days apply when a fixed-date holiday falls on a weekend.
 */

#pragma once

#include <rota/core/calendar.hpp>

#include <string>
#include <vector>

namespace rota::core {

struct bank_holiday {
    date on;
    std::string name;
};

/**
 * @brief Bank holidays for one calendar year, in date order
 */
[[nodiscard]] auto english_bank_holidays(int year) -> std::vector<bank_holiday>;

[[nodiscard]] auto is_bank_holiday(const date& d) -> bool;

/// Western (Gregorian) Easter Sunday
[[nodiscard]] auto easter_sunday(int year) -> date;

}  // namespace rota::core
