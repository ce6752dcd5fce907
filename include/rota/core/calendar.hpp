/**
 * @file calendar.hpp
 * @brief Date and time-of-day primitives used throughout the rota engine
 *
 * Dates are plain civil dates (std::chrono::year_month_day) without a time
 * zone; the engine works in a single site-local calendar. Times of day are
 * stored as minutes since midnight and exchanged as "HH:MM" strings.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rota::core {

using date = std::chrono::year_month_day;

// =============================================================================
// Time of day
// =============================================================================

/**
 * @brief Wall-clock time within a day, minute resolution
 */
struct time_of_day {
    int minutes{0};

    [[nodiscard]] static constexpr auto from_hm(int hours, int mins) noexcept
        -> time_of_day {
        return time_of_day{hours * 60 + mins};
    }

    /// Parse "HH:MM" (also accepts "H:MM"); nullopt when malformed
    [[nodiscard]] static auto parse(std::string_view text)
        -> std::optional<time_of_day>;

    /// Format as zero-padded "HH:MM"
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator<=>(const time_of_day&) const = default;
};

/**
 * @brief Half-open interval [start, end) within one day
 */
struct time_window {
    time_of_day start;
    time_of_day end;

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return start < end;
    }

    /// True when the two windows share at least one minute
    [[nodiscard]] auto overlaps(const time_window& other) const noexcept
        -> bool {
        return !(end <= other.start || start >= other.end);
    }

    /// True when @p other lies entirely inside this window
    [[nodiscard]] auto contains(const time_window& other) const noexcept
        -> bool {
        return start <= other.start && other.end <= end;
    }

    [[nodiscard]] auto duration_minutes() const noexcept -> int {
        return end.minutes - start.minutes;
    }

    /// "HH:MM-HH:MM"
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator<=>(const time_window&) const = default;
};

// =============================================================================
// Dates
// =============================================================================

/// Parse "YYYY-MM-DD"; nullopt when malformed or not a real date
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<date>;

/// Format as "YYYY-MM-DD"
[[nodiscard]] auto format_date(const date& d) -> std::string;

[[nodiscard]] auto weekday_of(const date& d) -> std::chrono::weekday;

[[nodiscard]] auto add_days(const date& d, int days) -> date;

/**
 * @brief Subtract calendar months, clamping the day to the target month
 *
 * 2026-05-31 minus 3 months is 2026-02-28.
 */
[[nodiscard]] auto subtract_months(const date& d, int months) -> date;

/// Monday of the week containing @p d
[[nodiscard]] auto week_start_of(const date& d) -> date;

[[nodiscard]] auto is_week_start(const date& d) -> bool;

/// The seven dates Monday..Sunday starting at @p week_start
[[nodiscard]] auto week_dates(const date& week_start) -> std::vector<date>;

/// Full English weekday name ("Monday")
[[nodiscard]] auto weekday_name(std::chrono::weekday wd) -> std::string;

/// Accepts full or three-letter English names, case-insensitive
[[nodiscard]] auto parse_weekday(std::string_view text)
    -> std::optional<std::chrono::weekday>;

/// Today in UTC
[[nodiscard]] auto today_utc() -> date;

// =============================================================================
// Timestamps
// =============================================================================

/// ISO-8601 UTC with milliseconds ("2026-10-17T09:30:00.000Z")
[[nodiscard]] auto to_iso8601(std::chrono::system_clock::time_point tp)
    -> std::string;

/// Parses the output of to_iso8601 (milliseconds optional)
[[nodiscard]] auto from_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

/// Milliseconds since the Unix epoch
[[nodiscard]] auto epoch_millis(std::chrono::system_clock::time_point tp)
    -> std::int64_t;

}  // namespace rota::core
