/**
 * @file calendar.cpp
 * @brief Implementation of date and time-of-day primitives
 */

#include <rota/core/calendar.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace rota::core {

using namespace std::chrono;

namespace {

constexpr std::array<const char*, 7> kWeekdayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday",
    "Thursday", "Friday", "Saturday"};

auto parse_int(std::string_view text, int& out) -> bool {
    if (text.empty()) return false;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

auto lower(std::string_view text) -> std::string {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

}  // namespace

// =============================================================================
// time_of_day / time_window
// =============================================================================

auto time_of_day::parse(std::string_view text) -> std::optional<time_of_day> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon > 2) {
        return std::nullopt;
    }
    int hours = 0;
    int mins = 0;
    auto minute_part = text.substr(colon + 1);
    if (minute_part.size() != 2 || !parse_int(text.substr(0, colon), hours) ||
        !parse_int(minute_part, mins)) {
        return std::nullopt;
    }
    // 24:00 is accepted as end-of-day
    if (hours < 0 || mins < 0 || mins > 59 || hours > 24 ||
        (hours == 24 && mins != 0)) {
        return std::nullopt;
    }
    return from_hm(hours, mins);
}

auto time_of_day::to_string() const -> std::string {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

auto time_window::to_string() const -> std::string {
    return start.to_string() + "-" + end.to_string();
}

// =============================================================================
// Dates
// =============================================================================

auto parse_date(std::string_view text) -> std::optional<date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parse_int(text.substr(0, 4), y) || !parse_int(text.substr(5, 2), m) ||
        !parse_int(text.substr(8, 2), d)) {
        return std::nullopt;
    }
    date result{year{y}, month{static_cast<unsigned>(m)},
                day{static_cast<unsigned>(d)}};
    if (!result.ok()) return std::nullopt;
    return result;
}

auto format_date(const date& d) -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()),
                  static_cast<unsigned>(d.month()),
                  static_cast<unsigned>(d.day()));
    return buf;
}

auto weekday_of(const date& d) -> std::chrono::weekday {
    return std::chrono::weekday{sys_days{d}};
}

auto add_days(const date& d, int days) -> date {
    return date{sys_days{d} + std::chrono::days{days}};
}

auto subtract_months(const date& d, int months) -> date {
    auto shifted = d.year() / d.month() / 1;
    shifted -= std::chrono::months{months};
    auto last = year_month_day_last{shifted.year(), month_day_last{shifted.month()}};
    auto day_value = std::min(d.day(), last.day());
    return date{shifted.year(), shifted.month(), day_value};
}

auto week_start_of(const date& d) -> date {
    auto wd = weekday_of(d);
    // iso_encoding: Monday=1 .. Sunday=7
    return add_days(d, -static_cast<int>(wd.iso_encoding() - 1));
}

auto is_week_start(const date& d) -> bool {
    return weekday_of(d) == Monday;
}

auto week_dates(const date& week_start) -> std::vector<date> {
    std::vector<date> dates;
    dates.reserve(7);
    for (int i = 0; i < 7; ++i) {
        dates.push_back(add_days(week_start, i));
    }
    return dates;
}

auto weekday_name(std::chrono::weekday wd) -> std::string {
    return kWeekdayNames[wd.c_encoding()];
}

auto parse_weekday(std::string_view text)
    -> std::optional<std::chrono::weekday> {
    auto needle = lower(text);
    for (unsigned i = 0; i < kWeekdayNames.size(); ++i) {
        auto name = lower(kWeekdayNames[i]);
        if (needle == name || needle == name.substr(0, 3)) {
            return std::chrono::weekday{i};
        }
    }
    return std::nullopt;
}

auto today_utc() -> date {
    return date{floor<days>(system_clock::now())};
}

// =============================================================================
// Timestamps
// =============================================================================

auto to_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto secs = floor<seconds>(tp);
    auto ms = duration_cast<milliseconds>(tp - secs).count();
    auto time_t_value = system_clock::to_time_t(secs);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buf);
#endif

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms));
    return buf;
}

auto from_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (text.size() < 20 || text[10] != 'T') return std::nullopt;
    auto d = parse_date(text.substr(0, 10));
    if (!d) return std::nullopt;

    int h = 0;
    int m = 0;
    int s = 0;
    if (text[13] != ':' || text[16] != ':' ||
        !parse_int(text.substr(11, 2), h) ||
        !parse_int(text.substr(14, 2), m) ||
        !parse_int(text.substr(17, 2), s)) {
        return std::nullopt;
    }

    int ms = 0;
    auto rest = text.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        auto z = rest.find('Z');
        if (z == std::string_view::npos || !parse_int(rest.substr(1, z - 1), ms)) {
            return std::nullopt;
        }
        rest = rest.substr(z);
    }
    if (rest != "Z") return std::nullopt;

    return sys_days{*d} + hours{h} + minutes{m} + seconds{s} + milliseconds{ms};
}

auto epoch_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace rota::core
