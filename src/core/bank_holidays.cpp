/**
 * @file bank_holidays.cpp
 * @brief English bank holiday rules
 */

#include <rota/core/bank_holidays.hpp>

#include <algorithm>

namespace rota::core {

using namespace std::chrono;

namespace {

auto first_weekday_of(int y, unsigned m, weekday wd) -> date {
    return date{sys_days{year{y} / month{m} / wd[1]}};
}

auto last_weekday_of(int y, unsigned m, weekday wd) -> date {
    return date{sys_days{year{y} / month{m} / wd[last]}};
}

/// Saturday and Sunday holidays move to the following Monday
auto substitute(const date& d) -> date {
    auto wd = weekday_of(d);
    if (wd == Saturday) return add_days(d, 2);
    if (wd == Sunday) return add_days(d, 1);
    return d;
}

}  // namespace

auto easter_sunday(int y) -> date {
    // Anonymous Gregorian algorithm (Meeus/Jones/Butcher)
    int a = y % 19;
    int b = y / 100;
    int c = y % 100;
    int d = b / 4;
    int e = b % 4;
    int f = (b + 8) / 25;
    int g = (b - f + 1) / 3;
    int h = (19 * a + b - d - g + 15) % 30;
    int i = c / 4;
    int k = c % 4;
    int l = (32 + 2 * e + 2 * i - h - k) % 7;
    int m = (a + 11 * h + 22 * l) / 451;
    int mon = (h + l - 7 * m + 114) / 31;
    int dd = ((h + l - 7 * m + 114) % 31) + 1;
    return date{year{y}, month{static_cast<unsigned>(mon)},
                day{static_cast<unsigned>(dd)}};
}

auto english_bank_holidays(int y) -> std::vector<bank_holiday> {
    std::vector<bank_holiday> holidays;

    holidays.push_back({substitute(date{year{y}, January, day{1}}),
                        "New Year's Day"});

    auto easter = easter_sunday(y);
    holidays.push_back({add_days(easter, -2), "Good Friday"});
    holidays.push_back({add_days(easter, 1), "Easter Monday"});

    holidays.push_back({first_weekday_of(y, 5, Monday), "Early May bank holiday"});
    holidays.push_back({last_weekday_of(y, 5, Monday), "Spring bank holiday"});
    holidays.push_back({last_weekday_of(y, 8, Monday), "Summer bank holiday"});

    // Boxing Day is pushed past a substituted Christmas Day
    date christmas{year{y}, December, day{25}};
    date boxing{year{y}, December, day{26}};
    auto christmas_wd = weekday_of(christmas);
    if (christmas_wd == Saturday) {
        holidays.push_back({add_days(christmas, 2), "Christmas Day"});
        holidays.push_back({add_days(boxing, 2), "Boxing Day"});
    } else if (christmas_wd == Sunday) {
        holidays.push_back({add_days(christmas, 2), "Christmas Day"});
        holidays.push_back({add_days(boxing, 0), "Boxing Day"});
    } else if (christmas_wd == Friday) {
        holidays.push_back({christmas, "Christmas Day"});
        holidays.push_back({add_days(boxing, 2), "Boxing Day"});
    } else {
        holidays.push_back({christmas, "Christmas Day"});
        holidays.push_back({boxing, "Boxing Day"});
    }

    std::sort(holidays.begin(), holidays.end(),
              [](const bank_holiday& lhs, const bank_holiday& rhs) {
                  return sys_days{lhs.on} < sys_days{rhs.on};
              });
    return holidays;
}

auto is_bank_holiday(const date& d) -> bool {
    auto holidays = english_bank_holidays(static_cast<int>(d.year()));
    return std::any_of(holidays.begin(), holidays.end(),
                       [&](const bank_holiday& h) { return h.on == d; });
}

}  // namespace rota::core
