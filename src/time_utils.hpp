#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Calendar-date and clock-time utilities. All values are naive local time.
// ---------------------------------------------------------------------------
using Date = std::chrono::sys_days;

namespace time_utils {

constexpr int MINUTES_PER_HOUR = 60;

inline Date make_date(int y, unsigned m, unsigned d) {
    return Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

// Strict YYYY-MM-DD (month and day may be given with one digit).
inline std::optional<Date> parse_iso_date(const std::string& s) {
    int y = 0;
    unsigned m = 0, d = 0;
    int consumed = 0;
    if (s.size() < 8 || s.size() > 10) return std::nullopt;
    if (s[4] != '-') return std::nullopt;
    for (char c : s) {
        if (c != '-' && (c < '0' || c > '9')) return std::nullopt;
    }
    if (std::sscanf(s.c_str(), "%4d-%2u-%2u%n", &y, &m, &d, &consumed) != 3) return std::nullopt;
    if (static_cast<size_t>(consumed) != s.size()) return std::nullopt;

    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                    std::chrono::day{d}};
    if (!ymd.ok()) return std::nullopt;
    return Date{ymd};
}

inline std::string format_date(Date date) {
    std::chrono::year_month_day ymd{date};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

// YYYYMMDD, as used in iCalendar timestamps.
inline std::string format_compact_date(Date date) {
    std::chrono::year_month_day ymd{date};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02u%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

// Lower-case weekday name, the key used by layer time windows.
inline std::string weekday_key(Date date) {
    static const char* KEYS[] = {"sunday", "monday", "tuesday", "wednesday",
                                 "thursday", "friday", "saturday"};
    return KEYS[std::chrono::weekday{date}.c_encoding()];
}

inline std::string weekday_name(Date date) {
    static const char* NAMES[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                  "Thursday", "Friday", "Saturday"};
    return NAMES[std::chrono::weekday{date}.c_encoding()];
}

inline std::string weekday_abbrev(Date date) {
    return weekday_name(date).substr(0, 3);
}

inline bool is_weekday_key(const std::string& key) {
    return key == "monday" || key == "tuesday" || key == "wednesday" ||
           key == "thursday" || key == "friday" || key == "saturday" ||
           key == "sunday";
}

// Calendar arithmetic stays within years 1..9999; anything outside throws
// std::out_of_range.
constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

inline void require_year_in_range(long long year) {
    if (year < MIN_YEAR || year > MAX_YEAR) {
        throw std::out_of_range("year " + std::to_string(year) + " is out of range");
    }
}

inline Date add_days(Date date, long long days) {
    Date target = date + std::chrono::days{days};
    require_year_in_range(static_cast<int>(std::chrono::year_month_day{target}.year()));
    return target;
}

// Calendar-month addition; the day of month is clamped to the last day of
// the target month (Jan 31 + 1 month = Feb 28/29).
inline Date add_months(Date date, long long months) {
    std::chrono::year_month_day ymd{date};
    long long index = static_cast<long long>(static_cast<int>(ymd.year())) * 12 +
                      (static_cast<unsigned>(ymd.month()) - 1) + months;
    long long year = index >= 0 ? index / 12 : (index - 11) / 12;
    require_year_in_range(year);
    unsigned month = static_cast<unsigned>(index - year * 12) + 1;

    std::chrono::year_month_day target{std::chrono::year{static_cast<int>(year)},
                                       std::chrono::month{month}, ymd.day()};
    if (!target.ok()) {
        target = std::chrono::year_month_day{
            std::chrono::year_month_day_last{target.year(),
                                             std::chrono::month_day_last{target.month()}}};
    }
    return Date{target};
}

inline Date add_years(Date date, long long years) {
    return add_months(date, 12 * years);
}

inline int days_between(Date start, Date end) {
    return static_cast<int>((end - start).count());
}

// Current local date at midnight.
inline Date today() {
    std::time_t now = std::time(nullptr);
    struct tm local_tm = {};
    localtime_r(&now, &local_tm);
    return make_date(local_tm.tm_year + 1900,
                     static_cast<unsigned>(local_tm.tm_mon + 1),
                     static_cast<unsigned>(local_tm.tm_mday));
}

// Local wall-clock timestamp formatted with strftime.
inline std::string now_string(const char* fmt) {
    std::time_t now = std::time(nullptr);
    struct tm local_tm = {};
    localtime_r(&now, &local_tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &local_tm);
    return buf;
}

// "HH:MM" -> minutes since midnight, or nullopt when malformed.
inline std::optional<int> parse_clock_minutes(const std::string& s) {
    if (s.size() != 5 || s[2] != ':') return std::nullopt;
    for (size_t i : {0u, 1u, 3u, 4u}) {
        if (s[i] < '0' || s[i] > '9') return std::nullopt;
    }
    int h = (s[0] - '0') * 10 + (s[1] - '0');
    int m = (s[3] - '0') * 10 + (s[4] - '0');
    if (h > 24 || m > 59 || (h == 24 && m != 0)) return std::nullopt;
    return h * MINUTES_PER_HOUR + m;
}

// "HH:MM" -> hours + minutes / 60 (continuous value for layout).
inline double time_to_hours(const std::string& s) {
    auto minutes = parse_clock_minutes(s);
    if (!minutes) return 0.0;
    return static_cast<double>(*minutes) / static_cast<double>(MINUTES_PER_HOUR);
}

}  // namespace time_utils
