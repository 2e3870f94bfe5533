#pragma once

#include "schedule/errors.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Date expression grammar
//
//   today            -> reference date
//   +N | +Nd         -> N days after reference
//   +Nw              -> N weeks after reference
//   +Nm              -> N calendar months after reference (day clamped)
//   +Ny              -> N calendar years after reference (day clamped)
//   YYYY-MM-DD       -> absolute date
//
// Input is trimmed and case-insensitive.
// ---------------------------------------------------------------------------
namespace date_expr {

// Longer amounts are not an expression; shorter ones that still leave years
// 1..9999 are rejected by the calendar arithmetic.
constexpr size_t MAX_AMOUNT_DIGITS = 6;

inline std::string normalize(const std::string& raw) {
    auto first = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(raw.rbegin(), raw.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    std::string s = (first < last) ? std::string(first, last) : std::string();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::optional<Date> resolve_relative(const std::string& s, Date reference) {
    if (s.size() < 2 || s[0] != '+') return std::nullopt;

    size_t i = 1;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    size_t digits = i - 1;
    if (digits == 0 || digits > MAX_AMOUNT_DIGITS) return std::nullopt;

    char unit = 'd';
    if (i < s.size()) {
        if (i + 1 != s.size()) return std::nullopt;
        unit = s[i];
    }

    long long amount = std::stoll(s.substr(1, digits));
    try {
        switch (unit) {
            case 'd': return time_utils::add_days(reference, amount);
            case 'w': return time_utils::add_days(reference, 7 * amount);
            case 'm': return time_utils::add_months(reference, amount);
            case 'y': return time_utils::add_years(reference, amount);
            default:  return std::nullopt;
        }
    } catch (const std::out_of_range&) {
        throw InvalidDateExpression(s);
    }
}

// Resolve an expression against an explicit reference date.
inline Date resolve(const std::string& expression, Date reference) {
    std::string s = normalize(expression);

    if (s == "today") return reference;

    if (auto rel = resolve_relative(s, reference)) return *rel;

    if (auto abs = time_utils::parse_iso_date(s)) return *abs;

    throw InvalidDateExpression(s);
}

// Resolve against today's date (local midnight).
inline Date resolve(const std::string& expression) {
    return resolve(expression, time_utils::today());
}

}  // namespace date_expr
