#pragma once

#include "schedule/date_expression.hpp"
#include "schedule/errors.hpp"
#include "schedule/layer.hpp"
#include "time_utils.hpp"

#include <optional>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// DateRange - [start, end)
// ---------------------------------------------------------------------------
struct DateRange {
    Date start;
    Date end;

    bool empty() const { return end <= start; }
    bool contains(Date d) const { return d >= start && d < end; }
    int days() const { return empty() ? 0 : time_utils::days_between(start, end); }
};

struct RangeDefaults {
    std::optional<std::string> start_date;  // YYYY-MM-DD
    int duration_months = 3;

    static RangeDefaults from(const ScheduleConfig& cfg) {
        return RangeDefaults{cfg.start_date, cfg.duration_months};
    }
};

struct RangeResolution {
    DateRange range;
    std::optional<EmptyRangeWarning> warning;
};

// Explicit override wins, then the configured default, then today (start) or
// start + duration_months (end). An end on or before the start is reported as
// a warning; the range is returned unchanged and yields no shifts downstream.
inline RangeResolution calculate_date_range(const RangeDefaults& defaults,
                                            std::optional<Date> start_override,
                                            std::optional<Date> end_override,
                                            Date today) {
    Date start = today;
    if (start_override) {
        start = *start_override;
    } else if (defaults.start_date) {
        auto parsed = time_utils::parse_iso_date(*defaults.start_date);
        if (!parsed) {
            throw InvalidConfiguration("start_date '" + *defaults.start_date +
                                       "' is not YYYY-MM-DD");
        }
        start = *parsed;
    }

    Date end = start;
    if (end_override) {
        end = *end_override;
    } else {
        try {
            end = time_utils::add_months(start, defaults.duration_months);
        } catch (const std::out_of_range& e) {
            throw InvalidConfiguration("duration_months " +
                                       std::to_string(defaults.duration_months) + " from " +
                                       time_utils::format_date(start) + ": " + e.what());
        }
    }

    RangeResolution res{DateRange{start, end}, std::nullopt};
    if (res.range.empty()) {
        res.warning = EmptyRangeWarning{
            "End date " + time_utils::format_date(end) + " is not after start date " +
            time_utils::format_date(start) + "; the schedule will be empty"};
    }
    return res;
}

inline RangeResolution calculate_date_range(const RangeDefaults& defaults,
                                            std::optional<Date> start_override = std::nullopt,
                                            std::optional<Date> end_override = std::nullopt) {
    return calculate_date_range(defaults, start_override, end_override, time_utils::today());
}

// ---------------------------------------------------------------------------
// Command-line date overrides
// ---------------------------------------------------------------------------
struct RangeOverrides {
    std::optional<Date> start;
    std::optional<Date> end;
};

// The start expression resolves against today. A relative end expression
// resolves against the explicit start when one was given, otherwise today.
inline RangeOverrides resolve_range_arguments(const std::optional<std::string>& start_expr,
                                              const std::optional<std::string>& end_expr,
                                              Date today) {
    RangeOverrides o;
    if (start_expr) o.start = date_expr::resolve(*start_expr, today);
    if (end_expr) o.end = date_expr::resolve(*end_expr, o.start ? *o.start : today);
    return o;
}
