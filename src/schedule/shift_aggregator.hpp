#pragma once

#include "schedule/shift.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

// ---------------------------------------------------------------------------
// Canonical order: date ascending, then window start ascending. Start times
// are fixed-width "HH:MM", so lexical comparison is chronological. The sort
// is stable: equal keys keep layer-declaration order.
// ---------------------------------------------------------------------------
inline bool canonical_less(const ResolvedShift& a, const ResolvedShift& b) {
    if (a.date != b.date) return a.date < b.date;
    return a.start_time < b.start_time;
}

inline void sort_canonical(std::vector<ResolvedShift>& shifts) {
    std::stable_sort(shifts.begin(), shifts.end(), canonical_less);
}

inline bool is_canonical(const std::vector<ResolvedShift>& shifts) {
    return std::is_sorted(shifts.begin(), shifts.end(), canonical_less);
}

// Row of the grouped-by-date view. separator_before marks the first row of
// every date run except the very first run.
struct ScheduleRow {
    size_t shift_index = 0;
    bool separator_before = false;
};

struct DateGroup {
    Date date;
    size_t first = 0;  // index into AggregatedSchedule::shifts
    size_t count = 0;
};

// ---------------------------------------------------------------------------
// AggregatedSchedule - every layer's shifts in canonical order
// ---------------------------------------------------------------------------
struct AggregatedSchedule {
    std::vector<ResolvedShift> shifts;

    size_t size() const { return shifts.size(); }
    bool empty() const { return shifts.empty(); }

    std::vector<ScheduleRow> rows() const {
        std::vector<ScheduleRow> out;
        out.reserve(shifts.size());
        for (size_t i = 0; i < shifts.size(); ++i) {
            bool boundary = i > 0 && shifts[i].date != shifts[i - 1].date;
            out.push_back({i, boundary});
        }
        return out;
    }

    std::vector<DateGroup> date_groups() const {
        std::vector<DateGroup> groups;
        for (size_t i = 0; i < shifts.size(); ++i) {
            if (groups.empty() || groups.back().date != shifts[i].date) {
                groups.push_back({shifts[i].date, i, 0});
            }
            ++groups.back().count;
        }
        return groups;
    }
};

// Concatenate per-layer shift lists (in layer-declaration order) and sort.
inline AggregatedSchedule aggregate_shifts(const std::vector<std::vector<ResolvedShift>>& per_layer) {
    AggregatedSchedule schedule;
    for (const auto& layer_shifts : per_layer) {
        schedule.shifts.insert(schedule.shifts.end(), layer_shifts.begin(), layer_shifts.end());
    }
    sort_canonical(schedule.shifts);
    return schedule;
}
