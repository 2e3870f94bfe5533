#pragma once

#include "schedule/date_range.hpp"
#include "schedule/shift_aggregator.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Timeline layout - vertical axis in hours, one horizontal slot per date
// ---------------------------------------------------------------------------
struct TimelineBox {
    double y_start = 0.0;  // hours since midnight
    double y_end = 0.0;
    std::string person;
    std::string layer_name;
};

struct TimelineSlot {
    int x = 0;  // 0-based, contiguous across dates that have shifts
    Date date;
    std::vector<TimelineBox> boxes;
};

struct TimelineLayout {
    int min_hour = 0;   // floor of the earliest start/end
    int max_hour = 0;   // floor of the latest start/end, plus one
    std::vector<TimelineSlot> slots;

    bool empty() const { return slots.empty(); }
    int num_slots() const { return static_cast<int>(slots.size()); }
};

using TimeToHours = std::function<double(const std::string&)>;

// Lays out the shifts whose date falls inside `window`. Dates without shifts
// get no slot. An empty result (layout.empty()) means nothing to render.
inline TimelineLayout compute_timeline_layout(const AggregatedSchedule& schedule,
                                              const DateRange& window,
                                              const TimeToHours& to_hours = time_utils::time_to_hours) {
    TimelineLayout layout;

    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    for (const auto& shift : schedule.shifts) {
        if (!window.contains(shift.date)) continue;

        if (layout.slots.empty() || layout.slots.back().date != shift.date) {
            TimelineSlot slot;
            slot.x = layout.num_slots();
            slot.date = shift.date;
            layout.slots.push_back(std::move(slot));
        }

        TimelineBox box;
        box.y_start = to_hours(shift.start_time);
        box.y_end = to_hours(shift.end_time);
        box.person = shift.person;
        box.layer_name = shift.layer_name;

        lo = std::min({lo, box.y_start, box.y_end});
        hi = std::max({hi, box.y_start, box.y_end});

        layout.slots.back().boxes.push_back(std::move(box));
    }

    if (layout.slots.empty()) return layout;

    layout.min_hour = static_cast<int>(std::floor(lo));
    layout.max_hour = static_cast<int>(std::floor(hi)) + 1;
    return layout;
}
