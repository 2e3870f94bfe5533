#pragma once

#include "schedule/date_range.hpp"
#include "schedule/layer.hpp"
#include "time_utils.hpp"

#include <string>
#include <vector>

struct LayerDate {
    Date date;
    std::string weekday;  // lower-case key into LayerDefinition::time_windows
};

// Every date in [start, end) whose weekday has a configured window, in
// chronological order. This order drives rotation indexing.
inline std::vector<LayerDate> enumerate_layer_dates(const LayerDefinition& layer,
                                                    const DateRange& range) {
    std::vector<LayerDate> dates;
    if (layer.time_windows.empty()) return dates;

    for (Date d = range.start; d < range.end; d = time_utils::add_days(d, 1)) {
        std::string key = time_utils::weekday_key(d);
        if (layer.window_for(key)) {
            dates.push_back({d, std::move(key)});
        }
    }
    return dates;
}
