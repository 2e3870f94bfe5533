#pragma once

#include "time_utils.hpp"

#include <string>

// ---------------------------------------------------------------------------
// ResolvedShift - one materialized on-call assignment. Never dummy.
// ---------------------------------------------------------------------------
struct ResolvedShift {
    Date date;
    std::string layer_name;
    std::string start_time;  // "HH:MM"
    std::string end_time;    // "HH:MM"
    std::string person;
    int layer_index = 0;     // declaration order; tiebreak source only

    // Duration in hours (end - start, same day).
    double hours() const {
        return time_utils::time_to_hours(end_time) - time_utils::time_to_hours(start_time);
    }

    bool operator==(const ResolvedShift&) const = default;
};
