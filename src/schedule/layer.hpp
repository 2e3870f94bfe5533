#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TimeWindow - one weekday's on-call window ("HH:MM" clock times)
// ---------------------------------------------------------------------------
struct TimeWindow {
    std::string start;
    std::string end;
    bool dummy = false;  // configured but never materialized
};

// ---------------------------------------------------------------------------
// LayerDefinition - one recurring rotation
// ---------------------------------------------------------------------------
struct LayerDefinition {
    std::string id;
    std::string name;
    std::map<std::string, TimeWindow> time_windows;  // keyed by lower-case weekday
    std::vector<std::string> rotation_team;          // order = rotation priority
    bool dummy = false;                              // suppresses every window

    const TimeWindow* window_for(const std::string& weekday) const {
        auto it = time_windows.find(weekday);
        return it == time_windows.end() ? nullptr : &it->second;
    }
};

// ---------------------------------------------------------------------------
// ScheduleConfig - the loaded configuration, layers in declaration order
// ---------------------------------------------------------------------------
struct ScheduleConfig {
    std::string name = "On-Call Schedule";
    std::string description;
    std::optional<std::string> start_date;  // YYYY-MM-DD
    int duration_months = 3;
    std::vector<LayerDefinition> layers;
};
