#pragma once

#include "schedule/date_range.hpp"
#include "schedule/errors.hpp"
#include "schedule/layer.hpp"
#include "schedule/ordered_map.hpp"
#include "schedule/person_colors.hpp"
#include "schedule/rotation.hpp"
#include "schedule/shift_aggregator.hpp"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BuiltSchedule - output of the full engine run
// ---------------------------------------------------------------------------
struct BuiltSchedule {
    std::string name;
    std::string description;
    DateRange range;
    int layer_count = 0;
    AggregatedSchedule schedule;
    PersonColorMap colors;
    std::optional<NoShiftsProduced> no_shifts;
};

// Per layer: enumerate -> rotate -> materialize; then aggregate and color.
inline BuiltSchedule build_schedule(const ScheduleConfig& config, const DateRange& range) {
    if (config.layers.empty()) {
        throw InvalidConfiguration("No layers defined in configuration file");
    }

    BuiltSchedule built;
    built.name = config.name;
    built.description = config.description;
    built.range = range;
    built.layer_count = static_cast<int>(config.layers.size());

    std::vector<std::vector<ResolvedShift>> per_layer;
    per_layer.reserve(config.layers.size());
    for (size_t i = 0; i < config.layers.size(); ++i) {
        per_layer.push_back(resolve_layer_shifts(config.layers[i], static_cast<int>(i), range));
    }

    built.schedule = aggregate_shifts(per_layer);
    built.colors = PersonColorMap::build(built.schedule);

    if (built.schedule.empty()) {
        built.no_shifts = NoShiftsProduced{
            range.empty() ? "Date range is empty"
                          : "No shifts produced: every layer is dummy, has an empty team, "
                            "or has no active weekday in range"};
    }
    return built;
}

// ---------------------------------------------------------------------------
// ScheduleSummary
// ---------------------------------------------------------------------------
struct ScheduleSummary {
    int total_shifts = 0;
    int unique_people = 0;
    int days_covered = 0;
    int layer_count = 0;
    InsertionOrderedMap<std::string, int> shifts_per_person;
};

inline ScheduleSummary summarize(const BuiltSchedule& built) {
    ScheduleSummary s;
    s.total_shifts = static_cast<int>(built.schedule.size());
    s.unique_people = static_cast<int>(built.colors.size());
    s.days_covered = built.range.days();
    s.layer_count = built.layer_count;
    for (const auto& shift : built.schedule.shifts) {
        ++s.shifts_per_person[shift.person];
    }
    return s;
}
