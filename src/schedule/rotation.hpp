#pragma once

#include "schedule/date_range.hpp"
#include "schedule/layer.hpp"
#include "schedule/layer_dates.hpp"
#include "schedule/shift.hpp"

#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Rotation assignment
//
// The person at enumerated position i is team[i % team.size()]. Suppression
// (layer-wide dummy or weekday-window dummy) is decided after assignment, so
// a suppressed slot still consumes its rotation position: later real dates
// keep the cadence they would have had without placeholders.
// ---------------------------------------------------------------------------
enum class SlotState { ACTIVE, SUPPRESSED };

struct RotationSlot {
    LayerDate entry;
    size_t position = 0;
    std::string person;
    SlotState state = SlotState::ACTIVE;
};

inline SlotState evaluate_slot(const LayerDefinition& layer, const std::string& weekday) {
    if (layer.dummy) return SlotState::SUPPRESSED;
    const TimeWindow* window = layer.window_for(weekday);
    if (window == nullptr || window->dummy) return SlotState::SUPPRESSED;
    return SlotState::ACTIVE;
}

// One slot per enumerated date. Empty team -> no slots.
inline std::vector<RotationSlot> assign_rotation(const LayerDefinition& layer,
                                                 const std::vector<LayerDate>& dates) {
    std::vector<RotationSlot> slots;
    const auto& team = layer.rotation_team;
    if (team.empty()) return slots;

    slots.reserve(dates.size());
    size_t position = 0;
    for (const auto& entry : dates) {
        RotationSlot slot;
        slot.entry = entry;
        slot.position = position;
        slot.person = team[position % team.size()];
        slot.state = evaluate_slot(layer, entry.weekday);
        slots.push_back(std::move(slot));
        ++position;
    }
    return slots;
}

inline std::vector<ResolvedShift> materialize_shifts(const LayerDefinition& layer,
                                                     int layer_index,
                                                     const std::vector<RotationSlot>& slots) {
    std::vector<ResolvedShift> shifts;
    for (const auto& slot : slots) {
        if (slot.state == SlotState::SUPPRESSED) continue;
        const TimeWindow* window = layer.window_for(slot.entry.weekday);
        ResolvedShift s;
        s.date = slot.entry.date;
        s.layer_name = layer.name;
        s.start_time = window->start;
        s.end_time = window->end;
        s.person = slot.person;
        s.layer_index = layer_index;
        shifts.push_back(std::move(s));
    }
    return shifts;
}

// Enumerate -> assign -> materialize for a single layer.
inline std::vector<ResolvedShift> resolve_layer_shifts(const LayerDefinition& layer,
                                                       int layer_index,
                                                       const DateRange& range) {
    auto dates = enumerate_layer_dates(layer, range);
    auto slots = assign_rotation(layer, dates);
    return materialize_shifts(layer, layer_index, slots);
}
