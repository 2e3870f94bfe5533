#pragma once

#include "schedule/ordered_map.hpp"
#include "schedule/shift_aggregator.hpp"

#include <array>
#include <string>

// Hex RGB tokens; reused cyclically once there are more people than entries.
constexpr std::array<const char*, 15> PERSON_PALETTE = {
    "E8F5E9", "E3F2FD", "FFF3E0", "FCE4EC", "F3E5F5",
    "E0F2F1", "FFF9C4", "FFE0B2", "F8BBD0", "D1C4E9",
    "C8E6C9", "BBDEFB", "FFE0B2", "F8BBD0", "E1BEE7"
};

constexpr const char* UNKNOWN_PERSON_COLOR = "CCCCCC";

// ---------------------------------------------------------------------------
// PersonColorMap - person -> color, in first-appearance order
// ---------------------------------------------------------------------------
class PersonColorMap {
public:
    PersonColorMap() = default;

    static PersonColorMap build(const AggregatedSchedule& schedule) {
        PersonColorMap map;
        for (const auto& shift : schedule.shifts) {
            map.add(shift.person);
        }
        return map;
    }

    const std::string& add(const std::string& person) {
        if (const auto* existing = colors_.find(person)) return *existing;
        std::string color = PERSON_PALETTE[colors_.size() % PERSON_PALETTE.size()];
        return colors_.try_emplace(person, color);
    }

    std::string color_for(const std::string& person) const {
        const auto* c = colors_.find(person);
        return c ? *c : std::string(UNKNOWN_PERSON_COLOR);
    }

    bool contains(const std::string& person) const { return colors_.contains(person); }
    size_t size() const { return colors_.size(); }
    bool empty() const { return colors_.empty(); }

    auto begin() const { return colors_.begin(); }
    auto end() const { return colors_.end(); }

    bool operator==(const PersonColorMap& other) const { return colors_ == other.colors_; }

private:
    InsertionOrderedMap<std::string, std::string> colors_;
};
