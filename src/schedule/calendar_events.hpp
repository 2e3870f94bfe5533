#pragma once

#include "schedule/ordered_map.hpp"
#include "schedule/shift_aggregator.hpp"
#include "time_utils.hpp"

#include <string>
#include <vector>

constexpr const char* EVENT_UID_NAMESPACE = "oncall@scheduler";

// ---------------------------------------------------------------------------
// CalendarEvent - one shift as a timed event
// ---------------------------------------------------------------------------
struct CalendarEvent {
    std::string uid;
    std::string start;     // local YYYYMMDDTHHMMSS
    std::string end;
    std::string created;   // generation time, YYYYMMDDTHHMMSSZ; not part of identity
    std::string person;
    std::string layer_name;
    Date date;

    // Identity ignores the creation stamp.
    bool same_event(const CalendarEvent& other) const {
        return uid == other.uid && start == other.start && end == other.end &&
               person == other.person && layer_name == other.layer_name;
    }
};

using EventsByPerson = InsertionOrderedMap<std::string, std::vector<CalendarEvent>>;

namespace calendar_events {

// date + "HH:MM" -> YYYYMMDDTHHMM00
inline std::string timestamp(Date date, const std::string& clock) {
    std::string hhmm = clock.size() == 5 ? clock.substr(0, 2) + clock.substr(3, 2) : "0000";
    return time_utils::format_compact_date(date) + "T" + hhmm + "00";
}

// Deterministic: same start, person and namespace always give the same UID.
inline std::string make_uid(const std::string& start_stamp, const std::string& person,
                            const std::string& ns = EVENT_UID_NAMESPACE) {
    std::string who = person;
    for (auto& c : who) {
        if (c == ' ') c = '-';
    }
    return start_stamp + "-" + who + "-" + ns;
}

inline CalendarEvent make_event(const ResolvedShift& shift, const std::string& created) {
    CalendarEvent ev;
    ev.date = shift.date;
    ev.start = timestamp(shift.date, shift.start_time);
    ev.end = timestamp(shift.date, shift.end_time);
    ev.uid = make_uid(ev.start, shift.person);
    ev.created = created;
    ev.person = shift.person;
    ev.layer_name = shift.layer_name;
    return ev;
}

}  // namespace calendar_events

// One event per shift, grouped by person in first-appearance order.
inline EventsByPerson materialize_events(const AggregatedSchedule& schedule,
                                         const std::string& created) {
    EventsByPerson by_person;
    for (const auto& shift : schedule.shifts) {
        by_person[shift.person].push_back(calendar_events::make_event(shift, created));
    }
    return by_person;
}

inline EventsByPerson materialize_events(const AggregatedSchedule& schedule) {
    return materialize_events(schedule, time_utils::now_string("%Y%m%dT%H%M%SZ"));
}
