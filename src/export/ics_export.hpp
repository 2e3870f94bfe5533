#pragma once

#include "export/atomic_file.hpp"
#include "schedule/calendar_events.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// iCalendar export - one .ics feed per person
// ---------------------------------------------------------------------------
namespace ics_export {

constexpr const char* ICS_SUBDIR = "ics_files";

// ASCII alphanumerics and every byte of a UTF-8 multibyte sequence.
inline bool is_name_byte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

// Characters other than name bytes, space, '_' and '-' become '_', then
// standalone single digits are zero-padded ("Utente 1" -> "Utente 01",
// "Niccolò 1" -> "Niccolò 01").
inline std::string safe_filename(const std::string& person) {
    std::string safe;
    for (char c : person) {
        bool keep = is_name_byte(static_cast<unsigned char>(c)) || c == ' ' || c == '_' || c == '-';
        safe += keep ? c : '_';
    }

    auto is_word = [](char c) { return is_name_byte(static_cast<unsigned char>(c)) || c == '_'; };
    std::string padded;
    for (size_t i = 0; i < safe.size(); ++i) {
        bool digit = std::isdigit(static_cast<unsigned char>(safe[i]));
        bool left_edge = i == 0 || !is_word(safe[i - 1]);
        bool right_edge = i + 1 == safe.size() || !is_word(safe[i + 1]);
        if (digit && left_edge && right_edge) padded += '0';
        padded += safe[i];
    }
    return padded;
}

// TEXT value escaping (RFC 5545 3.3.11).
inline std::string escape_text(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ';':  out += "\\;"; break;
            case ',':  out += "\\,"; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

inline void write_calendar(std::ostream& out, const std::string& person,
                           const std::vector<CalendarEvent>& events,
                           const std::string& schedule_name) {
    out << "BEGIN:VCALENDAR\n";
    out << "VERSION:2.0\n";
    out << "PRODID:-//On-Call Scheduler//EN\n";
    out << "X-WR-CALNAME:" << escape_text(person) << " - On-Call Schedule\n";
    out << "X-WR-TIMEZONE:UTC\n";
    out << "CALSCALE:GREGORIAN\n";
    out << "METHOD:PUBLISH\n";

    for (const auto& ev : events) {
        out << "BEGIN:VEVENT\n";
        out << "UID:" << ev.uid << "\n";
        out << "DTSTAMP:" << ev.created << "\n";
        out << "DTSTART:" << ev.start << "\n";
        out << "DTEND:" << ev.end << "\n";
        out << "SUMMARY:On-Call: " << escape_text(ev.layer_name) << "\n";
        out << "DESCRIPTION:On-call shift for " << escape_text(person)
            << "\\nLayer: " << escape_text(ev.layer_name)
            << "\\nSchedule: " << escape_text(schedule_name) << "\n";
        out << "LOCATION:On-Call\n";
        out << "STATUS:CONFIRMED\n";
        out << "TRANSP:OPAQUE\n";
        out << "BEGIN:VALARM\n";
        out << "TRIGGER:-PT15M\n";
        out << "ACTION:DISPLAY\n";
        out << "DESCRIPTION:On-Call shift starts in 15 minutes\n";
        out << "END:VALARM\n";
        out << "END:VEVENT\n";
    }

    out << "END:VCALENDAR\n";
}

struct WrittenFeed {
    std::string person;
    std::string filename;
    size_t shift_count = 0;
};

// Writes <output_dir>/ics_files/<safe name>.ics per person. When two people
// map to the same safe name, later ones get "_2", "_3", ... so no feed is
// overwritten. Returns the feeds sorted by person name.
inline std::vector<WrittenFeed> write_feeds(const EventsByPerson& events,
                                            const std::string& schedule_name,
                                            const std::string& output_dir) {
    auto ics_dir = std::filesystem::path(output_dir) / ICS_SUBDIR;
    std::filesystem::create_directories(ics_dir);

    std::set<std::string> used;
    std::vector<WrittenFeed> written;
    for (const auto& entry : events) {
        const std::string& person = entry.first;
        const std::vector<CalendarEvent>& person_events = entry.second;

        const std::string stem = safe_filename(person);
        std::string filename = stem + ".ics";
        for (int n = 2; used.count(filename); ++n) {
            filename = stem + "_" + std::to_string(n) + ".ics";
        }
        used.insert(filename);

        schedule_io::write_file_atomically((ics_dir / filename).string(),
                                           [&](std::ostream& out) {
            write_calendar(out, person, person_events, schedule_name);
        });
        written.push_back({person, filename, person_events.size()});
    }

    std::sort(written.begin(), written.end(),
              [](const WrittenFeed& a, const WrittenFeed& b) { return a.person < b.person; });
    return written;
}

}  // namespace ics_export
