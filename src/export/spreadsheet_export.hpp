#pragma once

#include "export/atomic_file.hpp"
#include "schedule/person_colors.hpp"
#include "schedule/schedule_builder.hpp"
#include "time_utils.hpp"

#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>

// ---------------------------------------------------------------------------
// SpreadsheetConfig
// ---------------------------------------------------------------------------
struct SpreadsheetConfig {
    std::string output_path;
    bool include_title_block = true;
    bool separate_dates = true;  // empty line between date groups
};

// ---------------------------------------------------------------------------
// SpreadsheetExporter - schedule as CSV, one row per shift
// ---------------------------------------------------------------------------
class SpreadsheetExporter {
public:
    SpreadsheetExporter() = default;
    explicit SpreadsheetExporter(const SpreadsheetConfig& config) : config_(config) {}

    static std::string header_line() {
        return "Date,Day,Start Time,End Time,Hours,On-Call Person,Layer,Color";
    }

    static std::string format_row(const ResolvedShift& shift, const PersonColorMap& colors) {
        std::ostringstream ss;
        ss << time_utils::format_date(shift.date);
        ss << "," << time_utils::weekday_name(shift.date);
        ss << "," << shift.start_time;
        ss << "," << shift.end_time;
        ss << "," << format_hours(shift.hours());
        ss << "," << escape(shift.person);
        ss << "," << escape(shift.layer_name);
        ss << "," << colors.color_for(shift.person);
        return ss.str();
    }

    // Writes the full sheet. The generated stamp is a parameter so output is
    // reproducible in tests.
    void write(std::ostream& out, const BuiltSchedule& built, const std::string& generated) const {
        if (config_.include_title_block) {
            out << escape(built.name) << "\n";
            out << escape(built.description) << "\n";
            out << "Period: " << time_utils::format_date(built.range.start) << " to "
                << time_utils::format_date(built.range.end) << "\n";
            out << "Generated: " << generated << "\n";
            out << "\n";
        }

        out << header_line() << "\n";
        for (const auto& row : built.schedule.rows()) {
            if (config_.separate_dates && row.separator_before) out << "\n";
            out << format_row(built.schedule.shifts[row.shift_index], built.colors) << "\n";
        }
    }

    void export_csv(const BuiltSchedule& built) const {
        export_csv(built, time_utils::now_string("%Y-%m-%d %H:%M"));
    }

    void export_csv(const BuiltSchedule& built, const std::string& generated) const {
        if (config_.output_path.empty()) return;
        schedule_io::write_file_atomically(config_.output_path, [&](std::ostream& out) {
            write(out, built, generated);
        });
    }

    static std::string format_hours(double hours) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", hours);
        return buf;
    }

    // RFC 4180 quoting for fields containing separators or quotes.
    static std::string escape(const std::string& field) {
        if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
        std::string out = "\"";
        for (char c : field) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

private:
    SpreadsheetConfig config_;
};
