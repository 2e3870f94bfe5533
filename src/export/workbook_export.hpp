#pragma once

#include "schedule/person_colors.hpp"
#include "schedule/schedule_builder.hpp"
#include "time_utils.hpp"

#include <xlsxwriter.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// ---------------------------------------------------------------------------
// WorkbookExporter - schedule as an .xlsx sheet
//
//   row 1-4   merged title block (name, description, period, generated)
//   row 6     Date | Day | Start Time | End Time | Hours | On-Call Person |
//             On-Call Status
//   row 7+    one row per shift, filled with the person's color, a blank row
//             between dates
//
// Hours is =(D-C)*24; On-Call Status compares NOW() against the shift's
// date + start/end, so the sheet shows who is on call when it is opened.
// ---------------------------------------------------------------------------
struct WorkbookRow {
    lxw_row_t row = 0;  // zero-based sheet row
    size_t shift_index = 0;
};

class WorkbookExporter {
public:
    static constexpr const char* SHEET_NAME = "On-Call Schedule";
    static constexpr lxw_col_t NUM_COLUMNS = 7;
    static constexpr lxw_row_t HEADER_ROW = 5;
    static constexpr lxw_color_t HEADER_COLOR = 0x1F4788;

    static std::vector<std::string> headers() {
        return {"Date", "Day", "Start Time", "End Time", "Hours", "On-Call Person",
                "On-Call Status"};
    }

    // Sheet rows for each shift in canonical order, skipping one row before
    // every new date.
    static std::vector<WorkbookRow> plan_rows(const AggregatedSchedule& schedule) {
        std::vector<WorkbookRow> plan;
        lxw_row_t row = HEADER_ROW + 1;
        for (const auto& r : schedule.rows()) {
            if (r.separator_before) ++row;
            plan.push_back({row, r.shift_index});
            ++row;
        }
        return plan;
    }

    // Formulas use one-based row numbers.
    static std::string hours_formula(lxw_row_t row) {
        std::string n = std::to_string(row + 1);
        return "=(D" + n + "-C" + n + ")*24";
    }

    static std::string status_formula(lxw_row_t row) {
        std::string n = std::to_string(row + 1);
        return "=IF(AND(NOW()>=A" + n + "+C" + n + ",NOW()<=A" + n + "+D" + n +
               "),\"On-Call\",\"\")";
    }

    static lxw_color_t color_value(const std::string& hex) {
        return static_cast<lxw_color_t>(std::stoul(hex, nullptr, 16));
    }

    static lxw_datetime date_cell(Date date) {
        std::chrono::year_month_day ymd{date};
        lxw_datetime dt = {};
        dt.year = static_cast<int>(ymd.year());
        dt.month = static_cast<int>(static_cast<unsigned>(ymd.month()));
        dt.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
        return dt;
    }

    // Time-only value (Excel day 0) so D-C is a fraction of a day.
    static lxw_datetime time_cell(const std::string& clock) {
        int minutes = time_utils::parse_clock_minutes(clock).value_or(0);
        lxw_datetime dt = {};
        dt.hour = minutes / time_utils::MINUTES_PER_HOUR;
        dt.min = minutes % time_utils::MINUTES_PER_HOUR;
        return dt;
    }

    void export_xlsx(const BuiltSchedule& built, const std::string& path) const {
        export_xlsx(built, path, time_utils::now_string("%Y-%m-%d %H:%M"));
    }

    // Written to <path>.tmp and renamed into place once the workbook closes.
    void export_xlsx(const BuiltSchedule& built, const std::string& path,
                     const std::string& generated) const {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }

        const std::string tmp_path = path + ".tmp";
        std::unique_ptr<lxw_workbook, WorkbookCloser> workbook(workbook_new(tmp_path.c_str()));
        if (!workbook) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        try {
            write_sheet(workbook.get(), built, generated);
        } catch (...) {
            workbook.reset();
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            throw;
        }

        lxw_error closed = workbook_close(workbook.release());
        if (closed != LXW_NO_ERROR) {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            throw std::runtime_error("Failed writing output file: " + path + ": " +
                                     lxw_strerror(closed));
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::filesystem::remove(tmp_path, ec);
            throw std::runtime_error("Cannot replace output file: " + path);
        }
    }

private:
    // Frees a workbook abandoned on an error path.
    struct WorkbookCloser {
        void operator()(lxw_workbook* wb) const {
            if (workbook_close(wb) != LXW_NO_ERROR) {
                std::cerr << "WARNING: could not close abandoned workbook\n";
            }
        }
    };

    struct Formats {
        lxw_format* title;
        lxw_format* description;
        lxw_format* period;
        lxw_format* generated;
        lxw_format* header;
    };

    static void check(lxw_error err, const std::string& what) {
        if (err != LXW_NO_ERROR) {
            throw std::runtime_error(what + ": " + lxw_strerror(err));
        }
    }

    static void center(lxw_format* f) {
        format_set_align(f, LXW_ALIGN_CENTER);
        format_set_align(f, LXW_ALIGN_VERTICAL_CENTER);
        format_set_text_wrap(f);
    }

    static Formats make_formats(lxw_workbook* wb) {
        Formats f{};
        f.title = workbook_add_format(wb);
        format_set_bold(f.title);
        format_set_font_size(f.title, 14);
        format_set_font_color(f.title, LXW_COLOR_WHITE);
        format_set_bg_color(f.title, HEADER_COLOR);
        center(f.title);

        f.description = workbook_add_format(wb);
        format_set_italic(f.description);
        center(f.description);

        f.period = workbook_add_format(wb);
        format_set_bold(f.period);
        center(f.period);

        f.generated = workbook_add_format(wb);
        format_set_italic(f.generated);
        format_set_font_size(f.generated, 9);
        center(f.generated);

        f.header = workbook_add_format(wb);
        format_set_bold(f.header);
        format_set_font_size(f.header, 11);
        format_set_font_color(f.header, LXW_COLOR_WHITE);
        format_set_bg_color(f.header, HEADER_COLOR);
        format_set_border(f.header, LXW_BORDER_THIN);
        center(f.header);
        return f;
    }

    // Per-person cell formats: plain, date, time and one-decimal hours.
    struct PersonFormats {
        lxw_format* text;
        lxw_format* date;
        lxw_format* time;
        lxw_format* hours;
    };

    static lxw_format* person_format(lxw_workbook* wb, lxw_color_t color, const char* num_format) {
        lxw_format* f = workbook_add_format(wb);
        format_set_bg_color(f, color);
        format_set_border(f, LXW_BORDER_THIN);
        center(f);
        if (num_format) format_set_num_format(f, num_format);
        return f;
    }

    static PersonFormats make_person_formats(lxw_workbook* wb, const std::string& hex) {
        lxw_color_t color = color_value(hex);
        return PersonFormats{person_format(wb, color, nullptr),
                             person_format(wb, color, "yyyy-mm-dd"),
                             person_format(wb, color, "hh:mm"),
                             person_format(wb, color, "0.0")};
    }

    void write_sheet(lxw_workbook* wb, const BuiltSchedule& built,
                     const std::string& generated) const {
        lxw_worksheet* ws = workbook_add_worksheet(wb, SHEET_NAME);
        if (!ws) throw std::runtime_error("Cannot add worksheet");
        Formats fmt = make_formats(wb);
        const lxw_col_t last_col = NUM_COLUMNS - 1;

        std::string period = "Period: " + time_utils::format_date(built.range.start) + " to " +
                             time_utils::format_date(built.range.end);
        std::string stamp = "Generated: " + generated;
        check(worksheet_merge_range(ws, 0, 0, 0, last_col, built.name.c_str(), fmt.title),
              "Title");
        check(worksheet_merge_range(ws, 1, 0, 1, last_col, built.description.c_str(),
                                    fmt.description),
              "Description");
        check(worksheet_merge_range(ws, 2, 0, 2, last_col, period.c_str(), fmt.period), "Period");
        check(worksheet_merge_range(ws, 3, 0, 3, last_col, stamp.c_str(), fmt.generated),
              "Generated");

        auto names = headers();
        for (lxw_col_t col = 0; col < NUM_COLUMNS; ++col) {
            check(worksheet_write_string(ws, HEADER_ROW, col, names[col].c_str(), fmt.header),
                  "Header");
        }

        std::map<std::string, PersonFormats> person_formats;
        for (const auto& entry : built.colors) {
            person_formats.emplace(entry.first, make_person_formats(wb, entry.second));
        }
        PersonFormats unknown = make_person_formats(wb, UNKNOWN_PERSON_COLOR);

        for (const auto& planned : plan_rows(built.schedule)) {
            const ResolvedShift& shift = built.schedule.shifts[planned.shift_index];
            auto it = person_formats.find(shift.person);
            const PersonFormats& pf = it == person_formats.end() ? unknown : it->second;
            const lxw_row_t r = planned.row;

            lxw_datetime date = date_cell(shift.date);
            lxw_datetime start = time_cell(shift.start_time);
            lxw_datetime end = time_cell(shift.end_time);
            std::string day = time_utils::weekday_name(shift.date);

            check(worksheet_write_datetime(ws, r, 0, &date, pf.date), "Date");
            check(worksheet_write_string(ws, r, 1, day.c_str(), pf.text), "Day");
            check(worksheet_write_datetime(ws, r, 2, &start, pf.time), "Start Time");
            check(worksheet_write_datetime(ws, r, 3, &end, pf.time), "End Time");
            check(worksheet_write_formula_num(ws, r, 4, hours_formula(r).c_str(), pf.hours,
                                              shift.hours()),
                  "Hours");
            check(worksheet_write_string(ws, r, 5, shift.person.c_str(), pf.text), "Person");
            check(worksheet_write_formula(ws, r, 6, status_formula(r).c_str(), pf.text),
                  "On-Call Status");
        }

        const double widths[NUM_COLUMNS] = {15, 12, 12, 12, 8, 20, 15};
        for (lxw_col_t col = 0; col < NUM_COLUMNS; ++col) {
            check(worksheet_set_column(ws, col, col, widths[col], nullptr), "Column width");
        }
    }
};
