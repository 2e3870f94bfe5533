// oncall_schedule.cpp - On-call rotation schedule generator
// Loads a JSON or YAML layer configuration, resolves the date range, builds
// the rotation schedule, and writes <base>/<base>.xlsx (when built with
// libxlsxwriter), <base>/<base>.csv, <base>/<base>.svg and (with
// --generate-ics) one calendar feed per person.
//
// Usage: ./oncall_schedule --config <path> [--start-date EXPR] [--end-date EXPR]
//                          [--generate-ics] [--output-dir DIR]

#include "config/schedule_config.hpp"
#include "export/ics_export.hpp"
#include "export/spreadsheet_export.hpp"
#include "export/timeline_svg.hpp"
#include "schedule/calendar_events.hpp"
#include "schedule/date_range.hpp"
#include "schedule/errors.hpp"
#include "schedule/schedule_builder.hpp"
#include "schedule/timeline_layout.hpp"
#include "time_utils.hpp"

#ifdef ONCALL_WITH_XLSX
#include "export/workbook_export.hpp"
#endif

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --config <path> [--start-date EXPR] [--end-date EXPR] [--generate-ics]"
                 " [--output-dir DIR]\n"
              << "\n"
              << "  --config        Path to the schedule configuration: .json, or .yaml/.yml\n"
              << "                  (same keys; YAML layer configs load unchanged)\n"
              << "  --start-date    YYYY-MM-DD (e.g. 2026-01-20), relative (e.g. +2w, +3m), or \"today\"\n"
              << "  --end-date      YYYY-MM-DD, or relative to the start date (e.g. +2w, +3m)\n"
              << "  --generate-ics  Also write one iCalendar feed per team member\n"
              << "  --output-dir    Parent directory for the <config name>/ output folder (default .)\n";
}

// ===========================================================================
// Summary
// ===========================================================================
void print_summary(const BuiltSchedule& built, const std::string& output_file) {
    auto summary = summarize(built);
    std::cout << "Schedule generated: " << output_file << "\n";
    std::cout << "  - Schedule: " << built.name << "\n";
    std::cout << "  - Period: " << time_utils::format_date(built.range.start) << " to "
              << time_utils::format_date(built.range.end) << " (" << summary.days_covered
              << " days)\n";
    std::cout << "  - Total layers: " << summary.layer_count << "\n";
    std::cout << "  - Total team members: " << summary.unique_people << "\n";
    std::cout << "  - Total shifts: " << summary.total_shifts << "\n";
    for (const auto& [person, count] : summary.shifts_per_person) {
        std::cout << "      " << person << ": " << count << " shifts\n";
    }
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> start_expr;
    std::optional<std::string> end_expr;
    std::string output_parent = ".";
    bool generate_ics = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--start-date" && i + 1 < argc) {
            start_expr = argv[++i];
        } else if (arg == "--end-date" && i + 1 < argc) {
            end_expr = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_parent = argv[++i];
        } else if (arg == "--generate-ics") {
            generate_ics = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        std::cerr << "Missing required argument: --config\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        const Date today = time_utils::today();

        auto overrides = resolve_range_arguments(start_expr, end_expr, today);
        if (overrides.start) {
            std::cout << "  Start date: " << time_utils::format_date(*overrides.start) << " ("
                      << *start_expr << ")\n";
        }
        if (overrides.end) {
            std::cout << "  End date: " << time_utils::format_date(*overrides.end) << " ("
                      << *end_expr << ")\n";
        }

        ScheduleConfig config = schedule_config::load(config_path);

        auto resolution = calculate_date_range(RangeDefaults::from(config), overrides.start,
                                               overrides.end, today);
        if (resolution.warning) {
            std::cerr << "WARNING: " << resolution.warning->message << "\n";
        }

        BuiltSchedule built = build_schedule(config, resolution.range);
        if (built.no_shifts) {
            std::cerr << "ERROR: " << built.no_shifts->message << "\n";
            return 1;
        }

        const std::string base = std::filesystem::path(config_path).stem().string();
        const auto output_dir = std::filesystem::path(output_parent) / base;
        std::filesystem::create_directories(output_dir);

        // Spreadsheet
        const std::string csv_path = (output_dir / (base + ".csv")).string();
        SpreadsheetConfig sheet_cfg;
        sheet_cfg.output_path = csv_path;
        SpreadsheetExporter(sheet_cfg).export_csv(built);
#ifdef ONCALL_WITH_XLSX
        const std::string xlsx_path = (output_dir / (base + ".xlsx")).string();
        WorkbookExporter().export_xlsx(built, xlsx_path);
        print_summary(built, xlsx_path);
        std::cout << "  - CSV copy: " << csv_path << "\n";
#else
        print_summary(built, csv_path);
#endif

        // Timeline
        const std::string svg_path = (output_dir / (base + ".svg")).string();
        auto layout = compute_timeline_layout(built.schedule, built.range);
        std::string period = time_utils::format_date(built.range.start) + " to " +
                             time_utils::format_date(built.range.end);
        if (TimelineSvgRenderer().render_file(svg_path, layout, built.colors, built.name, period)) {
            std::cout << "Visual schedule generated: " << svg_path << "\n";
            std::cout << "  - Showing " << layout.num_slots() << " days with shifts\n";
        } else {
            std::cout << "  ! No shifts to visualize\n";
        }

        // Calendar feeds
        if (generate_ics) {
            auto events = materialize_events(built.schedule);
            auto feeds = ics_export::write_feeds(events, built.name, output_dir.string());
            std::cout << "ICS files generated in: "
                      << (output_dir / ics_export::ICS_SUBDIR).string() << "/\n";
            std::cout << "  - Generated " << feeds.size() << " calendar files\n";
            for (const auto& f : feeds) {
                std::cout << "    * " << f.filename << " (" << f.shift_count << " shifts)\n";
            }
        }
    } catch (const ConfigurationNotFound& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const InvalidDateExpression& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error generating schedule: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
