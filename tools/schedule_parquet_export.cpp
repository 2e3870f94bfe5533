// schedule_parquet_export.cpp - Rotation schedule as a Parquet table
// Same pipeline as oncall_schedule; writes one row per shift in canonical
// order (ZSTD) for downstream analysis.
//
// Usage: ./schedule_parquet_export --config <path> --output <file.parquet>
//                                  [--start-date EXPR] [--end-date EXPR]

#include "config/schedule_config.hpp"
#include "export/parquet_export.hpp"
#include "schedule/date_range.hpp"
#include "schedule/errors.hpp"
#include "schedule/schedule_builder.hpp"
#include "time_utils.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --config <path> --output <file.parquet> [--start-date EXPR] [--end-date EXPR]\n"
              << "\n"
              << "  --config      Path to the schedule configuration (.json, .yaml or .yml)\n"
              << "  --output      Output file path (.parquet)\n"
              << "  --start-date  YYYY-MM-DD, relative (+2w, +3m), or \"today\"\n"
              << "  --end-date    YYYY-MM-DD, or relative to the start date\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_path;
    std::optional<std::string> start_expr;
    std::optional<std::string> end_expr;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--start-date" && i + 1 < argc) {
            start_expr = argv[++i];
        } else if (arg == "--end-date" && i + 1 < argc) {
            end_expr = argv[++i];
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
    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }
    if (std::filesystem::path(output_path).extension().string() != ".parquet") {
        std::cerr << "Unsupported output format. Use .parquet extension.\n";
        return 1;
    }

    try {
        const Date today = time_utils::today();
        auto overrides = resolve_range_arguments(start_expr, end_expr, today);
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

        schedule_parquet::write(built, output_path);
        std::cout << "Parquet schedule written: " << output_path << " ("
                  << built.schedule.size() << " shifts)\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
