#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Fatal error kinds. Each is caught once at the tool entry point, reported as
// a single line, and mapped to exit code 1.
// ---------------------------------------------------------------------------
struct ConfigurationNotFound : std::runtime_error {
    explicit ConfigurationNotFound(const std::string& path)
        : std::runtime_error("Configuration file not found: " + path), path(path) {}

    std::string path;
};

struct InvalidConfiguration : std::runtime_error {
    explicit InvalidConfiguration(const std::string& what)
        : std::runtime_error("Invalid configuration: " + what) {}
};

struct InvalidDateExpression : std::invalid_argument {
    static constexpr const char* ACCEPTED_FORMATS =
        "YYYY-MM-DD (e.g., 2026-01-20) or relative format (e.g., +2d, +3w, +2m, +1y, or today)";

    explicit InvalidDateExpression(const std::string& input)
        : std::invalid_argument("Invalid date format '" + input + "'. Use " +
                                ACCEPTED_FORMATS),
          input(input) {}

    std::string input;
};

// ---------------------------------------------------------------------------
// Non-fatal conditions, returned alongside results rather than thrown.
// ---------------------------------------------------------------------------
struct EmptyRangeWarning {
    std::string message;
};

struct NoShiftsProduced {
    std::string message;
};
