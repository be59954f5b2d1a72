#pragma once

#include <optional>
#include <string>

struct AppOptions {
    std::string inputDir = "test_IMG";
    std::optional<double> scale;     // Physical units per pixel, absent for "none"
    bool showHelp = false;
};

// Parses --input-dir <path>, --scale <float|none> and --help.
// Returns false and fills error on malformed input.
bool parseAppOptions(int argc, const char* const* argv, AppOptions& options, std::string& error);

std::string appUsage(const std::string& programName);
