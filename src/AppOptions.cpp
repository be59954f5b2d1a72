#include "AppOptions.hpp"

#include <cmath>
#include <sstream>

namespace {

bool parseScale(const std::string& text, std::optional<double>& scale, std::string& error) {
    if (text == "none" || text == "None") {
        scale.reset();
        return true;
    }

    std::istringstream stream(text);
    double value = 0.0;
    char trailing = 0;
    if (!(stream >> value) || (stream >> trailing)) {
        error = "Invalid value for --scale: " + text;
        return false;
    }

    if (!std::isfinite(value) || value <= 0.0) {
        error = "--scale must be a positive number: " + text;
        return false;
    }

    scale = value;
    return true;
}

} // namespace

bool parseAppOptions(int argc, const char* const* argv, AppOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];
        std::string value;
        bool hasInlineValue = false;

        const auto equals = argument.find('=');
        if (argument.rfind("--", 0) == 0 && equals != std::string::npos) {
            value = argument.substr(equals + 1);
            argument = argument.substr(0, equals);
            hasInlineValue = true;
        }

        if (argument == "--help" || argument == "-h") {
            options.showHelp = true;
            continue;
        }

        if (argument != "--input-dir" && argument != "--scale") {
            error = "Unknown argument: " + argument;
            return false;
        }

        if (!hasInlineValue) {
            if (i + 1 >= argc) {
                error = "Missing value for " + argument;
                return false;
            }
            value = argv[++i];
        }

        if (argument == "--input-dir") {
            if (value.empty()) {
                error = "--input-dir must not be empty";
                return false;
            }
            options.inputDir = value;
        } else if (!parseScale(value, options.scale, error)) {
            return false;
        }
    }

    return true;
}

std::string appUsage(const std::string& programName) {
    std::ostringstream usage;
    usage << "Usage: " << programName << " [--input-dir <path>] [--scale <units-per-pixel|none>]\n"
          << "  --input-dir <path>   folder with input images (default: test_IMG)\n"
          << "  --scale <value>      physical units (mm) per pixel of the normalized image\n"
          << "  --help               show this message\n";
    return usage.str();
}
