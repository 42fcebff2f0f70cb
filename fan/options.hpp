#pragma once

#include "../core/logging.hpp"

#include <string>

namespace platmon::fan
{

inline constexpr const char* kFunctionName =
    "/usr/local/bin/accton_as5712_monitor_fan";

struct Options
{
    std::string logFile;
    log::Level level{log::Level::Info};
    bool showUsage{false}; // -h or a bad flag: print usage, exit 0
};

std::string usage(const std::string& argv0);

// Parse -h, -d/--debug, -l/--lfile <path>.
Options parseOptions(int argc, char** argv);

} // namespace platmon::fan
