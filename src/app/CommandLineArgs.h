#pragma once

#include "brazier/Survival.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brazier::app {

// Parsed command-line arguments for the brazier executable.
//
// Notes:
//   - All option names are case-insensitive.
//   - "--flag=value", "--flag:value" and "--flag value" forms are supported.
//   - Overrides are applied on top of the JSON config file.
struct CommandLineArgs
{
    bool showHelp = false;     // --help / -h / -?
    bool writeConfig = false;  // --write-config (save the effective config and exit)
    bool realtime = false;     // --realtime (pace the simulator on the wall clock)

    std::optional<std::string> configPath;  // --config <path>
    std::optional<std::string> logDir;      // --log-dir <path>

    std::optional<int>  minutes;            // --minutes <1..500>
    std::optional<int>  damageThreshold;    // --threshold <1..20>
    std::optional<int>  targetCount;        // --target <1..20>
    std::optional<int>  seed;               // --seed <N>
    std::optional<bool> convertEnabled;     // --fletch / --no-fletch
    std::optional<bool> takeBreaks;         // --breaks / --no-breaks
    std::optional<SurvivalStrategy> strategy; // --strategy stocked|crafted

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);

// Human-readable help text.
[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace brazier::app
