#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skirmish::tools {

// Parsed command-line arguments for skirmish_sim.
//
// Notes:
//   - Option names are case-insensitive.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct SimArgs
{
    bool showHelp = false;                  // --help / -h

    std::optional<std::string> configPath;  // --config <file.json>
    std::optional<std::string> rosterPath;  // --roster <file.json>
    std::optional<std::string> mode;        // --mode realtime|turn_based
    std::optional<std::uint64_t> seed;      // --seed <n>

    int durationMs = 60000;                 // --duration <ms>  (simulated time cap)
    int tickMs = 16;                        // --tick <ms>      (fixed frame step)

    std::string logLevel = "info";          // --log-level trace|debug|info|warn|error|off
    std::optional<std::string> logFile;     // --log-file <path> (rotating, 1MB x 4)

    // Unknown args or bad values, kept for a useful error message.
    std::vector<std::string> unknown;
};

[[nodiscard]] SimArgs ParseSimArgs(const std::vector<std::string>& args);
[[nodiscard]] SimArgs ParseSimArgs(int argc, char** argv);

[[nodiscard]] std::string BuildSimHelpText();

} // namespace skirmish::tools
