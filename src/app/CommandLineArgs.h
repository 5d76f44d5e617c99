#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gw2util::app {

// Parsed command-line arguments for gw2util.
//
// Notes:
//   - Option names are case-insensitive and accept one or two dashes.
//   - "--flag=value" and "--flag value" are both accepted for valued options.
//     Boolean options never consume the next argument: use "--flag=false".
//   - Parsing stops at the first non-option argument or after "--"; the rest
//     is forwarded to the game verbatim.
struct CommandLineArgs
{
    bool showHelp = false;            // --help / -h / -?

    std::string name = "Local";       // --name <profile>
    std::optional<int> preserve;      // --n <count>

    std::optional<bool> autologin;    // --autologin[=bool]
    std::optional<bool> loadinfo;     // --loadinfo[=bool]
    bool image = false;               // --image[=bool]

    std::string email;                // --email <address>
    std::string password;             // --password <secret>

    std::string exe;                  // --exe <path>
    std::string config;               // --config <settings.json>
    bool verbose = false;             // --verbose
    bool noPause = false;             // --no-pause

    // Everything after the options.
    std::vector<std::string> positional;

    // Unknown options and bad values, in command-line order.
    std::vector<std::string> errors;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace gw2util::app
