#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace gw2util::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

[[nodiscard]] std::optional<bool> ParseBool(std::string_view s)
{
    const std::string v = ToLower(s);
    if (v == "1" || v == "t" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "f" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

enum class Kind { Bool, Int, String };

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    std::size_t i = 1;
    for (; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];

        // "--" ends option parsing and is consumed; a bare "-" or any
        // non-dash argument ends it and is kept.
        if (raw == "--") {
            ++i;
            break;
        }
        if (raw.size() < 2 || raw[0] != '-')
            break;

        std::string_view body = raw.substr(raw[1] == '-' ? 2 : 1);

        std::optional<std::string_view> inlineValue;
        if (const auto eq = body.find('='); eq != std::string_view::npos)
        {
            inlineValue = body.substr(eq + 1);
            body = body.substr(0, eq);
        }

        const std::string key = ToLower(body);

        if (key == "help" || key == "h" || key == "?") {
            out.showHelp = true;
            continue;
        }

        Kind kind = Kind::String;
        if (key == "autologin" || key == "loadinfo" || key == "image" ||
            key == "verbose" || key == "no-pause")
            kind = Kind::Bool;
        else if (key == "n")
            kind = Kind::Int;
        else if (key != "name" && key != "email" && key != "password" &&
                 key != "exe" && key != "config")
        {
            out.errors.push_back("unknown option: " + std::string(raw));
            continue;
        }

        if (kind == Kind::Bool)
        {
            bool value = true;
            if (inlineValue)
            {
                const auto parsed = ParseBool(*inlineValue);
                if (!parsed) {
                    out.errors.push_back("invalid boolean value for -" + key + ": " + std::string(*inlineValue));
                    continue;
                }
                value = *parsed;
            }

            if (key == "autologin")      out.autologin = value;
            else if (key == "loadinfo")  out.loadinfo = value;
            else if (key == "image")     out.image = value;
            else if (key == "verbose")   out.verbose = value;
            else if (key == "no-pause")  out.noPause = value;
            continue;
        }

        // Valued options: inline "=value" or the next argument.
        std::string value;
        if (inlineValue) {
            value = std::string(*inlineValue);
        } else if (i + 1 < argv.size()) {
            value = std::string(argv[++i]);
        } else {
            out.errors.push_back("option needs a value: " + std::string(raw));
            continue;
        }

        if (kind == Kind::Int)
        {
            const auto parsed = ParseInt(value);
            if (!parsed) {
                out.errors.push_back("invalid value for -" + key + ": " + value);
                continue;
            }
            out.preserve = *parsed;
            continue;
        }

        if (key == "name")          out.name = value;
        else if (key == "email")    out.email = value;
        else if (key == "password") out.password = value;
        else if (key == "exe")      out.exe = value;
        else if (key == "config")   out.config = value;
    }

    for (; i < argv.size(); ++i)
        out.positional.emplace_back(argv[i]);

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "gw2util - Guild Wars 2 profile launcher\n\n";
    oss << "Usage: gw2 [options] [--] [game arguments...]\n\n";

    oss << "Profiles\n";
    oss << "  --name <profile>         Profile name to load (default: Local = no swap)\n";
    oss << "  --n <count>              Number of profile backups to keep (default: 2)\n\n";

    oss << "Game options\n";
    oss << "  --autologin[=bool]       Log in automatically (default: true)\n";
    oss << "  --loadinfo[=bool]        Show map load diagnostics (default: true)\n";
    oss << "  --image[=bool]           Download updates and exit (default: false)\n";
    oss << "  --email <address>        Email address for login\n";
    oss << "  --password <secret>      Password for login (with --email)\n\n";

    oss << "Launcher\n";
    oss << "  --exe <path>             Game executable to run instead of searching\n";
    oss << "  --config <file>          Settings file (default: per-user settings.json)\n";
    oss << "  --verbose                Debug output on the console\n";
    oss << "  --no-pause               Don't wait for [ENTER] after an error\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Examples\n";
    oss << "  gw2 --name Alt1\n";
    oss << "  gw2 --name Alt2 --n 5 --autologin=false\n";
    oss << "  gw2 --image\n";
    return oss.str();
}

} // namespace gw2util::app
