// src/core/Paths.cpp
#include "core/Paths.h"

#include <cstdlib>

namespace fs = std::filesystem;

namespace {
    const char* const kGameFolder = "Guild Wars 2";
    const char* const kVendor     = "gw2util";

    // Home-relative fallback when the XDG variable is not set.
    fs::path XdgDir(const char* var, const char* homeRelative)
    {
        if (auto v = gw2util::paths::GetEnv(var))
            return fs::path(*v);
        if (auto home = gw2util::paths::GetEnv("HOME"))
            return fs::path(*home) / homeRelative;

        std::error_code ec;
        return fs::temp_directory_path(ec);
    }
}

namespace gw2util::paths {

std::optional<std::string> GetEnv(const char* name)
{
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return std::nullopt;
    return std::string(v);
}

fs::path GameDataDir()
{
#if defined(_WIN32)
    if (auto appData = GetEnv("APPDATA"))
        return fs::path(*appData) / kGameFolder;
    if (auto profile = GetEnv("USERPROFILE"))
        return fs::path(*profile) / "AppData" / "Roaming" / kGameFolder;
    return fs::path(kGameFolder);
#else
    return XdgDir("XDG_DATA_HOME", ".local/share") / kGameFolder;
#endif
}

fs::path ToolDataDir()
{
#if defined(_WIN32)
    if (auto local = GetEnv("LOCALAPPDATA"))
        return fs::path(*local) / kVendor;
    if (auto appData = GetEnv("APPDATA"))
        return fs::path(*appData) / kVendor;
    return fs::path(kVendor);
#else
    return XdgDir("XDG_CONFIG_HOME", ".config") / kVendor;
#endif
}

fs::path LogsDir()      { return ToolDataDir() / "logs"; }
fs::path SettingsPath() { return ToolDataDir() / "settings.json"; }

std::vector<fs::path> DefaultInstallRoots()
{
    std::vector<fs::path> roots;
    for (const char* var : { "PROGRAMFILES(X86)", "PROGRAMFILES" })
    {
        if (auto v = GetEnv(var))
            roots.emplace_back(*v);
    }
    return roots;
}

} // namespace gw2util::paths
