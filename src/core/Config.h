// src/core/Config.h
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gw2util::core {

// Upper bound for the number of kept backups, from settings or --n.
inline constexpr int kMaxPreserve = 100;

// Persisted per-user settings.
//
// Stored in settings.json under paths::ToolDataDir() unless --config points
// elsewhere. Every field is optional in the file; command-line flags win over
// whatever is loaded here.
struct Config
{
    // Profile storage. Empty directory = paths::GameDataDir().
    std::filesystem::path profileDir;
    std::string           activeFile = "Local.dat";
    int                   preserve   = 2;

    // Extra install roots searched before %PROGRAMFILES(X86)% / %PROGRAMFILES%.
    std::vector<std::filesystem::path> installRoots;
    // Executable names tried under "<root>/Guild Wars 2/", in order.
    std::vector<std::string> executables = { "Gw2-64.exe", "Gw2.exe" };
    // Appended to the forwarded options after positional arguments.
    std::vector<std::string> extraArgs;

    bool autologin = true;
    bool loadinfo  = true;

    // Block on "press [ENTER]" before exiting after an error.
    bool pauseOnExit = true;
    // Pause after a successful unload so console output stays readable.
    int  exitDelayMs = 1000;
};

// Returns true if a settings file existed and was parsed.
// On failure `cfg` is left unchanged; fields with the wrong type are skipped.
[[nodiscard]] bool LoadConfig(Config& cfg, const std::filesystem::path& file) noexcept;

// Returns true on success. Creates the parent directory.
[[nodiscard]] bool SaveConfig(const Config& cfg, const std::filesystem::path& file) noexcept;

} // namespace gw2util::core
