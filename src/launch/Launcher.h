// src/launch/Launcher.h
#pragma once

#include "core/Status.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gw2util::launch
{
    // Where to look for the game. Built from settings + CLI; no globals.
    struct LaunchConfig
    {
        std::filesystem::path              exeOverride;  // --exe
        std::vector<std::filesystem::path> installRoots; // searched in order
        std::vector<std::string>           executables = { "Gw2-64.exe", "Gw2.exe" };
    };

    // Flags that turn into game arguments.
    struct LaunchFlags
    {
        bool autologin = true;
        bool loadinfo  = true;
        bool image     = false;

        std::string email;
        std::string password;

        std::vector<std::string> positional; // forwarded verbatim
        std::vector<std::string> extra;      // from settings.json
    };

    // Order: credentials + -nopatchui (only when both are set), positional,
    // extra, -autologin, -maploadinfo, -image.
    [[nodiscard]] std::vector<std::string> BuildLaunchOptions(const LaunchFlags& flags);

    // Optional environment override for the game EXE path.
    //   GW2UTIL_GAME_EXE="D:\Games\Guild Wars 2\Gw2-64.exe"  (absolute)
    //   GW2UTIL_GAME_EXE="Gw2-64.exe"                        (relative to cwd)
    [[nodiscard]] std::optional<std::filesystem::path> EnvExeOverride();

    // Candidate paths in the exact order they are tried:
    // --exe, GW2UTIL_GAME_EXE, then "<root>/Guild Wars 2/<exe>" for every root
    // and executable name.
    [[nodiscard]] std::vector<std::filesystem::path> BuildCandidates(const LaunchConfig& cfg);

    // First existing path, or empty.
    [[nodiscard]] std::filesystem::path FindFirstExisting(const std::vector<std::filesystem::path>& candidates);

    [[nodiscard]] std::string BuildExeNotFoundMessage(const std::vector<std::filesystem::path>& candidates);

    // Find the game and run it with `options`, blocking until it exits.
    // NotFound if no candidate exists; LaunchFailed if the spawn fails or the
    // game exits non-zero.
    [[nodiscard]] core::Status Launch(const LaunchConfig& cfg, const std::vector<std::string>& options);
}
