// src/launch/Spawn.h
#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace gw2util::launch
{
    struct SpawnResult
    {
        bool            succeeded  = false; // process was created and waited on
        int             exit_code  = 0;
        std::error_code error;              // set when !succeeded
        std::string     error_text;
    };

    // Spawns `exe` with `args` (excluding argv[0]) and waits for it to exit.
    // The child inherits our standard streams and environment.
    //
    // Implemented per platform:
    //   platform/win/LauncherSpawnWin.cpp     CreateProcessW + kill-on-close job
    //   platform/posix/LauncherSpawnPosix.cpp fork + execv + waitpid
    SpawnResult SpawnAndWait(const std::filesystem::path&  exe,
                             const std::vector<std::string>& args);
}
