// src/core/Paths.h
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gw2util::paths {

// Value of an environment variable, or nullopt if unset/empty.
[[nodiscard]] std::optional<std::string> GetEnv(const char* name);

// Per-user directory holding the game's own data (Local.dat and profiles).
//   Windows: %APPDATA%\Guild Wars 2
//   other:   $XDG_DATA_HOME/Guild Wars 2  (or ~/.local/share/Guild Wars 2)
[[nodiscard]] std::filesystem::path GameDataDir();

// Per-user directory for this tool (settings.json, logs/).
//   Windows: %LOCALAPPDATA%\gw2util
//   other:   $XDG_CONFIG_HOME/gw2util     (or ~/.config/gw2util)
[[nodiscard]] std::filesystem::path ToolDataDir();

[[nodiscard]] std::filesystem::path LogsDir();
[[nodiscard]] std::filesystem::path SettingsPath();

// Installation roots searched for the game, in priority order:
// %PROGRAMFILES(X86)% then %PROGRAMFILES%. Unset variables are skipped.
[[nodiscard]] std::vector<std::filesystem::path> DefaultInstallRoots();

} // namespace gw2util::paths
