// src/profile/Profile.h
#pragma once

#include "core/Status.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gw2util::profile {

namespace fs = std::filesystem;

// Where profile files live. Passed in explicitly so tests (and the settings
// file) can point the manager at any directory.
struct ProfileLayout
{
    fs::path    directory;                    // e.g. %APPDATA%\Guild Wars 2
    std::string activeFileName = "Local.dat"; // the file the game reads/writes

    [[nodiscard]] fs::path ActivePath() const { return directory / activeFileName; }

    // "<active>.bak": present only while a profile is loaded over a
    // pre-existing active file.
    [[nodiscard]] fs::path UndoMarkerPath() const
    {
        fs::path p = ActivePath();
        p += ".bak";
        return p;
    }
};

// One named save slot.
struct Profile
{
    std::string              name = "Local";
    std::vector<std::string> options;           // forwarded to the game verbatim
    int                      preserveCount = 2; // <= 0 disables backup rotation
};

// "local" in any case means "run against the active file directly".
[[nodiscard]] bool IsLocalProfile(std::string_view name) noexcept;

// Swaps a profile's saved file into the active position and back again,
// rotating numbered backups on the way out.
//
//   Idle --Load()--> Loaded --Unload()--> Idle
//
// Each step either completes or stops at the first filesystem error; nothing
// is rolled back.
class ProfileManager
{
public:
    enum class State { Idle, Loaded };

    ProfileManager(ProfileLayout layout, Profile profile);

    [[nodiscard]] core::Status Load();
    [[nodiscard]] core::Status Unload();
    [[nodiscard]] core::Status RotateBackups();

    [[nodiscard]] State                state()   const noexcept { return state_; }
    [[nodiscard]] const Profile&       profile() const noexcept { return profile_; }
    [[nodiscard]] const ProfileLayout& layout()  const noexcept { return layout_; }

    // "<dir>/<name>.dat"
    [[nodiscard]] fs::path SavedPath() const;

    // "<dir>/<name>.dat.<index>"
    [[nodiscard]] fs::path BackupPath(int index) const;

private:
    ProfileLayout layout_;
    Profile       profile_;
    State         state_ = State::Idle;
};

} // namespace gw2util::profile
