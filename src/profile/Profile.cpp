#include "profile/Profile.h"

#include "io/FileOps.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <string>
#include <utility>

namespace gw2util::profile {

using core::ErrorKind;
using core::Status;

bool IsLocalProfile(std::string_view name) noexcept
{
    constexpr std::string_view kLocal = "local";
    if (name.size() != kLocal.size())
        return false;

    for (std::size_t i = 0; i < name.size(); ++i)
    {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::tolower(c) != kLocal[i])
            return false;
    }
    return true;
}

ProfileManager::ProfileManager(ProfileLayout layout, Profile profile)
    : layout_(std::move(layout))
    , profile_(std::move(profile))
{
}

fs::path ProfileManager::SavedPath() const
{
    return layout_.directory / (profile_.name + ".dat");
}

fs::path ProfileManager::BackupPath(int index) const
{
    fs::path p = SavedPath();
    p += "." + std::to_string(index);
    return p;
}

Status ProfileManager::Load()
{
    if (state_ != State::Idle)
        return Status::Fail(ErrorKind::InvalidState, "profile " + profile_.name + " is already loaded");

    if (auto st = io::EnsureDirectory(layout_.directory); !st)
        return st;

    const fs::path active = layout_.ActivePath();

    if (io::Exists(active))
    {
        spdlog::info("backing up original profile");
        if (auto st = io::Rename(active, layout_.UndoMarkerPath()); !st)
            return st;
    }

    // The undo marker (if any) is now in place and only Unload() puts it
    // back. A failure below returns with the state already Loaded.
    state_ = State::Loaded;

    const fs::path saved = SavedPath();
    if (io::Exists(saved))
    {
        spdlog::info("loading profile for {}", profile_.name);
        return io::Copy(saved, active);
    }

    spdlog::info("creating profile for {}", profile_.name);
    return Status::Ok();
}

Status ProfileManager::RotateBackups()
{
    if (profile_.preserveCount < 1)
        return Status::Ok();

    spdlog::info("managing profile backups (max {})", profile_.preserveCount);

    if (auto st = io::Remove(BackupPath(profile_.preserveCount - 1)); !st)
        return st;

    for (int i = profile_.preserveCount - 1; i > 0; --i)
    {
        const fs::path older = BackupPath(i - 1);
        if (!io::Exists(older))
            continue;

        spdlog::debug("rotating {} -> {}", older.string(), BackupPath(i).string());
        if (auto st = io::Rename(older, BackupPath(i)); !st)
            return st;
    }

    const fs::path saved = SavedPath();
    if (!io::Exists(saved))
    {
        // New profile: no previous version to keep.
        spdlog::debug("no saved file for {}; nothing to back up", profile_.name);
        return Status::Ok();
    }

    return io::Rename(saved, BackupPath(0));
}

Status ProfileManager::Unload()
{
    if (state_ != State::Loaded)
        return Status::Fail(ErrorKind::InvalidState, "profile " + profile_.name + " is not loaded");

    if (auto st = RotateBackups(); !st)
        return st;

    const fs::path active = layout_.ActivePath();

    spdlog::info("unloading profile for {}", profile_.name);
    if (io::Exists(active))
    {
        if (auto st = io::Copy(active, SavedPath()); !st)
            return st;
    }
    else
    {
        spdlog::warn("{} is missing; nothing to save for {}", active.string(), profile_.name);
    }

    const fs::path marker = layout_.UndoMarkerPath();
    if (io::Exists(marker))
    {
        spdlog::info("restoring original profile");
        if (auto st = io::Rename(marker, active); !st)
            return st;
    }

    state_ = State::Idle;
    return Status::Ok();
}

} // namespace gw2util::profile
