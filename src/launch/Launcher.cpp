#include "launch/Launcher.h"

#include "core/Paths.h"
#include "launch/Spawn.h"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gw2util::launch
{
    using core::ErrorKind;
    using core::Status;

    std::vector<std::string> BuildLaunchOptions(const LaunchFlags& flags)
    {
        std::vector<std::string> options;

        if (!flags.email.empty() && !flags.password.empty())
        {
            options.push_back("-email=" + flags.email);
            options.push_back("-password=" + flags.password);
            options.push_back("-nopatchui");
        }

        options.insert(options.end(), flags.positional.begin(), flags.positional.end());
        options.insert(options.end(), flags.extra.begin(), flags.extra.end());

        if (flags.autologin)
            options.push_back("-autologin");
        if (flags.loadinfo)
            options.push_back("-maploadinfo");
        if (flags.image)
            options.push_back("-image");

        return options;
    }

    std::optional<fs::path> EnvExeOverride()
    {
        if (auto v = paths::GetEnv("GW2UTIL_GAME_EXE"))
            return fs::u8path(*v);
        return std::nullopt;
    }

    std::vector<fs::path> BuildCandidates(const LaunchConfig& cfg)
    {
        std::vector<fs::path> candidates;

        // CLI override has highest priority.
        if (!cfg.exeOverride.empty())
            candidates.push_back(cfg.exeOverride);

        // Environment override is next.
        if (auto envExe = EnvExeOverride())
            candidates.push_back(*envExe);

        for (const auto& root : cfg.installRoots)
        {
            for (const auto& name : cfg.executables)
                candidates.push_back(root / "Guild Wars 2" / name);
        }

        return candidates;
    }

    fs::path FindFirstExisting(const std::vector<fs::path>& candidates)
    {
        for (const auto& c : candidates)
        {
            std::error_code ec;
            if (fs::exists(c, ec))
                return c;
        }
        return fs::path{};
    }

    std::string BuildExeNotFoundMessage(const std::vector<fs::path>& candidates)
    {
        std::string msg = "launcher not found - is Guild Wars 2 installed?";
        if (candidates.empty())
            return msg + " (no install locations configured)";

        msg += " Tried:";
        for (const auto& c : candidates)
            msg += "\n - " + c.string();
        return msg;
    }

    Status Launch(const LaunchConfig& cfg, const std::vector<std::string>& options)
    {
        const auto candidates = BuildCandidates(cfg);
        const fs::path exe = FindFirstExisting(candidates);
        if (exe.empty())
            return Status::Fail(ErrorKind::NotFound, BuildExeNotFoundMessage(candidates));

        spdlog::debug("using game executable: {}", exe.string());
        spdlog::info("launching Guild Wars 2");
        const SpawnResult r = SpawnAndWait(exe, options);
        spdlog::info("exiting Guild Wars 2");

        if (!r.succeeded)
            return Status::Fail(ErrorKind::LaunchFailed, r.error_text, r.error);

        if (r.exit_code != 0)
            return Status::Fail(ErrorKind::LaunchFailed,
                                exe.string() + " exited with code " + std::to_string(r.exit_code));

        return Status::Ok();
    }
}
