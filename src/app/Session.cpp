#include "app/Session.h"

#include "core/Paths.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace gw2util::app {

SessionPlan BuildSessionPlan(const CommandLineArgs& args, const core::Config& cfg)
{
    SessionPlan plan;

    plan.layout.directory      = cfg.profileDir.empty() ? paths::GameDataDir() : cfg.profileDir;
    plan.layout.activeFileName = cfg.activeFile;

    launch::LaunchFlags flags;
    flags.autologin  = args.autologin.value_or(cfg.autologin);
    flags.loadinfo   = args.loadinfo.value_or(cfg.loadinfo);
    flags.image      = args.image;
    flags.email      = args.email;
    flags.password   = args.password;
    flags.positional = args.positional;
    flags.extra      = cfg.extraArgs;

    plan.profile.name          = args.name;
    plan.profile.preserveCount = std::clamp(args.preserve.value_or(cfg.preserve), 0, core::kMaxPreserve);
    plan.profile.options       = launch::BuildLaunchOptions(flags);

    if (!args.exe.empty())
        plan.launch.exeOverride = fs::u8path(args.exe);

    // Configured roots first, then the standard Program Files locations.
    plan.launch.installRoots = cfg.installRoots;
    for (auto& root : paths::DefaultInstallRoots())
        plan.launch.installRoots.push_back(std::move(root));
    plan.launch.executables = cfg.executables;

    plan.pauseOnExit = cfg.pauseOnExit && !args.noPause;
    plan.exitDelayMs = cfg.exitDelayMs;
    return plan;
}

core::Status RunSession(const SessionPlan& plan)
{
    if (profile::IsLocalProfile(plan.profile.name))
        return launch::Launch(plan.launch, plan.profile.options);

    profile::ProfileManager manager(plan.layout, plan.profile);

    if (auto st = manager.Load(); !st)
        return st;

    const core::Status launched = launch::Launch(plan.launch, plan.profile.options);
    if (!launched)
        spdlog::warn("game run failed; unloading profile for {} anyway", plan.profile.name);

    const core::Status unloaded = manager.Unload();
    if (!launched)
    {
        if (!unloaded)
            spdlog::error("{}", core::Describe(unloaded));
        return launched;
    }
    return unloaded;
}

} // namespace gw2util::app
