// src/app/Main.cpp
//
// gw2util entry point.
//
// Responsibilities:
//  - Command-line parsing and usage errors
//  - Logging + settings bootstrap
//  - Profile load / game launch / profile unload
//  - Blocking exit prompt on failure
//
// The actual work lives in app/Session.{h,cpp}.

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "app/CommandLineArgs.h"
#include "app/ExitPrompt.h"
#include "app/Session.h"
#include "core/Config.h"
#include "core/Paths.h"
#include "logging/Log.h"
#include "profile/Profile.h"

namespace fs = std::filesystem;

int main(int argc, char** argv)
{
    using namespace gw2util;

    // 1) Command line.
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.errors.empty())
    {
        for (const auto& e : args.errors)
            std::cerr << e << "\n";
        std::cerr << "\n" << app::BuildCommandLineHelpText();
        return 2;
    }

    // 2) Logging.
    logsys::init(paths::LogsDir(), args.verbose);
    spdlog::debug("gw2util starting");

    // 3) Settings.
    const fs::path settingsPath = args.config.empty() ? paths::SettingsPath() : fs::u8path(args.config);
    core::Config cfg;
    if (core::LoadConfig(cfg, settingsPath))
        spdlog::debug("settings loaded from {}", settingsPath.string());
    else
        spdlog::debug("no usable settings at {}; using defaults", settingsPath.string());

    const app::SessionPlan plan = app::BuildSessionPlan(args, cfg);
    spdlog::debug("profile directory: {}", plan.layout.directory.string());

    // 4) Load, run, unload.
    const core::Status status = app::RunSession(plan);

    if (status.ok() && !profile::IsLocalProfile(plan.profile.name) && plan.exitDelayMs > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(plan.exitDelayMs));

    const int code = app::ExitWithPrompt(status, plan.pauseOnExit, std::cin, std::cout);
    logsys::shutdown();
    return code;
}
