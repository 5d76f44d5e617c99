#pragma once

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "core/Status.h"
#include "launch/Launcher.h"
#include "profile/Profile.h"

namespace gw2util::app {

// Everything one run needs, resolved from settings + command line.
struct SessionPlan
{
    profile::ProfileLayout layout;
    profile::Profile       profile;
    launch::LaunchConfig   launch;

    bool pauseOnExit = true;
    int  exitDelayMs = 1000;
};

// Command-line values win over settings; settings win over built-in defaults.
[[nodiscard]] SessionPlan BuildSessionPlan(const CommandLineArgs& args, const core::Config& cfg);

// Load the profile (unless it is "local"), run the game, unload.
//
// Once Load has succeeded Unload always runs, even if the game could not be
// started, so the original active file is put back. The first failure is
// returned; later ones are only logged. A Load that fails part way is not
// unloaded: the active file may be left in the "<active>.bak" marker.
[[nodiscard]] core::Status RunSession(const SessionPlan& plan);

} // namespace gw2util::app
