// tests/test_session.cpp
//
// End-to-end coverage for src/app/Session.{h,cpp}: settings + CLI merging and
// the load / launch / unload sequence.

#include <doctest/doctest.h>

#include "app/Session.h"
#include "test_support/ScopedEnv.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <string>
#include <vector>

#if !defined(_WIN32)
    #include <sys/stat.h>
#endif

namespace fs = std::filesystem;

using gw2util::app::BuildSessionPlan;
using gw2util::app::CommandLineArgs;
using gw2util::app::ParseCommandLineArgsFromArgv;
using gw2util::app::RunSession;
using gw2util::core::Config;
using gw2util::core::ErrorKind;
using gw2util::test::ReadFile;
using gw2util::test::ScopedEnv;
using gw2util::test::TempDir;
using gw2util::test::WriteFile;

namespace {

// Keeps the Program Files roots and the env override out of the search.
struct IsolatedSearch
{
    ScopedEnv exe{ "GW2UTIL_GAME_EXE", std::nullopt };
    ScopedEnv pf86{ "PROGRAMFILES(X86)", std::nullopt };
    ScopedEnv pf{ "PROGRAMFILES", std::nullopt };
};

CommandLineArgs Args(std::vector<std::string_view> argv)
{
    argv.insert(argv.begin(), "gw2");
    return ParseCommandLineArgsFromArgv(argv);
}

} // namespace

TEST_CASE("BuildSessionPlan: command line wins over settings")
{
    IsolatedSearch isolate;
    TempDir tmp("plan");

    Config cfg;
    cfg.profileDir   = tmp.path();
    cfg.preserve     = 9;
    cfg.autologin    = false;
    cfg.loadinfo     = false;
    cfg.extraArgs    = { "-bmp" };
    cfg.installRoots = { tmp.path() / "Games" };
    cfg.exitDelayMs  = 250;

    const auto plan = BuildSessionPlan(Args({ "--name", "Alt1", "--n", "3", "--autologin", "--exe", "x.exe", "--", "-dx9" }), cfg);

    CHECK(plan.layout.directory == tmp.path());
    CHECK(plan.layout.activeFileName == "Local.dat");
    CHECK(plan.profile.name == "Alt1");
    CHECK(plan.profile.preserveCount == 3);
    CHECK(plan.profile.options == std::vector<std::string>{ "-dx9", "-bmp", "-autologin" });
    CHECK(plan.launch.exeOverride == fs::path("x.exe"));
    REQUIRE(plan.launch.installRoots.size() == 1);
    CHECK(plan.launch.installRoots[0] == tmp.path() / "Games");
    CHECK(plan.pauseOnExit);
    CHECK(plan.exitDelayMs == 250);
}

TEST_CASE("BuildSessionPlan: settings fill in what the command line omits")
{
    IsolatedSearch isolate;

    Config cfg;
    cfg.preserve    = 4;
    cfg.pauseOnExit = true;

    const auto plan = BuildSessionPlan(Args({ "--no-pause" }), cfg);

    CHECK(plan.profile.name == "Local");
    CHECK(plan.profile.preserveCount == 4);
    CHECK(plan.profile.options == std::vector<std::string>{ "-autologin", "-maploadinfo" });
    CHECK_FALSE(plan.layout.directory.empty());
    CHECK(plan.launch.installRoots.empty());
    CHECK_FALSE(plan.pauseOnExit);
}

TEST_CASE("BuildSessionPlan appends the Program Files roots after configured ones")
{
    IsolatedSearch isolate;
    ScopedEnv pf86("PROGRAMFILES(X86)", std::string("pf86"));
    ScopedEnv pf("PROGRAMFILES", std::string("pf"));

    Config cfg;
    cfg.installRoots = { fs::path("custom") };

    const auto plan = BuildSessionPlan(Args({}), cfg);
    const std::vector<fs::path> expected = { fs::path("custom"), fs::path("pf86"), fs::path("pf") };
    CHECK(plan.launch.installRoots == expected);
}

TEST_CASE("BuildSessionPlan keeps --n within the backup limit")
{
    IsolatedSearch isolate;
    Config cfg;

    CHECK(BuildSessionPlan(Args({ "--n", "1000000000" }), cfg).profile.preserveCount == gw2util::core::kMaxPreserve);
    CHECK(BuildSessionPlan(Args({ "--n", "100" }), cfg).profile.preserveCount == 100);
    CHECK(BuildSessionPlan(Args({ "--n=-3" }), cfg).profile.preserveCount == 0);
}

TEST_CASE("RunSession: a failed launch still unloads and restores the active file")
{
    IsolatedSearch isolate;
    TempDir tmp("session_not_found");

    Config cfg;
    cfg.profileDir = tmp.path();
    auto plan = BuildSessionPlan(Args({ "--name", "Alt1", "--exe", (tmp.path() / "missing.exe").string() }), cfg);

    WriteFile(tmp.path() / "Local.dat", "main");
    WriteFile(tmp.path() / "Alt1.dat", "alt");

    const auto st = RunSession(plan);
    CHECK(st.kind == ErrorKind::NotFound);

    CHECK(ReadFile(tmp.path() / "Local.dat") == "main");
    CHECK(ReadFile(tmp.path() / "Alt1.dat") == "alt");
    CHECK_FALSE(fs::exists(tmp.path() / "Local.dat.bak"));
}

TEST_CASE("RunSession: the local profile never touches profile files")
{
    IsolatedSearch isolate;
    TempDir tmp("session_local");

    Config cfg;
    cfg.profileDir = tmp.path();
    auto plan = BuildSessionPlan(Args({ "--name", "LOCAL", "--n", "1" }), cfg);

    WriteFile(tmp.path() / "Local.dat", "main");

    const auto st = RunSession(plan);
    CHECK(st.kind == ErrorKind::NotFound);
    CHECK(ReadFile(tmp.path() / "Local.dat") == "main");
    CHECK_FALSE(fs::exists(tmp.path() / "Local.dat.bak"));
    CHECK_FALSE(fs::exists(tmp.path() / "LOCAL.dat.0"));
}

#if !defined(_WIN32)

namespace {

fs::path WriteGame(const fs::path& dir, const std::string& body)
{
    const fs::path p = dir / "Gw2-64.sh";
    WriteFile(p, "#!/bin/sh\n" + body + "\n");
    ::chmod(p.c_str(), 0755);
    return p;
}

} // namespace

TEST_CASE("RunSession: the game's changes land in the profile, the original comes back")
{
    IsolatedSearch isolate;
    TempDir tmp("session_play");

    const fs::path active = tmp.path() / "Local.dat";
    const fs::path game = WriteGame(tmp.path(),
        "[ \"$(cat '" + active.string() + "')\" = alt-v1 ] || exit 9\n"
        "printf alt-v2 > '" + active.string() + "'");

    Config cfg;
    cfg.profileDir = tmp.path();
    auto plan = BuildSessionPlan(Args({ "--name", "Alt1", "--exe", game.string() }), cfg);

    WriteFile(active, "main");
    WriteFile(tmp.path() / "Alt1.dat", "alt-v1");

    const auto st = RunSession(plan);
    REQUIRE(st.ok());

    CHECK(ReadFile(active) == "main");
    CHECK(ReadFile(tmp.path() / "Alt1.dat") == "alt-v2");
    CHECK(ReadFile(tmp.path() / "Alt1.dat.0") == "alt-v1");
    CHECK_FALSE(fs::exists(tmp.path() / "Alt1.dat.1"));
    CHECK_FALSE(fs::exists(tmp.path() / "Local.dat.bak"));
}

TEST_CASE("RunSession: a non-zero game exit is reported after unloading")
{
    IsolatedSearch isolate;
    TempDir tmp("session_exit");

    const fs::path game = WriteGame(tmp.path(), "exit 4");

    Config cfg;
    cfg.profileDir = tmp.path();
    auto plan = BuildSessionPlan(Args({ "--name", "Alt1", "--exe", game.string() }), cfg);

    WriteFile(tmp.path() / "Local.dat", "main");

    const auto st = RunSession(plan);
    CHECK(st.kind == ErrorKind::LaunchFailed);
    CHECK(ReadFile(tmp.path() / "Local.dat") == "main");
    CHECK_FALSE(fs::exists(tmp.path() / "Local.dat.bak"));
}

TEST_CASE("RunSession: a Load I/O error is returned before the game starts")
{
    IsolatedSearch isolate;
    TempDir tmp("session_load_fail");

    const fs::path launched = tmp.path() / "launched";
    const fs::path game = WriteGame(tmp.path(), "touch '" + launched.string() + "'");

    Config cfg;
    cfg.profileDir = tmp.path();
    auto plan = BuildSessionPlan(Args({ "--name", "Alt1", "--exe", game.string() }), cfg);

    WriteFile(tmp.path() / "Local.dat", "main");
    fs::create_directories(tmp.path() / "Local.dat.bak");
    WriteFile(tmp.path() / "Local.dat.bak" / "x", "occupied");

    const auto st = RunSession(plan);
    CHECK(st.kind == ErrorKind::IOError);
    CHECK_FALSE(fs::exists(launched));
    CHECK(ReadFile(tmp.path() / "Local.dat") == "main");
    CHECK_FALSE(fs::exists(tmp.path() / "Alt1.dat"));
}

#endif
