// tests/test_launcher_cli_win.cpp
//
// CommandLineToArgvW-compatible quoting used to build the CreateProcessW
// command line. Pure string code, so it runs on every platform.

#include <doctest/doctest.h>

#include "platform/win/LauncherCliWin.h"

#include <string>
#include <vector>

using gw2util::winlaunch::BuildCommandLine;
using gw2util::winlaunch::QuoteArgWindows;

TEST_CASE("QuoteArgWindows leaves simple arguments alone")
{
    CHECK(QuoteArgWindows(L"-autologin") == L"-autologin");
    CHECK(QuoteArgWindows(L"-email=me@example.com") == L"-email=me@example.com");
    CHECK(QuoteArgWindows(L"C:\\Games\\Gw2.exe") == L"C:\\Games\\Gw2.exe");
}

TEST_CASE("QuoteArgWindows quotes empty strings and whitespace")
{
    CHECK(QuoteArgWindows(L"") == L"\"\"");
    CHECK(QuoteArgWindows(L"with space") == L"\"with space\"");
    CHECK(QuoteArgWindows(L"tab\there") == L"\"tab\there\"");
}

TEST_CASE("QuoteArgWindows escapes quotes and the backslashes before them")
{
    CHECK(QuoteArgWindows(L"say \"hi\"") == L"\"say \\\"hi\\\"\"");
    CHECK(QuoteArgWindows(L"a\\\"b") == L"\"a\\\\\\\"b\"");
    // Trailing backslashes are doubled because they precede the closing quote.
    CHECK(QuoteArgWindows(L"C:\\Program Files\\") == L"\"C:\\Program Files\\\\\"");
}

TEST_CASE("BuildCommandLine quotes the exe and every argument")
{
    const std::vector<std::wstring> args = { L"-autologin", L"-password=p w" };
    CHECK(BuildCommandLine(L"C:\\Program Files\\Guild Wars 2\\Gw2-64.exe", args) ==
          L"\"C:\\Program Files\\Guild Wars 2\\Gw2-64.exe\" -autologin \"-password=p w\"");

    CHECK(BuildCommandLine(L"Gw2.exe", {}) == L"Gw2.exe");
}
