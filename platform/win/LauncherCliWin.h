#pragma once

#include <string>
#include <vector>

namespace gw2util::winlaunch
{
    // Robust Windows-style argument quoting (CommandLineToArgvW-compatible)
    std::wstring QuoteArgWindows(const std::wstring& arg);

    // Full CreateProcessW command line: quoted exe as argv[0], then each
    // argument quoted and space-separated.
    std::wstring BuildCommandLine(const std::wstring& exe, const std::vector<std::wstring>& args);
}
