// platform/win/LauncherCliWin.cpp
//
// Pure string code; built on every platform so the quoting rules stay under
// test even where CreateProcessW is unavailable.

#include "platform/win/LauncherCliWin.h"

namespace
{
    bool NeedsQuoting(const std::wstring& arg)
    {
        return arg.empty() || arg.find_first_of(L" \t\n\v\"") != std::wstring::npos;
    }

    // CommandLineToArgvW rules: a run of backslashes is literal unless it is
    // followed by a quote (or by the closing quote we add), in which case the
    // run is doubled.
    void AppendQuoted(std::wstring& out, const std::wstring& arg)
    {
        if (!NeedsQuoting(arg))
        {
            out += arg;
            return;
        }

        out.push_back(L'"');
        for (std::size_t i = 0; i < arg.size(); ++i)
        {
            std::size_t run = 0;
            while (i < arg.size() && arg[i] == L'\\')
            {
                ++run;
                ++i;
            }

            if (i == arg.size())
            {
                out.append(run * 2, L'\\');
                break;
            }

            if (arg[i] == L'"')
            {
                out.append(run * 2 + 1, L'\\');
                out.push_back(L'"');
            }
            else
            {
                out.append(run, L'\\');
                out.push_back(arg[i]);
            }
        }
        out.push_back(L'"');
    }
}

namespace gw2util::winlaunch
{
    std::wstring QuoteArgWindows(const std::wstring& arg)
    {
        std::wstring out;
        out.reserve(arg.size() + 2);
        AppendQuoted(out, arg);
        return out;
    }

    std::wstring BuildCommandLine(const std::wstring& exe, const std::vector<std::wstring>& args)
    {
        std::wstring cmd;
        AppendQuoted(cmd, exe);
        for (const auto& a : args)
        {
            cmd.push_back(L' ');
            AppendQuoted(cmd, a);
        }
        return cmd;
    }
}
