// platform/win/LauncherSpawnWin.cpp

#ifndef UNICODE
#   define UNICODE
#endif
#ifndef _UNICODE
#   define _UNICODE
#endif
#ifndef WIN32_LEAN_AND_MEAN
#   define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#   define NOMINMAX
#endif

#include "launch/Spawn.h"

#include <windows.h>
#include <limits>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "platform/win/LauncherCliWin.h"

namespace fs = std::filesystem;

namespace
{
    std::wstring Utf8ToWide(const std::string& s)
    {
        if (s.empty())
            return {};

        if (s.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
            return {};

        const int len = static_cast<int>(s.size());
        const int needed = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), len, nullptr, 0);
        if (needed <= 0)
            return {};

        std::wstring out(static_cast<size_t>(needed), L'\0');
        const int written = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), len, out.data(), needed);
        if (written != needed)
            out.clear();

        return out;
    }

    gw2util::launch::SpawnResult Failed(DWORD err, const char* what)
    {
        gw2util::launch::SpawnResult result{};
        result.succeeded  = false;
        result.error      = std::error_code(static_cast<int>(err), std::system_category());
        result.error_text = std::string(what) + " failed: " + result.error.message();
        return result;
    }
}

namespace gw2util::launch
{
    SpawnResult SpawnAndWait(const fs::path& exe, const std::vector<std::string>& args)
    {
        std::vector<std::wstring> wargs;
        wargs.reserve(args.size());
        for (const auto& a : args)
            wargs.push_back(Utf8ToWide(a));

        const std::wstring cmd = winlaunch::BuildCommandLine(exe.wstring(), wargs);

        STARTUPINFOW        si{};
        PROCESS_INFORMATION pi{};
        si.cb = sizeof(si);

        // Place the child in a job with KILL_ON_JOB_CLOSE so it does not
        // outlive us if we are killed while waiting. If the job cannot be set
        // up (e.g. we already run inside a restrictive job) we continue
        // without it.
        HANDLE job = ::CreateJobObjectW(nullptr, nullptr);
        if (job)
        {
            ::SetHandleInformation(job, HANDLE_FLAG_INHERIT, 0);

            JOBOBJECT_EXTENDED_LIMIT_INFORMATION jeli{};
            jeli.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;

            if (!::SetInformationJobObject(job,
                                           JobObjectExtendedLimitInformation,
                                           &jeli,
                                           static_cast<DWORD>(sizeof(jeli))))
            {
                const DWORD err = ::GetLastError();
                spdlog::warn("SetInformationJobObject(KILL_ON_JOB_CLOSE) failed ({})", err);
                ::CloseHandle(job);
                job = nullptr;
            }
        }
        else
        {
            spdlog::warn("CreateJobObjectW failed ({})", ::GetLastError());
        }

        // Suspended so the process joins the job before it runs any code.
        const DWORD creationFlags =
            CREATE_UNICODE_ENVIRONMENT |
            CREATE_DEFAULT_ERROR_MODE |
            CREATE_SUSPENDED;

        // CreateProcessW may modify the command line buffer.
        std::vector<wchar_t> cmdMutable(cmd.begin(), cmd.end());
        cmdMutable.push_back(L'\0');

        spdlog::debug("spawning {} with {} argument(s)", exe.string(), args.size());

        const BOOL ok = ::CreateProcessW(
            exe.c_str(),            // lpApplicationName
            cmdMutable.data(),      // lpCommandLine (mutable buffer)
            nullptr,                // lpProcessAttributes
            nullptr,                // lpThreadAttributes
            TRUE,                   // bInheritHandles (console streams)
            creationFlags,          // dwCreationFlags
            nullptr,                // lpEnvironment (inherit ours)
            nullptr,                // lpCurrentDirectory (inherit ours)
            &si,
            &pi
        );

        if (!ok)
        {
            const DWORD err = ::GetLastError();
            if (job)
                ::CloseHandle(job);
            return Failed(err, "CreateProcessW");
        }

        if (job && !::AssignProcessToJobObject(job, pi.hProcess))
        {
            spdlog::warn("AssignProcessToJobObject failed ({})", ::GetLastError());
            ::CloseHandle(job);
            job = nullptr;
        }

        if (::ResumeThread(pi.hThread) == static_cast<DWORD>(-1))
        {
            const DWORD err = ::GetLastError();

            // Never wait forever on a process that never starts.
            ::TerminateProcess(pi.hProcess, 1);
            ::WaitForSingleObject(pi.hProcess, 5000);

            ::CloseHandle(pi.hThread);
            ::CloseHandle(pi.hProcess);
            if (job)
                ::CloseHandle(job);

            return Failed(err, "ResumeThread");
        }

        ::WaitForSingleObject(pi.hProcess, INFINITE);

        DWORD code = 0;
        const BOOL gotCode = ::GetExitCodeProcess(pi.hProcess, &code);
        const DWORD codeErr = gotCode ? 0 : ::GetLastError();

        ::CloseHandle(pi.hThread);
        ::CloseHandle(pi.hProcess);
        if (job)
            ::CloseHandle(job);

        if (!gotCode)
            return Failed(codeErr, "GetExitCodeProcess");

        SpawnResult result{};
        result.succeeded = true;
        result.exit_code = static_cast<int>(code);
        return result;
    }
}
