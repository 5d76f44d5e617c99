// platform/posix/LauncherSpawnPosix.cpp

#include "launch/Spawn.h"

#include <cerrno>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{
    gw2util::launch::SpawnResult Failed(int err, const std::string& what)
    {
        gw2util::launch::SpawnResult result{};
        result.succeeded  = false;
        result.error      = std::error_code(err, std::generic_category());
        result.error_text = what + " failed: " + result.error.message();
        return result;
    }
}

namespace gw2util::launch
{
    SpawnResult SpawnAndWait(const fs::path& exe, const std::vector<std::string>& args)
    {
        const std::string exePath = exe.string();

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(exePath.c_str()));
        for (const auto& a : args)
            argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        // Close-on-exec pipe: if execv fails the child writes errno into it,
        // a successful exec closes it with nothing written.
        int errPipe[2];
        if (::pipe(errPipe) != 0)
            return Failed(errno, "pipe");
        ::fcntl(errPipe[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

        spdlog::debug("spawning {} with {} argument(s)", exePath, args.size());

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            const int err = errno;
            ::close(errPipe[0]);
            ::close(errPipe[1]);
            return Failed(err, "fork");
        }

        if (pid == 0)
        {
            ::close(errPipe[0]);
            ::execv(exePath.c_str(), argv.data());
            const int err = errno;
            (void)!::write(errPipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        ::close(errPipe[1]);

        int execErr = 0;
        ssize_t n = 0;
        do
        {
            n = ::read(errPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        ::close(errPipe[0]);

        int status = 0;
        pid_t waited = 0;
        do
        {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(execErr)))
            return Failed(execErr, "execv " + exePath);

        if (waited < 0)
            return Failed(errno, "waitpid");

        SpawnResult result{};
        result.succeeded = true;
        if (WIFEXITED(status))
            result.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            result.exit_code = 128 + WTERMSIG(status);
        else
            result.exit_code = -1;
        return result;
    }
}
