/**
 * @file process_runner.cpp
 */
#include "memescalate/scheduler/process_runner.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace memescalate
{

namespace
{

[[noreturn]] void spawn_error(const std::string& program, const char* step)
{
    throw EscalationError(EscalationErrorCode::SchedulerQuery,
        "Cannot run " + program + ": " + step + " failed: " + std::strerror(errno));
}

int wait_for(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

ProcessResult PosixProcessRunner::run(
    const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const
{
    if (argv.empty())
    {
        throw EscalationError(EscalationErrorCode::SchedulerQuery, "Empty command line");
    }

    // Built before fork so the child only calls async-signal-safe functions
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int fds[2];
    if (::pipe(fds) != 0)
    {
        spawn_error(argv.front(), "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(fds[0]);
        ::close(fds[1]);
        spawn_error(argv.front(), "fork");
    }
    if (pid == 0)
    {
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            result.timed_out = true;
            break;
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (rc == 0)
        {
            result.timed_out = true;
            break;
        }

        ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0)
        {
            result.output.append(buffer, static_cast<size_t>(n));
        }
        else if (n == 0 || errno != EINTR)
        {
            break;
        }
    }
    ::close(fds[0]);

    if (result.timed_out)
    {
        ::kill(pid, SIGKILL);
    }
    result.exit_status = wait_for(pid);
    return result;
}

} // namespace memescalate
