/**
 * @file process_runner.hpp
 * @brief Runs external commands and captures their standard output.
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

/**
 * @brief Result of one command run.
 */
struct ProcessResult
{
    /**
     * @brief Exit status, or -1 if the process was killed by a signal.
     */
    int exit_status{-1};

    bool timed_out{false};
    std::string output;

    bool ok() const noexcept
    {
        return !timed_out && exit_status == 0;
    }
};

/**
 * @brief Interface for running commands, so scheduler queries can be tested offline.
 */
class IProcessRunner
{
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a command and wait for it.
     * @param argv Program name (looked up on PATH) followed by its arguments.
     * @param timeout The process is killed once this elapses.
     * @throw EscalationError with `SchedulerQuery` if the process cannot be started.
     */
    virtual ProcessResult run(
        const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const = 0;
};

/**
 * @brief fork/execvp runner reading stdout through a pipe. Stderr is discarded.
 */
class PosixProcessRunner : public IProcessRunner
{
public:
    ProcessResult run(
        const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const override;
};

} // namespace memescalate
