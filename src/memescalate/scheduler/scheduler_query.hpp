/**
 * @file scheduler_query.hpp
 * @brief ISchedulerQuery interface and the Slurm implementation.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/classify/outcome_classifier.hpp"
#include "memescalate/scheduler/process_runner.hpp"
#include "memescalate/scheduler/sacct_parser.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief Read-only access to the cluster scheduler's job status.
 *
 * @details
 * Queries never throw. Any failure is reported as "no data": an empty vector or
 * `std::nullopt`.
 */
class ISchedulerQuery
{
public:
    virtual ~ISchedulerQuery() = default;

    /**
     * @brief Terminal per-task results of one or more jobs, for classification.
     */
    virtual std::vector<RawTaskResult> query_task_results(
        const std::vector<std::string>& job_ids) const = 0;

    /**
     * @brief Full accounting of one job's tasks.
     */
    virtual std::vector<TaskAccounting> query_task_accounting(const std::string& job_id) const = 0;

    /**
     * @brief Queue state (`PENDING`, `RUNNING`, ...) of a job still in the queue.
     */
    virtual std::optional<std::string> query_queue_state(const std::string& job_id) const = 0;
};

/**
 * @brief Queries Slurm through `sacct` and `squeue`.
 */
class SlurmSchedulerQuery : public ISchedulerQuery
{
public:
    /**
     * @param runner Command runner; a PosixProcessRunner if null.
     * @param timeout Limit for each command.
     */
    explicit SlurmSchedulerQuery(
        std::shared_ptr<const IProcessRunner> runner = nullptr,
        std::chrono::milliseconds timeout = kDefaultTimeout);

    std::vector<RawTaskResult> query_task_results(
        const std::vector<std::string>& job_ids) const override;
    std::vector<TaskAccounting> query_task_accounting(const std::string& job_id) const override;
    std::optional<std::string> query_queue_state(const std::string& job_id) const override;

    /**
     * @brief sacct arguments for the given job id list.
     */
    static std::vector<std::string> sacct_command(const std::string& job_ids);

    static std::vector<std::string> squeue_command(const std::string& job_id);

    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

private:
    /**
     * @brief Run a command; empty output on any failure.
     */
    std::optional<std::string> run_quietly(const std::vector<std::string>& argv) const;

    std::shared_ptr<const IProcessRunner> m_runner;
    std::chrono::milliseconds m_timeout;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace memescalate
