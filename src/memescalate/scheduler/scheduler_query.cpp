/**
 * @file scheduler_query.cpp
 */
#include "memescalate/scheduler/scheduler_query.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"
#include "memescalate/common/text_utils.hpp"

namespace memescalate
{

SlurmSchedulerQuery::SlurmSchedulerQuery(
    std::shared_ptr<const IProcessRunner> runner, std::chrono::milliseconds timeout)
    : m_runner(runner ? std::move(runner) : std::make_shared<PosixProcessRunner>())
    , m_timeout(timeout)
    , m_log(get_logger())
{
}

std::vector<std::string> SlurmSchedulerQuery::sacct_command(const std::string& job_ids)
{
    return {"sacct", "-n", "-X", "-j", job_ids, "-o",
        "JobID,State,ExitCode,MaxRSS,Elapsed,Timelimit,NodeList,Submit,Start,End", "--parsable2"};
}

std::vector<std::string> SlurmSchedulerQuery::squeue_command(const std::string& job_id)
{
    return {"squeue", "-j", job_id, "-h", "-o", "%T %r"};
}

std::optional<std::string> SlurmSchedulerQuery::run_quietly(
    const std::vector<std::string>& argv) const
{
    const std::string command = join_strings(argv, " ");
    try
    {
        ProcessResult result = m_runner->run(argv, m_timeout);
        if (result.timed_out)
        {
            SPDLOG_LOGGER_WARN(m_log, "'{}' timed out after {} ms", command, m_timeout.count());
            return std::nullopt;
        }
        if (result.exit_status != 0)
        {
            SPDLOG_LOGGER_WARN(m_log, "'{}' exited with status {}", command, result.exit_status);
            return std::nullopt;
        }
        return result.output;
    }
    catch (const EscalationError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "{}", e.what());
        return std::nullopt;
    }
}

std::vector<RawTaskResult> SlurmSchedulerQuery::query_task_results(
    const std::vector<std::string>& job_ids) const
{
    std::vector<RawTaskResult> results;
    if (job_ids.empty())
    {
        return results;
    }
    auto output = run_quietly(sacct_command(join_strings(job_ids, ",")));
    if (!output)
    {
        return results;
    }
    for (const auto& task : parse_sacct_output(*output))
    {
        results.push_back(task.to_raw_result());
    }
    SPDLOG_LOGGER_DEBUG(m_log, "sacct reported {} tasks for jobs {}",
        results.size(), join_strings(job_ids, ","));
    return results;
}

std::vector<TaskAccounting> SlurmSchedulerQuery::query_task_accounting(
    const std::string& job_id) const
{
    auto output = run_quietly(sacct_command(job_id));
    if (!output)
    {
        return {};
    }
    return parse_sacct_output(*output);
}

std::optional<std::string> SlurmSchedulerQuery::query_queue_state(const std::string& job_id) const
{
    auto output = run_quietly(squeue_command(job_id));
    if (!output)
    {
        return std::nullopt;
    }
    return parse_squeue_state(*output);
}

} // namespace memescalate
