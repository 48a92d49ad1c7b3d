/**
 * @file outcome_classifier.hpp
 * @brief Turns raw per-task scheduler results into retry decisions.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"
#include "memescalate/classify/classification_rules.hpp"

namespace memescalate
{

/**
 * @brief One terminal task record as reported by the scheduler.
 */
struct RawTaskResult
{
    TaskIdx task_id{0};

    /**
     * @brief Scheduler state, e.g. `OUT_OF_MEMORY` or `CANCELLED`.
     */
    std::string state;

    /**
     * @brief Exit code in `return_code:signal` form, e.g. `137:0`.
     */
    std::string exit_code;
};

/**
 * @brief Classification of one task.
 */
struct TaskOutcome
{
    TaskIdx task_id{0};
    std::string state;
    std::string exit_code;
    TaskAction action{TaskAction::NoRetry};
    FailureKind failure_kind{FailureKind::None};
};

/**
 * @brief Result of classifying one round.
 *
 * @details
 * `completed`, `escalate` and `no_retry` partition the distinct task ids seen. `oom` and
 * `timeout` are reporting sub-tallies of failed tasks and are independent of the action taken:
 * an OOM task forced to no_retry by an exit-code override is still counted as OOM.
 */
struct ClassificationResult
{
    IndexSet completed;
    IndexSet escalate;
    IndexSet no_retry;
    IndexSet oom;
    IndexSet timeout;

    /**
     * @brief Per-task outcomes in input order.
     */
    std::vector<TaskOutcome> outcomes;

    size_t total_count() const noexcept
    {
        return outcomes.size();
    }

    size_t oom_count() const noexcept
    {
        return oom.size();
    }

    size_t timeout_count() const noexcept
    {
        return timeout.size();
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Classified " + std::to_string(total_count()) + " tasks";
        result += " (completed=" + std::to_string(completed.size());
        result += ", escalate=" + std::to_string(escalate.size());
        result += ", no_retry=" + std::to_string(no_retry.size());
        result += ", oom=" + std::to_string(oom.size());
        result += ", timeout=" + std::to_string(timeout.size()) + ")";
        return result;
    }
};

/**
 * @brief Extract the return-code portion of a `return_code:signal` exit code.
 * @return The return code, or `std::nullopt` if it is not an integer.
 */
std::optional<int> parse_return_code(const std::string& exit_code);

/**
 * @brief Classify a single task.
 *
 * @details
 * - A state containing `COMPLETED` is always COMPLETE.
 * - Otherwise an exit-code override, if present for the return code, wins outright.
 * - Otherwise the first state rule whose pattern occurs in the state decides.
 * - Otherwise the task is not retried.
 */
TaskOutcome classify_task(const RawTaskResult& raw, const ClassificationRules& rules);

/**
 * @brief Classify all tasks of a round. Pure function of its inputs.
 */
ClassificationResult classify_outcomes(
    const std::vector<RawTaskResult>& raw_results,
    const ClassificationRules& rules);

} // namespace memescalate
