/**
 * @file sacct_parser.hpp
 * @brief Parsers for `sacct --parsable2` and `squeue` output.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"
#include "memescalate/classify/outcome_classifier.hpp"

namespace memescalate
{

/**
 * @brief Accounting of one array task, one line of sacct output.
 */
struct TaskAccounting
{
    /**
     * @brief Raw JobID field, e.g. `4242_7`.
     */
    std::string job_id;

    TaskIdx task_id{0};

    /**
     * @brief First word of the state, e.g. `CANCELLED` for `CANCELLED by 1000`.
     */
    std::string state;

    /**
     * @brief Raw `return_code:signal` field.
     */
    std::string exit_code;

    int return_code{0};
    int signal{0};
    std::string max_rss;
    std::string elapsed;
    std::string timelimit;
    std::string node;
    std::string submit_time;
    std::string start_time;
    std::string end_time;

    RawTaskResult to_raw_result() const
    {
        return RawTaskResult{task_id, state, exit_code};
    }
};

/**
 * @brief Task index of a sacct JobID.
 *
 * @details
 * `4242_7` gives 7 and `4242` gives 0. Pending placeholders such as `4242_[5-9]` and other
 * non-numeric suffixes give `std::nullopt`.
 */
std::optional<TaskIdx> parse_task_id(const std::string& job_field);

/**
 * @brief Parse `sacct -n -X --parsable2` output.
 *
 * @details
 * Fields are `JobID|State|ExitCode|MaxRSS|Elapsed|Timelimit|NodeList|Submit|Start|End`.
 * Lines with fewer than the first three fields are skipped, as are placeholder JobIDs.
 * Missing trailing fields are left empty.
 */
std::vector<TaskAccounting> parse_sacct_output(const std::string& output);

/**
 * @brief First word of `squeue -h -o "%T %r"` output, or `std::nullopt` if empty.
 */
std::optional<std::string> parse_squeue_state(const std::string& output);

} // namespace memescalate
