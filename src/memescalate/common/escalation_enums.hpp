/**
 * @file escalation_enums.hpp
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for array task indices.
 *
 * @details
 * `TaskIdx` is a type alias for `size_t` used to identify tasks of a scheduler array job.
 * A non-array job is reported as task 0. This alias exists for clarity in API signatures and
 * documentation, not for compile-time type safety.
 */
using TaskIdx = size_t;

/**
 * @brief An ordered set of task indices with no duplicates.
 */
using IndexSet = std::set<TaskIdx>;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Lifecycle status of an escalation chain.
 *
 * @details
 * `Starting`, `Running` and `Escalating` are transient. `Completed` and the three
 * `FailedMax*` values are terminal: once reached, only an explicit reset (re-creating the
 * chain with overwrite) replaces them.
 */
enum class ChainStatus
{
    Starting,
    Running,
    Escalating,
    Completed,
    FailedMaxMemory,
    FailedMaxTime,
    FailedMaxLevel
};

/**
 * @brief Status of one scheduler submission round.
 */
enum class RoundStatus
{
    Running,
    Completed,
    Escalating,
    Pending
};

/**
 * @brief Why the most recent escalation happened.
 */
enum class EscalationReason
{
    None,
    Oom,
    Timeout,
    Mixed
};

/**
 * @brief Why a chain stopped at the top of its ladder.
 */
enum class FailureReason
{
    Memory,
    Time,
    Level
};

/**
 * @brief What to do with a task after a round.
 */
enum class TaskAction
{
    Complete,
    Escalate,
    NoRetry
};

/**
 * @brief Failure category of a task, used for reporting only.
 */
enum class FailureKind
{
    None,
    Oom,
    Timeout,
    Other
};

// ============================================================================
// String conversion
// ============================================================================

/**
 * @brief Checkpoint spelling of each enumerator, e.g. `FAILED_MAX_MEMORY`.
 */
std::string to_string(ChainStatus status);
std::string to_string(RoundStatus status);
std::string to_string(EscalationReason reason);
std::string to_string(FailureReason reason);
std::string to_string(TaskAction action);
std::string to_string(FailureKind kind);

/**
 * @brief Parse the checkpoint spelling back.
 * @throw EscalationError with `CheckpointIO` for unknown spellings.
 */
ChainStatus parse_chain_status(const std::string& text);
RoundStatus parse_round_status(const std::string& text);
EscalationReason parse_escalation_reason(const std::string& text);

/**
 * @brief Parse a failure reason given on the command line (`MEMORY`, `TIME`, `LEVEL`).
 * @throw EscalationError with `InvalidArgument` for unknown spellings.
 */
FailureReason parse_failure_reason(const std::string& text);

/**
 * @brief Parse a rule action from configuration (`escalate`, `no_retry`).
 * @throw EscalationError with `ConfigError` for unknown spellings.
 */
TaskAction parse_rule_action(const std::string& text);

/**
 * @brief Check whether a chain status is terminal.
 */
bool is_terminal(ChainStatus status) noexcept;

/**
 * @brief Map a failure reason to the terminal status it produces.
 */
ChainStatus failed_status_for(FailureReason reason) noexcept;

} // namespace memescalate
