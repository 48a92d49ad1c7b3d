/**
 * @file chain_record.hpp
 * @brief Persisted data model of an escalation chain.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"
#include "memescalate/common/resource_level.hpp"

namespace memescalate
{

// ============================================================================
// EscalationChain
// ============================================================================

/**
 * @brief Identity of one logical unit of work. Immutable after creation.
 */
struct EscalationChain
{
    std::string chain_id;
    std::string script;
    std::vector<std::string> script_args;

    /**
     * @brief Index spec submitted in the first round; empty for single jobs.
     */
    std::string original_array_spec;

    /**
     * @brief Number of array tasks; 0 for a non-array chain.
     */
    size_t total_tasks{0};

    /**
     * @brief Resource ladder, lowest tier first.
     */
    std::vector<ResourceLevel> levels;

    /**
     * @brief Highest valid level index.
     * @pre `levels` is not empty.
     */
    size_t max_level() const noexcept
    {
        return levels.size() - 1;
    }

    /**
     * @brief `single` for non-array chains, `handler_chain` for array chains.
     */
    std::string mode() const
    {
        return total_tasks == 0 ? "single" : "handler_chain";
    }
};

/**
 * @brief Reject chains that cannot be persisted or escalated.
 * @throw EscalationError with `InvalidArgument` if the id is empty or contains a path
 *        separator, the script is empty, or the ladder is empty.
 */
void validate_chain(const EscalationChain& chain);

// ============================================================================
// ChainState
// ============================================================================

/**
 * @brief The single mutable part of a chain.
 */
struct ChainState
{
    size_t current_level{0};
    std::string current_memory;
    std::string current_time;
    ChainStatus status{ChainStatus::Starting};

    /**
     * @brief Compressed spec of indices still owed work.
     */
    std::string pending_indices;

    /**
     * @brief Compressed spec of indices that will never be retried, set on failure.
     */
    std::string failed_indices;

    size_t completed_count{0};
    size_t failed_count{0};
    size_t escalate_count{0};
    EscalationReason last_escalation_reason{EscalationReason::None};
};

// ============================================================================
// Round
// ============================================================================

/**
 * @brief One scheduler submission cycle at a fixed tier.
 *
 * @details
 * Rounds are append-only. Only the last round's status and counts are updated after it is
 * appended, except that MarkCompleted may close out the round that owns the finishing job.
 */
struct Round
{
    /**
     * @brief 1-based position in the chain.
     */
    size_t ordinal{1};

    /**
     * @brief Scheduler job ids, one per batch, in submission order.
     */
    std::vector<std::string> job_ids;

    std::string handler_id;
    std::string array_spec;
    size_t level{0};
    std::string memory;
    std::string time;
    std::string partition;
    RoundStatus status{RoundStatus::Running};

    size_t completed_count{0};
    size_t oom_count{0};
    size_t timeout_count{0};
    size_t failed_count{0};

    /**
     * @brief Spec of the indices this round handed to the next one.
     */
    std::string escalate_indices;

    std::string submitted;

    /**
     * @brief First job id, or empty if none was recorded.
     */
    std::string primary_job_id() const
    {
        return job_ids.empty() ? std::string() : job_ids.front();
    }

    bool owns_job(const std::string& job_id) const
    {
        return std::find(job_ids.begin(), job_ids.end(), job_id) != job_ids.end();
    }
};

// ============================================================================
// ChainRecord
// ============================================================================

/**
 * @brief Everything persisted for one chain.
 *
 * @details
 * The checkpoint store reads and writes whole records. `revision` is bumped on every save
 * and is not compared on write: two overlapping read-modify-write cycles on the same chain
 * keep only the later one.
 */
struct ChainRecord
{
    EscalationChain chain;
    ChainState state;
    std::vector<Round> rounds;
    std::string created;
    std::string updated;
    uint64_t revision{0};

    /**
     * @brief The most recent round, or nullptr before the first submission.
     */
    Round* last_round() noexcept
    {
        return rounds.empty() ? nullptr : &rounds.back();
    }

    const Round* last_round() const noexcept
    {
        return rounds.empty() ? nullptr : &rounds.back();
    }

    /**
     * @brief The first round whose job ids contain `job_id`, or nullptr.
     */
    Round* find_round_by_job(const std::string& job_id);

    /**
     * @brief All job ids of all rounds, in order.
     */
    std::vector<std::string> all_job_ids() const;
};

/**
 * @brief Build the initial record of a new chain: level 0, first tier, STARTING.
 * @param timestamp Used for both `created` and `updated`.
 * @throw EscalationError with `InvalidArgument` if the chain is invalid.
 */
ChainRecord make_initial_record(const EscalationChain& chain, const std::string& timestamp);

} // namespace memescalate
