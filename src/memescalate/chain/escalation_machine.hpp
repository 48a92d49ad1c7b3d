/**
 * @file escalation_machine.hpp
 * @brief Checkpointed state machine driving a chain up its resource ladder.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"
#include "memescalate/chain/checkpoint_store.hpp"
#include "memescalate/audit/audit_sink.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief Arguments of an escalation to the next tier.
 */
struct EscalationRequest
{
    size_t next_level{0};
    std::string next_memory;

    /**
     * @brief Compressed spec of the indices being retried.
     */
    std::string escalate_spec;

    /**
     * @brief Job ids of the retry submission, one per batch.
     */
    std::vector<std::string> retry_job_ids;

    std::string handler_id;

    /**
     * @brief Tasks that completed in the round being closed.
     */
    size_t completed_count{0};

    size_t escalate_count{0};
    size_t oom_count{0};
    size_t timeout_count{0};

    /**
     * @brief Tasks of the closed round that failed and will not be retried.
     */
    size_t failed_count{0};
};

/**
 * @brief Applies chain transitions through a checkpoint store.
 *
 * @details
 * Each transition is one load-mutate-save cycle of the whole record, with `updated` set to
 * the current time and `revision` bumped.
 *
 * Transitions return `false` without touching the record when:
 * - the chain has no checkpoint, or the checkpoint cannot be read or written;
 * - the chain is already in a terminal status.
 *
 * Both cases are logged. Errors that would break the ladder's invariants (a level above
 * the ladder, indices outside the chain, a malformed spec) are thrown.
 *
 * After each applied transition the optional audit sink receives an action entry and the
 * new record.
 *
 * @par Thread safety
 * - Not thread-safe. One instance serves one short-lived invocation.
 * - No locking across processes: overlapping transitions on one chain are last-writer-wins.
 */
class EscalationMachine
{
public:
    /**
     * @brief Construct a machine over a store.
     * @param store Checkpoint store; must outlive the machine.
     * @param audit Optional audit sink; must outlive the machine if given.
     */
    explicit EscalationMachine(ICheckpointStore& store, IAuditSink* audit = nullptr);

    /**
     * @brief Create a chain at level 0 with status STARTING.
     * @param overwrite Replace an existing chain (logged as a warning) instead of failing.
     * @return The record as written.
     * @throw EscalationError with `ChainExists` if the chain exists and `overwrite` is false,
     *        `InvalidArgument` if the chain is invalid, `CheckpointIO` on write failure.
     */
    ChainRecord create_chain(const EscalationChain& chain, bool overwrite = true);

    /**
     * @brief Append a RUNNING round and set the chain RUNNING.
     * @throw EscalationError with `InvalidLevel` if `level` is above the ladder.
     */
    bool record_round(
        const std::string& chain_id,
        const std::vector<std::string>& job_ids,
        const std::string& handler_id,
        const std::string& array_spec,
        size_t level,
        const std::string& memory);

    /**
     * @brief Close the last round as ESCALATING and append a PENDING retry round.
     *
     * @details
     * The chain moves to `next_level` with the tier's time limit, its pending indices become
     * `escalate_spec`, and the closed round's completed and failed counts are added to the
     * chain totals.
     *
     * @throw EscalationError with `InvalidLevel` if `next_level` is above the ladder,
     *        `CodecInput` if the spec is malformed, `InvalidArgument` if it names indices
     *        outside the chain.
     */
    bool escalate(const std::string& chain_id, const EscalationRequest& request);

    /**
     * @brief Set the chain COMPLETED and clear its pending indices.
     *
     * @details
     * The round owning `job_id`, or the last round if none does, is marked COMPLETED with
     * `completed_count`. A second call is skipped by the terminal guard.
     */
    bool mark_completed(
        const std::string& chain_id, const std::string& job_id, size_t completed_count);

    /**
     * @brief Set the chain FAILED_MAX_<reason> and keep only the never-retried indices.
     * @throw EscalationError with `CodecInput` or `InvalidArgument` for a bad index spec.
     */
    bool mark_failed(
        const std::string& chain_id, const std::string& failed_indices, FailureReason reason);

    /**
     * @brief Load a chain's record.
     * @throw EscalationError with `ChainNotFound` if absent, `CheckpointIO` if unreadable.
     */
    ChainRecord load(const std::string& chain_id) const;

private:
    using Mutation = std::function<AuditEntry(ChainRecord&)>;

    /**
     * @brief Run one guarded load-mutate-save cycle.
     * @return True if the mutation was applied and saved.
     */
    bool apply(const std::string& chain_id, const char* operation, const Mutation& mutation);

    void notify(const AuditEntry& entry, const ChainRecord& record);

    void check_level(const ChainRecord& record, size_t level) const;
    void check_indices(const ChainRecord& record, const std::string& spec) const;

    ICheckpointStore& m_store;
    IAuditSink* m_audit;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace memescalate
