/**
 * @file escalation_machine.cpp
 */
#include "memescalate/chain/escalation_machine.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"
#include "memescalate/common/text_utils.hpp"

namespace memescalate
{

namespace
{

EscalationReason reason_from_counts(size_t oom_count, size_t timeout_count)
{
    if (oom_count > 0 && timeout_count > 0)
    {
        return EscalationReason::Mixed;
    }
    if (oom_count > 0)
    {
        return EscalationReason::Oom;
    }
    if (timeout_count > 0)
    {
        return EscalationReason::Timeout;
    }
    return EscalationReason::None;
}

AuditEntry make_entry(const ChainRecord& record, const char* action_type)
{
    AuditEntry entry;
    entry.timestamp = record.updated;
    entry.chain_id = record.chain.chain_id;
    entry.action_type = action_type;
    entry.memory_level = record.state.current_level;
    return entry;
}

} // namespace

EscalationMachine::EscalationMachine(ICheckpointStore& store, IAuditSink* audit)
    : m_store(store)
    , m_audit(audit)
    , m_log(get_logger())
{
}

ChainRecord EscalationMachine::load(const std::string& chain_id) const
{
    auto record = m_store.load(chain_id);
    if (!record)
    {
        throw EscalationError(EscalationErrorCode::ChainNotFound,
            "No checkpoint for chain " + chain_id + " at " + m_store.location_of(chain_id));
    }
    return *std::move(record);
}

// ============================================================================
// Transitions
// ============================================================================

ChainRecord EscalationMachine::create_chain(const EscalationChain& chain, bool overwrite)
{
    ChainRecord record = make_initial_record(chain, now_timestamp());

    if (m_store.exists(chain.chain_id))
    {
        if (!overwrite)
        {
            throw EscalationError(EscalationErrorCode::ChainExists,
                "Chain " + chain.chain_id + " already exists at " +
                m_store.location_of(chain.chain_id));
        }
        SPDLOG_LOGGER_WARN(m_log, "Chain {} already exists, overwriting {}",
            chain.chain_id, m_store.location_of(chain.chain_id));
    }

    record.revision = 1;
    m_store.save(record);
    SPDLOG_LOGGER_INFO(m_log, "Created chain {} ({} mode, {} levels, spec '{}')",
        chain.chain_id, chain.mode(), chain.levels.size(), chain.original_array_spec);

    AuditEntry entry = make_entry(record, "CREATED");
    entry.indices = chain.original_array_spec;
    entry.details = chain.script;
    notify(entry, record);
    return record;
}

bool EscalationMachine::record_round(
    const std::string& chain_id,
    const std::vector<std::string>& job_ids,
    const std::string& handler_id,
    const std::string& array_spec,
    size_t level,
    const std::string& memory)
{
    return apply(chain_id, "record-round", [&](ChainRecord& record) {
        check_level(record, level);
        const ResourceLevel& tier = record.chain.levels[level];

        Round round;
        round.ordinal = record.rounds.size() + 1;
        round.job_ids = job_ids;
        round.handler_id = handler_id;
        round.array_spec = array_spec;
        round.level = level;
        round.memory = memory;
        round.time = tier.time;
        round.partition = tier.partition;
        round.status = RoundStatus::Running;
        round.submitted = record.updated;
        record.rounds.push_back(round);

        record.state.status = ChainStatus::Running;
        record.state.current_level = level;
        record.state.current_memory = memory;
        record.state.current_time = tier.time;

        SPDLOG_LOGGER_INFO(m_log, "Chain {} round {}: jobs {} at level {} ({})",
            chain_id, round.ordinal, join_strings(job_ids, ","), level, memory);

        AuditEntry entry = make_entry(record, "SUBMITTED");
        entry.job_id = join_strings(job_ids, ",");
        entry.indices = array_spec;
        entry.details = "handler " + handler_id;
        return entry;
    });
}

bool EscalationMachine::escalate(const std::string& chain_id, const EscalationRequest& request)
{
    return apply(chain_id, "escalate", [&](ChainRecord& record) {
        check_level(record, request.next_level);
        check_indices(record, request.escalate_spec);
        const ResourceLevel& tier = record.chain.levels[request.next_level];

        ChainState& state = record.state;
        state.current_level = request.next_level;
        state.current_memory = request.next_memory;
        state.current_time = tier.time;
        state.pending_indices = request.escalate_spec;
        state.status = ChainStatus::Escalating;
        state.escalate_count = request.escalate_count;
        state.completed_count += request.completed_count;
        state.failed_count += request.failed_count;
        state.last_escalation_reason = reason_from_counts(request.oom_count, request.timeout_count);

        if (Round* closing = record.last_round())
        {
            closing->status = RoundStatus::Escalating;
            closing->completed_count = request.completed_count;
            closing->oom_count = request.oom_count;
            closing->timeout_count = request.timeout_count;
            closing->failed_count = request.failed_count;
            closing->escalate_indices = request.escalate_spec;
        }

        Round retry;
        retry.ordinal = record.rounds.size() + 1;
        retry.job_ids = request.retry_job_ids;
        retry.handler_id = request.handler_id;
        retry.array_spec = request.escalate_spec;
        retry.level = request.next_level;
        retry.memory = request.next_memory;
        retry.time = tier.time;
        retry.partition = tier.partition;
        retry.status = RoundStatus::Pending;
        retry.submitted = record.updated;
        record.rounds.push_back(retry);

        SPDLOG_LOGGER_INFO(m_log, "Chain {} escalated to level {}/{} ({}, {}): {} tasks '{}' ({})",
            chain_id, request.next_level, record.chain.max_level(), request.next_memory,
            tier.time, request.escalate_count, request.escalate_spec,
            to_string(state.last_escalation_reason));

        AuditEntry entry = make_entry(record, "ESCALATED");
        entry.job_id = join_strings(request.retry_job_ids, ",");
        entry.indices = request.escalate_spec;
        entry.details = to_string(state.last_escalation_reason) + ": " +
            std::to_string(request.oom_count) + " OOM, " +
            std::to_string(request.timeout_count) + " TIMEOUT, " +
            std::to_string(request.failed_count) + " not retried";
        return entry;
    });
}

bool EscalationMachine::mark_completed(
    const std::string& chain_id, const std::string& job_id, size_t completed_count)
{
    return apply(chain_id, "mark-completed", [&](ChainRecord& record) {
        record.state.status = ChainStatus::Completed;
        record.state.completed_count += completed_count;
        record.state.pending_indices.clear();
        record.state.escalate_count = 0;

        Round* round = record.find_round_by_job(job_id);
        if (!round)
        {
            round = record.last_round();
        }
        if (round)
        {
            round->status = RoundStatus::Completed;
            round->completed_count = completed_count;
        }

        SPDLOG_LOGGER_INFO(m_log, "Chain {} completed at level {} ({} tasks in total)",
            chain_id, record.state.current_level, record.state.completed_count);

        AuditEntry entry = make_entry(record, "COMPLETED");
        entry.job_id = job_id;
        entry.details = std::to_string(completed_count) + " tasks completed";
        return entry;
    });
}

bool EscalationMachine::mark_failed(
    const std::string& chain_id, const std::string& failed_indices, FailureReason reason)
{
    return apply(chain_id, "mark-failed", [&](ChainRecord& record) {
        check_indices(record, failed_indices);
        const size_t count = count_indices(failed_indices);

        record.state.status = failed_status_for(reason);
        record.state.failed_indices = failed_indices;
        record.state.pending_indices = failed_indices;
        record.state.failed_count += count;
        record.state.escalate_count = 0;

        SPDLOG_LOGGER_WARN(m_log, "Chain {} failed at level {} ({}): {} tasks '{}'",
            chain_id, record.state.current_level, to_string(record.state.status), count,
            failed_indices);

        AuditEntry entry = make_entry(record, "FAILED");
        entry.indices = failed_indices;
        entry.details = "FAILED_MAX_" + to_string(reason);
        return entry;
    });
}

// ============================================================================
// Helpers
// ============================================================================

bool EscalationMachine::apply(
    const std::string& chain_id, const char* operation, const Mutation& mutation)
{
    std::optional<ChainRecord> loaded;
    try
    {
        loaded = m_store.load(chain_id);
    }
    catch (const EscalationError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "{} skipped for chain {}: {}", operation, chain_id, e.what());
        return false;
    }
    if (!loaded)
    {
        SPDLOG_LOGGER_WARN(m_log, "{} skipped: no checkpoint for chain {} at {}",
            operation, chain_id, m_store.location_of(chain_id));
        return false;
    }

    ChainRecord record = *std::move(loaded);
    if (is_terminal(record.state.status))
    {
        SPDLOG_LOGGER_INFO(m_log, "{} skipped: chain {} is already {}",
            operation, chain_id, to_string(record.state.status));
        return false;
    }

    record.updated = now_timestamp();
    AuditEntry entry = mutation(record);
    record.revision += 1;

    try
    {
        m_store.save(record);
    }
    catch (const EscalationError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "{} not saved for chain {}: {}", operation, chain_id, e.what());
        return false;
    }

    notify(entry, record);
    return true;
}

void EscalationMachine::notify(const AuditEntry& entry, const ChainRecord& record)
{
    if (!m_audit)
    {
        return;
    }
    m_audit->log_action(entry);
    m_audit->sync_chain(record);
}

void EscalationMachine::check_level(const ChainRecord& record, size_t level) const
{
    if (level > record.chain.max_level())
    {
        throw EscalationError(EscalationErrorCode::InvalidLevel,
            "Level " + std::to_string(level) + " is above the top level " +
            std::to_string(record.chain.max_level()) + " of chain " + record.chain.chain_id);
    }
}

void EscalationMachine::check_indices(const ChainRecord& record, const std::string& spec) const
{
    const IndexSet indices = expand_indices(spec);
    if (record.chain.total_tasks == 0 || indices.empty())
    {
        return;
    }
    if (*indices.rbegin() >= record.chain.total_tasks)
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            "Index " + std::to_string(*indices.rbegin()) + " is outside chain " +
            record.chain.chain_id + " of " + std::to_string(record.chain.total_tasks) +
            " tasks");
    }
}

} // namespace memescalate
