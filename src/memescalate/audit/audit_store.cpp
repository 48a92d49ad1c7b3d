/**
 * @file audit_store.cpp
 */
#include "memescalate/audit/audit_store.hpp"
#include "memescalate/audit/audit_schema.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"
#include "memescalate/common/text_utils.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace memescalate
{

namespace
{

std::string placeholders(size_t count)
{
    std::string result;
    for (size_t i = 0; i < count; ++i)
    {
        result += (i == 0) ? "?" : ",?";
    }
    return result;
}

std::string levels_as_yaml(const std::vector<ResourceLevel>& levels)
{
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& level : levels)
    {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "partition" << YAML::Value << level.partition;
        out << YAML::Key << "mem" << YAML::Value << level.memory;
        out << YAML::Key << "time" << YAML::Value << level.time;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return out.c_str();
}

int64_t as_int(size_t value)
{
    return static_cast<int64_t>(value);
}

} // namespace

AuditStore::AuditStore(std::string db_path)
    : m_db_path(std::move(db_path))
    , m_log(get_logger())
{
}

SqliteDatabase& AuditStore::database()
{
    if (m_db)
    {
        return *m_db;
    }

    const fs::path parent = fs::path(m_db_path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw EscalationError(EscalationErrorCode::AuditWrite,
                "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    auto db = std::make_unique<SqliteDatabase>(m_db_path);
    db->execute(std::string(schema::kAuditSchema));
    m_db = std::move(db);
    return *m_db;
}

bool AuditStore::guarded(const char* what, const std::function<void(SqliteDatabase&)>& body)
{
    try
    {
        body(database());
        return true;
    }
    catch (const EscalationError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "Audit {} failed: {}", what, e.what());
        return false;
    }
}

// ============================================================================
// Writes
// ============================================================================

void AuditStore::log_action(const AuditEntry& entry)
{
    guarded("log_action", [&](SqliteDatabase& db) {
        SqliteStatement insert(db,
            "INSERT INTO actions (timestamp, chain_id, action_type, job_id, memory_level, "
            "time_level, indices, details) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, entry.timestamp.empty() ? now_timestamp() : entry.timestamp)
            .bind(2, entry.chain_id)
            .bind(3, entry.action_type)
            .bind(4, entry.job_id)
            .bind(5, entry.memory_level)
            .bind(6, entry.time_level)
            .bind(7, entry.indices)
            .bind(8, entry.details);
        insert.run();
    });
}

void AuditStore::sync_chain(const ChainRecord& record)
{
    guarded("sync_chain", [&](SqliteDatabase& db) {
        const EscalationChain& chain = record.chain;
        const ChainState& state = record.state;

        SqliteTransaction transaction(db);

        SqliteStatement upsert_chain(db,
            "INSERT INTO chains (chain_id, mode, partition_name, original_script, script_args, "
            "original_array_spec, total_tasks, max_level, created_at, updated_at, status, "
            "current_level, current_memory, current_time_limit, last_escalation_reason, "
            "pending_indices, failed_indices, completed_count, failed_count, escalate_count, "
            "revision) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(chain_id) DO UPDATE SET mode = excluded.mode, "
            "partition_name = excluded.partition_name, "
            "original_script = excluded.original_script, script_args = excluded.script_args, "
            "original_array_spec = excluded.original_array_spec, "
            "total_tasks = excluded.total_tasks, max_level = excluded.max_level, "
            "created_at = excluded.created_at, updated_at = excluded.updated_at, "
            "status = excluded.status, current_level = excluded.current_level, "
            "current_memory = excluded.current_memory, "
            "current_time_limit = excluded.current_time_limit, "
            "last_escalation_reason = excluded.last_escalation_reason, "
            "pending_indices = excluded.pending_indices, "
            "failed_indices = excluded.failed_indices, "
            "completed_count = excluded.completed_count, failed_count = excluded.failed_count, "
            "escalate_count = excluded.escalate_count, revision = excluded.revision");
        upsert_chain.bind(1, chain.chain_id)
            .bind(2, chain.mode())
            .bind(3, chain.levels.empty() ? std::string() : chain.levels.front().partition)
            .bind(4, chain.script)
            .bind(5, join_strings(chain.script_args, " "))
            .bind(6, chain.original_array_spec)
            .bind(7, as_int(chain.total_tasks))
            .bind(8, as_int(chain.levels.empty() ? 0 : chain.max_level()))
            .bind(9, record.created)
            .bind(10, record.updated)
            .bind(11, to_string(state.status))
            .bind(12, as_int(state.current_level))
            .bind(13, state.current_memory)
            .bind(14, state.current_time)
            .bind(15, to_string(state.last_escalation_reason))
            .bind(16, state.pending_indices)
            .bind(17, state.failed_indices)
            .bind(18, as_int(state.completed_count))
            .bind(19, as_int(state.failed_count))
            .bind(20, as_int(state.escalate_count))
            .bind(21, static_cast<int64_t>(record.revision));
        upsert_chain.run();

        SqliteStatement upsert_round(db,
            "INSERT INTO rounds (chain_id, round_num, job_id, job_ids, handler_id, array_spec, "
            "level, memory, time, partition_name, status, submitted_at, completed_count, "
            "oom_count, timeout_count, failed_count, escalate_indices) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(chain_id, round_num) DO UPDATE SET job_id = excluded.job_id, "
            "job_ids = excluded.job_ids, handler_id = excluded.handler_id, "
            "array_spec = excluded.array_spec, level = excluded.level, "
            "memory = excluded.memory, time = excluded.time, "
            "partition_name = excluded.partition_name, status = excluded.status, "
            "submitted_at = excluded.submitted_at, completed_count = excluded.completed_count, "
            "oom_count = excluded.oom_count, timeout_count = excluded.timeout_count, "
            "failed_count = excluded.failed_count, escalate_indices = excluded.escalate_indices");
        for (const auto& round : record.rounds)
        {
            upsert_round.bind(1, chain.chain_id)
                .bind(2, as_int(round.ordinal))
                .bind(3, round.primary_job_id())
                .bind(4, join_strings(round.job_ids, ","))
                .bind(5, round.handler_id)
                .bind(6, round.array_spec)
                .bind(7, as_int(round.level))
                .bind(8, round.memory)
                .bind(9, round.time)
                .bind(10, round.partition)
                .bind(11, to_string(round.status))
                .bind(12, round.submitted)
                .bind(13, as_int(round.completed_count))
                .bind(14, as_int(round.oom_count))
                .bind(15, as_int(round.timeout_count))
                .bind(16, as_int(round.failed_count))
                .bind(17, round.escalate_indices);
            upsert_round.run();
        }

        // Rounds dropped by a chain reset
        SqliteStatement prune(db, "DELETE FROM rounds WHERE chain_id = ? AND round_num > ?");
        prune.bind(1, chain.chain_id).bind(2, as_int(record.rounds.size()));
        prune.run();

        transaction.commit();
    });
}

void AuditStore::save_config(const std::string& chain_id, const EscalationConfig& config)
{
    guarded("save_config", [&](SqliteDatabase& db) {
        SqliteStatement insert(db,
            "INSERT OR REPLACE INTO configs (chain_id, config_yaml, levels_yaml) "
            "VALUES (?, ?, ?)");
        insert.bind(1, chain_id)
            .bind(2, config.source_text)
            .bind(3, levels_as_yaml(config.levels));
        insert.run();
    });
}

void AuditStore::save_tasks(
    const std::string& chain_id,
    size_t round_num,
    const std::string& job_id,
    const std::vector<TaskAccounting>& tasks)
{
    bool saved = guarded("save_tasks", [&](SqliteDatabase& db) {
        std::optional<int64_t> round_id;
        {
            SqliteStatement lookup(db,
                "SELECT id FROM rounds WHERE chain_id = ? AND round_num = ?");
            lookup.bind(1, chain_id).bind(2, as_int(round_num));
            if (lookup.step())
            {
                round_id = lookup.column_int(0);
            }
        }
        if (!round_id)
        {
            SPDLOG_LOGGER_WARN(m_log, "Chain {} has no round {} in {}; tasks stored unlinked",
                chain_id, round_num, m_db_path);
        }

        SqliteTransaction transaction(db);
        SqliteStatement upsert(db,
            "INSERT INTO tasks (chain_id, round_id, job_id, task_id, status, exit_code, signal, "
            "max_rss, elapsed, timelimit, node, submit_time, start_time, end_time) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(chain_id, job_id, task_id) DO UPDATE SET round_id = excluded.round_id, "
            "status = excluded.status, exit_code = excluded.exit_code, "
            "signal = excluded.signal, max_rss = excluded.max_rss, "
            "elapsed = excluded.elapsed, timelimit = excluded.timelimit, "
            "node = excluded.node, submit_time = excluded.submit_time, "
            "start_time = excluded.start_time, end_time = excluded.end_time");
        for (const auto& task : tasks)
        {
            upsert.bind(1, chain_id);
            if (round_id)
            {
                upsert.bind(2, *round_id);
            }
            else
            {
                upsert.bind_null(2);
            }
            upsert.bind(3, job_id)
                .bind(4, as_int(task.task_id))
                .bind(5, task.state)
                .bind(6, static_cast<int64_t>(task.return_code))
                .bind(7, static_cast<int64_t>(task.signal))
                .bind(8, task.max_rss)
                .bind(9, task.elapsed)
                .bind(10, task.timelimit)
                .bind(11, task.node)
                .bind(12, task.submit_time)
                .bind(13, task.start_time)
                .bind(14, task.end_time);
            upsert.run();
        }
        transaction.commit();
    });
    if (saved)
    {
        SPDLOG_LOGGER_INFO(m_log, "Saved {} task records of job {} for chain {}",
            tasks.size(), job_id, chain_id);
    }
}

// ============================================================================
// Reporting reads
// ============================================================================

std::vector<CountRow> AuditStore::status_distribution(
    const std::string& chain_id, const std::vector<std::string>& job_ids)
{
    std::vector<CountRow> rows;
    if (job_ids.empty())
    {
        return rows;
    }
    guarded("status_distribution", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT status, COUNT(*) AS cnt FROM tasks WHERE chain_id = ? AND job_id IN (" +
            placeholders(job_ids.size()) + ") GROUP BY status ORDER BY cnt DESC, status");
        query.bind(1, chain_id);
        for (size_t i = 0; i < job_ids.size(); ++i)
        {
            query.bind(static_cast<int>(i + 2), job_ids[i]);
        }
        while (query.step())
        {
            rows.push_back(CountRow{query.column_text(0),
                static_cast<size_t>(query.column_int(1))});
        }
    });
    return rows;
}

std::optional<RuntimeRange> AuditStore::runtime_range(
    const std::string& chain_id, const std::vector<std::string>& job_ids)
{
    std::optional<RuntimeRange> range;
    if (job_ids.empty())
    {
        return range;
    }
    guarded("runtime_range", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT COUNT(*), MIN(elapsed), MAX(elapsed) FROM tasks WHERE chain_id = ? "
            "AND job_id IN (" + placeholders(job_ids.size()) + ")");
        query.bind(1, chain_id);
        for (size_t i = 0; i < job_ids.size(); ++i)
        {
            query.bind(static_cast<int>(i + 2), job_ids[i]);
        }
        if (query.step() && query.column_int(0) > 0)
        {
            range = RuntimeRange{static_cast<size_t>(query.column_int(0)),
                query.column_text(1), query.column_text(2)};
        }
    });
    return range;
}

std::vector<CountRow> AuditStore::node_distribution(
    const std::string& chain_id, const std::vector<std::string>& job_ids, size_t limit)
{
    std::vector<CountRow> rows;
    if (job_ids.empty())
    {
        return rows;
    }
    guarded("node_distribution", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT node, COUNT(*) AS cnt FROM tasks WHERE chain_id = ? AND job_id IN (" +
            placeholders(job_ids.size()) + ") GROUP BY node ORDER BY cnt DESC, node LIMIT ?");
        query.bind(1, chain_id);
        for (size_t i = 0; i < job_ids.size(); ++i)
        {
            query.bind(static_cast<int>(i + 2), job_ids[i]);
        }
        query.bind(static_cast<int>(job_ids.size() + 2), as_int(limit));
        while (query.step())
        {
            rows.push_back(CountRow{query.column_text(0),
                static_cast<size_t>(query.column_int(1))});
        }
    });
    return rows;
}

std::optional<ChainTaskSummary> AuditStore::chain_task_summary(const std::string& chain_id)
{
    std::optional<ChainTaskSummary> summary;
    guarded("chain_task_summary", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT COUNT(*), "
            "COALESCE(SUM(CASE WHEN status = 'COMPLETED' THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(CASE WHEN status = 'OUT_OF_MEMORY' THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(CASE WHEN status = 'TIMEOUT' THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(CASE WHEN status = 'FAILED' THEN 1 ELSE 0 END), 0) "
            "FROM tasks WHERE chain_id = ?");
        query.bind(1, chain_id);
        if (query.step() && query.column_int(0) > 0)
        {
            ChainTaskSummary s;
            s.total = static_cast<size_t>(query.column_int(0));
            s.completed = static_cast<size_t>(query.column_int(1));
            s.oom = static_cast<size_t>(query.column_int(2));
            s.timeout = static_cast<size_t>(query.column_int(3));
            s.failed = static_cast<size_t>(query.column_int(4));
            summary = s;
        }
    });
    return summary;
}

std::vector<FailedTaskRow> AuditStore::failed_tasks(const std::string& chain_id, size_t limit)
{
    std::vector<FailedTaskRow> rows;
    guarded("failed_tasks", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT task_id, status, exit_code, node, elapsed FROM tasks WHERE chain_id = ? "
            "AND (status = 'FAILED' OR status LIKE '%CANCEL%') ORDER BY task_id LIMIT ?");
        query.bind(1, chain_id).bind(2, as_int(limit));
        while (query.step())
        {
            FailedTaskRow row;
            row.task_id = static_cast<TaskIdx>(query.column_int(0));
            row.status = query.column_text(1);
            row.exit_code = query.column_int(2);
            row.node = query.column_text(3);
            row.elapsed = query.column_text(4);
            rows.push_back(std::move(row));
        }
    });
    return rows;
}

std::vector<AuditEntry> AuditStore::actions(const std::string& chain_id)
{
    std::vector<AuditEntry> entries;
    guarded("actions", [&](SqliteDatabase& db) {
        SqliteStatement query(db,
            "SELECT timestamp, chain_id, action_type, job_id, memory_level, time_level, "
            "indices, details FROM actions WHERE chain_id = ? ORDER BY id");
        query.bind(1, chain_id);
        while (query.step())
        {
            AuditEntry entry;
            entry.timestamp = query.column_text(0);
            entry.chain_id = query.column_text(1);
            entry.action_type = query.column_text(2);
            entry.job_id = query.column_text(3);
            if (!query.column_is_null(4))
            {
                entry.memory_level = static_cast<size_t>(query.column_int(4));
            }
            if (!query.column_is_null(5))
            {
                entry.time_level = static_cast<size_t>(query.column_int(5));
            }
            entry.indices = query.column_text(6);
            entry.details = query.column_text(7);
            entries.push_back(std::move(entry));
        }
    });
    return entries;
}

} // namespace memescalate
