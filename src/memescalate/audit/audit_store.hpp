/**
 * @file audit_store.hpp
 * @brief SQLite mirror of chain transitions, used for reporting.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/audit/audit_sink.hpp"
#include "memescalate/audit/sqlite_handle.hpp"
#include "memescalate/config/escalation_config.hpp"
#include "memescalate/scheduler/sacct_parser.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief A value and how many task rows have it.
 */
struct CountRow
{
    std::string key;
    size_t count{0};
};

/**
 * @brief Elapsed-time bounds of a set of task rows, in sacct notation.
 */
struct RuntimeRange
{
    size_t task_count{0};
    std::string min_elapsed;
    std::string max_elapsed;
};

/**
 * @brief Per-chain tally of stored task rows by terminal state.
 */
struct ChainTaskSummary
{
    size_t total{0};
    size_t completed{0};
    size_t oom{0};
    size_t timeout{0};
    size_t failed{0};
};

/**
 * @brief One failed or cancelled task row.
 */
struct FailedTaskRow
{
    TaskIdx task_id{0};
    std::string status;
    int64_t exit_code{0};
    std::string node;
    std::string elapsed;
};

/**
 * @brief Best-effort SQLite audit database.
 *
 * @details
 * The database is opened, and the schema applied, on first use; the parent directory is
 * created if missing. Every write is wrapped so that a failure is logged as a warning and
 * swallowed: the checkpoint is authoritative and the audit trail is not. Reporting reads
 * return empty results on failure.
 *
 * @par Thread safety
 * - Not thread-safe. SQLite's own locking serializes separate processes.
 */
class AuditStore : public IAuditSink
{
public:
    explicit AuditStore(std::string db_path);

    // ========================================================================
    // Writes
    // ========================================================================

    void log_action(const AuditEntry& entry) override;

    /**
     * @brief Upsert the chain row and one row per round.
     */
    void sync_chain(const ChainRecord& record) override;

    /**
     * @brief Store the configuration text and its ladder for a chain.
     */
    void save_config(const std::string& chain_id, const EscalationConfig& config);

    /**
     * @brief Upsert per-task accounting of one job of a round.
     * @param round_num 1-based round ordinal, used to link rows to the round.
     */
    void save_tasks(
        const std::string& chain_id,
        size_t round_num,
        const std::string& job_id,
        const std::vector<TaskAccounting>& tasks);

    // ========================================================================
    // Reporting reads
    // ========================================================================

    /**
     * @brief Task rows of the given jobs grouped by status, most frequent first.
     */
    std::vector<CountRow> status_distribution(
        const std::string& chain_id, const std::vector<std::string>& job_ids);

    std::optional<RuntimeRange> runtime_range(
        const std::string& chain_id, const std::vector<std::string>& job_ids);

    /**
     * @brief Task rows of the given jobs grouped by node, most loaded first.
     */
    std::vector<CountRow> node_distribution(
        const std::string& chain_id, const std::vector<std::string>& job_ids, size_t limit = 10);

    std::optional<ChainTaskSummary> chain_task_summary(const std::string& chain_id);

    /**
     * @brief FAILED and CANCELLED task rows of a chain, by task id.
     */
    std::vector<FailedTaskRow> failed_tasks(const std::string& chain_id, size_t limit = 20);

    /**
     * @brief Action log of a chain, oldest first.
     */
    std::vector<AuditEntry> actions(const std::string& chain_id);

    const std::string& db_path() const noexcept
    {
        return m_db_path;
    }

private:
    /**
     * @brief Open the database and apply the schema if not done yet.
     * @throw EscalationError with `AuditWrite` on failure.
     */
    SqliteDatabase& database();

    /**
     * @brief Run `body`, logging and swallowing audit errors.
     * @return False if `body` failed.
     */
    bool guarded(const char* what, const std::function<void(SqliteDatabase&)>& body);

    std::string m_db_path;
    std::unique_ptr<SqliteDatabase> m_db;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace memescalate
