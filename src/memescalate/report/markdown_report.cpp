/**
 * @file markdown_report.cpp
 */
#include "memescalate/report/markdown_report.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/text_utils.hpp"
#include "memescalate/report/status_report.hpp"

namespace memescalate
{

namespace
{

std::string or_na(const std::string& value)
{
    return value.empty() ? "N/A" : value;
}

void write_configuration(std::ostream& out, const ChainRecord& record)
{
    const EscalationChain& chain = record.chain;
    out << "### Configuration\n\n";
    out << "| Setting | Value |\n";
    out << "|---------|-------|\n";
    out << "| Script | `" << chain.script << "` |\n";
    if (!chain.script_args.empty())
    {
        out << "| Arguments | `" << join_strings(chain.script_args, " ") << "` |\n";
    }
    if (!chain.original_array_spec.empty())
    {
        out << "| Array | `" << chain.original_array_spec << "` (" << chain.total_tasks
            << " tasks) |\n";
    }
    out << "| Partition | " << (chain.levels.empty() ? "unknown" : chain.levels.front().partition)
        << " |\n";
    out << "| Max Level | " << (chain.levels.empty() ? 0 : chain.max_level()) << " |\n";
    out << "| Status | **" << to_string(record.state.status) << "** |\n";
    out << "| Created | " << record.created << " |\n";
    out << "| Updated | " << record.updated << " |\n";
    out << "\n";
}

void write_rounds_table(std::ostream& out, const ChainRecord& record)
{
    out << "### Escalation Rounds\n\n";
    out << "| Round | Job ID | Handler | Memory | Tasks | Done | OOM | Timeout | Failed | Status |\n";
    out << "|-------|--------|---------|--------|-------|------|-----|---------|--------|--------|\n";
    for (const auto& round : record.rounds)
    {
        std::string job_display = round.job_ids.size() > 1
            ? round.job_ids.front() + ".." + round.job_ids.back()
            : or_na(round.primary_job_id());
        out << "| " << round.ordinal << " | " << job_display << " | " << or_na(round.handler_id)
            << " | " << round.memory << " | " << round_task_count(round) << " | "
            << round.completed_count << " | " << round.oom_count << " | " << round.timeout_count
            << " | " << round.failed_count << " | " << to_string(round.status) << " |\n";
    }
    out << "\n";
}

void write_task_details(std::ostream& out, const ChainRecord& record, AuditStore& audit)
{
    const std::string& chain_id = record.chain.chain_id;
    out << "### Task Details (from database)\n\n";

    for (const auto& round : record.rounds)
    {
        out << "#### Round " << round.ordinal << ": " << round.memory << "\n\n";

        auto statuses = audit.status_distribution(chain_id, round.job_ids);
        if (!statuses.empty())
        {
            out << "**Status Distribution:**\n\n";
            out << "| Status | Count |\n";
            out << "|--------|-------|\n";
            for (const auto& row : statuses)
            {
                out << "| " << row.key << " | " << row.count << " |\n";
            }
            out << "\n";
        }

        if (auto range = audit.runtime_range(chain_id, round.job_ids))
        {
            out << "**Runtime:** min=" << or_na(range->min_elapsed)
                << ", max=" << or_na(range->max_elapsed) << "\n\n";
        }

        auto nodes = audit.node_distribution(chain_id, round.job_ids);
        if (!nodes.empty())
        {
            out << "**Node Distribution (top 10):**\n\n";
            out << "| Node | Tasks |\n";
            out << "|------|-------|\n";
            for (const auto& row : nodes)
            {
                out << "| " << or_na(row.key) << " | " << row.count << " |\n";
            }
            out << "\n";
        }
    }
}

void write_task_summary(std::ostream& out, const ChainRecord& record, AuditStore& audit)
{
    auto summary = audit.chain_task_summary(record.chain.chain_id);
    if (!summary)
    {
        return;
    }
    out << "### Database Task Summary\n\n";
    out << "Total task records: " << summary->total << "\n";
    out << "- Completed: " << summary->completed << "\n";
    out << "- OOM: " << summary->oom << "\n";
    out << "- Timeout: " << summary->timeout << "\n";
    out << "- Failed: " << summary->failed << "\n\n";
    out << "*Use `--detailed` for per-round breakdown*\n\n";
}

size_t total_failed(const ChainRecord& record)
{
    if (record.state.failed_count > 0)
    {
        return record.state.failed_count;
    }
    size_t failed = 0;
    for (const auto& round : record.rounds)
    {
        failed += round.failed_count;
    }
    return failed;
}

void write_failed_tasks(
    std::ostream& out, const ChainRecord& record, size_t failed, AuditStore* audit)
{
    const std::string& failed_indices = record.state.failed_indices;
    if (failed == 0 && failed_indices.empty())
    {
        return;
    }

    out << "### Failed Tasks (Not Retried)\n\n";
    out << "**" << failed << "** tasks failed and were not escalated.\n\n";
    if (!failed_indices.empty())
    {
        std::string display = failed_indices;
        if (display.size() > 200)
        {
            display = display.substr(0, 200) + "... (" + std::to_string(failed_indices.size()) +
                " chars total)";
        }
        out << "Failed task indices: `" << display << "`\n\n";
    }

    if (!audit)
    {
        return;
    }
    auto rows = audit->failed_tasks(record.chain.chain_id);
    if (rows.empty())
    {
        return;
    }
    out << "**Failed task details (first 20):**\n\n";
    out << "| Task ID | Status | Exit Code | Node | Elapsed |\n";
    out << "|---------|--------|-----------|------|---------|\n";
    for (const auto& row : rows)
    {
        out << "| " << row.task_id << " | " << row.status << " | " << row.exit_code << " | "
            << or_na(row.node) << " | " << or_na(row.elapsed) << " |\n";
    }
    out << "\n";
}

void write_summary(std::ostream& out, const ChainRecord& record, size_t failed)
{
    const size_t total = record.chain.total_tasks;
    const ChainStatus status = record.state.status;

    out << "### Summary\n\n";
    if (status == ChainStatus::Completed)
    {
        if (failed > 0)
        {
            out << "**" << (total > failed ? total - failed : 0) << "** of " << total
                << " tasks completed. **" << failed << "** failed (not retried).\n";
        }
        else
        {
            out << "All **" << total << "** tasks completed successfully.\n";
        }
    }
    else if (is_terminal(status))
    {
        out << "Chain " << to_string(status) << " with " << failed
            << " unrecoverable tasks.\n";
    }
    else
    {
        out << "Chain status: " << to_string(status) << "\n";
    }
    out << "\n";
}

void write_chain_section(
    std::ostream& out, const ChainRecord& record, AuditStore* audit, const ReportOptions& options)
{
    out << "## Chain: " << record.chain.chain_id << "\n\n";
    write_configuration(out, record);

    if (record.rounds.empty())
    {
        out << "*No rounds recorded yet.*\n\n";
        return;
    }

    write_rounds_table(out, record);
    if (audit && options.detailed)
    {
        write_task_details(out, record, *audit);
    }
    else if (audit)
    {
        write_task_summary(out, record, *audit);
    }

    const size_t failed = total_failed(record);
    write_failed_tasks(out, record, failed, audit);
    write_summary(out, record, failed);
}

} // namespace

void write_markdown_report(
    std::ostream& out,
    const ICheckpointStore& store,
    const std::vector<std::string>& chain_ids,
    AuditStore* audit,
    const ReportOptions& options)
{
    out << "# Escalation Report\n\n";
    out << "Generated: " << options.generated_at << "\n\n";

    for (const auto& chain_id : chain_ids)
    {
        try
        {
            auto record = store.load(chain_id);
            if (!record)
            {
                throw EscalationError(EscalationErrorCode::ChainNotFound,
                    "No checkpoint at " + store.location_of(chain_id));
            }
            write_chain_section(out, *record, audit, options);
        }
        catch (const EscalationError& e)
        {
            out << "## Error reading " << chain_id << "\n\n";
            out << "Could not read: " << e.what() << "\n\n";
        }
        out << "---\n\n";
    }
}

} // namespace memescalate
