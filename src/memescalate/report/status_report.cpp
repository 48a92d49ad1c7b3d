/**
 * @file status_report.cpp
 */
#include "memescalate/report/status_report.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/text_utils.hpp"

#include <charconv>

namespace memescalate
{

namespace
{

const std::string kRule(50, '=');
const std::string kThinRule(50, '-');

struct LiveTally
{
    size_t completed{0};
    size_t oom{0};
    size_t timeout{0};
    size_t failed{0};
    size_t active{0};
    size_t seen{0};
};

/**
 * @brief Messages printed for a handler job in each observed state.
 */
struct HandlerLabels
{
    const char* title;
    const char* waiting;
    const char* running;
    const char* completed;
    const char* cancelled;
};

std::string truncate(const std::string& text, size_t limit)
{
    if (text.size() <= limit)
    {
        return text;
    }
    return text.substr(0, limit) + "...";
}

std::optional<std::string> next_job_id(const std::string& job_id)
{
    unsigned long long value = 0;
    const char* end = job_id.data() + job_id.size();
    auto [ptr, ec] = std::from_chars(job_id.data(), end, value);
    if (job_id.empty() || ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return std::to_string(value + 1);
}

void write_handler_line(std::ostream& out, const ISchedulerQuery& live,
    const std::string& handler_id, const std::string& dependency, const HandlerLabels& labels)
{
    if (auto queued = live.query_queue_state(handler_id))
    {
        if (*queued == "PENDING")
        {
            out << "           " << labels.title << ": Job " << handler_id << " - " << labels.waiting
                << " (" << dependency << ")\n";
        }
        else if (*queued == "RUNNING")
        {
            out << "           " << labels.title << ": Job " << handler_id << " - " << labels.running
                << "\n";
        }
        return;
    }

    auto accounting = live.query_task_accounting(handler_id);
    if (accounting.empty())
    {
        return;
    }
    const std::string& state = accounting.front().state;
    if (state.find("COMPLETED") != std::string::npos)
    {
        out << "           " << labels.title << ": Job " << handler_id << " - " << labels.completed
            << "\n";
    }
    else if (state.find("CANCELLED") != std::string::npos)
    {
        out << "           " << labels.title << ": Job " << handler_id << " - " << labels.cancelled
            << "\n";
    }
}

LiveTally tally_jobs(const ISchedulerQuery& live, const std::vector<std::string>& job_ids)
{
    LiveTally tally;
    for (const auto& job_id : job_ids)
    {
        for (const auto& task : live.query_task_accounting(job_id))
        {
            const std::string& s = task.state;
            ++tally.seen;
            if (s.find("COMPLETED") != std::string::npos)
            {
                ++tally.completed;
            }
            else if (s.find("OUT_OF_MEMORY") != std::string::npos)
            {
                ++tally.oom;
            }
            else if (s.find("TIMEOUT") != std::string::npos)
            {
                ++tally.timeout;
            }
            else if (s.find("FAILED") != std::string::npos && s.find("NODE_FAIL") == std::string::npos)
            {
                ++tally.failed;
            }
            else if (s.find("RUNNING") != std::string::npos || s.find("PENDING") != std::string::npos)
            {
                ++tally.active;
            }
        }
    }
    return tally;
}

void write_round_results(std::ostream& out, const Round& round)
{
    const size_t escalating = round.oom_count + round.timeout_count;
    if (round.completed_count == 0 && escalating == 0 && round.failed_count == 0)
    {
        return;
    }

    std::vector<std::string> parts;
    if (round.completed_count > 0)
    {
        parts.push_back(std::to_string(round.completed_count) + " done");
    }
    if (escalating > 0)
    {
        std::vector<std::string> detail;
        if (round.oom_count > 0)
        {
            detail.push_back(std::to_string(round.oom_count) + " OOM");
        }
        if (round.timeout_count > 0)
        {
            detail.push_back(std::to_string(round.timeout_count) + " TIMEOUT");
        }
        parts.push_back(std::to_string(escalating) + " escalating (" +
            join_strings(detail, ", ") + ")");
    }
    if (round.failed_count > 0)
    {
        parts.push_back(std::to_string(round.failed_count) + " failed (not retried)");
    }
    out << "           Results: " << join_strings(parts, " | ") << "\n";
}

void write_round(std::ostream& out, const ChainRecord& record, const Round& round,
    const ISchedulerQuery* live, const std::string& tracker_dir)
{
    const bool batched = round.job_ids.size() > 1;
    const size_t task_count = round_task_count(round);

    out << "  Round " << round.ordinal << ": ";
    if (batched)
    {
        out << "Jobs " << round.job_ids.front() << ".." << round.job_ids.back() << " ("
            << round.job_ids.size() << " batches)";
    }
    else
    {
        out << "Job " << (round.job_ids.empty() ? "?" : round.primary_job_id());
    }
    out << " (L" << round.level << ": " << round.memory;
    if (!round.time.empty())
    {
        out << ", " << round.time;
    }
    out << ")\n";

    if (task_count > 0)
    {
        out << "           Tasks: " << task_count << "\n";
    }
    out << "           Status: " << to_string(round.status) << "\n";

    if (live && !round.handler_id.empty())
    {
        const std::string fail_dependency = batched ? "afterany" : "afternotok";
        const std::string ok_dependency = batched ? "afterany" : "afterok";
        write_handler_line(out, *live, round.handler_id, fail_dependency,
            HandlerLabels{"Failure Handler", "WAITING", "RUNNING (escalating...)",
                "COMPLETED (escalated)", "CANCELLED (all succeeded)"});
        if (auto success_id = next_job_id(round.handler_id))
        {
            write_handler_line(out, *live, *success_id, ok_dependency,
                HandlerLabels{"Success Handler", "WAITING", "RUNNING (completing...)",
                    "COMPLETED (all done!)", "CANCELLED (had failures)"});
        }
    }

    if (batched)
    {
        std::string hint = round.array_spec.substr(0, 60);
        if (round.array_spec.size() > 60)
        {
            hint += "... (" + std::to_string(round.array_spec.size()) + " chars)";
        }
        out << "           Array Indices: " << hint << "\n";
        out << "           Indices folder: " << tracker_dir << "/indices/"
            << record.chain.chain_id << "/\n";
    }

    if (live && !round.job_ids.empty())
    {
        LiveTally tally = tally_jobs(*live, round.job_ids);
        if (tally.seen > 0)
        {
            const size_t processed =
                tally.completed + tally.oom + tally.timeout + tally.failed + tally.active;
            out << "           Current: " << tally.completed << " done, " << tally.oom << " OOM, "
                << tally.timeout << " TIMEOUT, " << tally.failed << " FAILED, " << tally.active
                << " active";
            if (task_count > processed)
            {
                out << ", " << (task_count - processed) << " remaining";
            }
            if (batched)
            {
                out << " (from " << round.job_ids.size() << " batches)";
            }
            out << "\n";
        }
    }

    write_round_results(out, round);
    out << "\n";
}

} // namespace

size_t round_task_count(const Round& round)
{
    try
    {
        return count_indices(round.array_spec);
    }
    catch (const EscalationError&)
    {
        return 0;
    }
}

void write_chain_status(
    std::ostream& out,
    const ChainRecord& record,
    const ISchedulerQuery* live,
    const std::string& tracker_dir)
{
    const EscalationChain& chain = record.chain;
    const ChainState& state = record.state;

    out << kRule << "\n";
    out << "Chain Status: " << chain.chain_id << "\n";
    out << kRule << "\n";
    out << "Mode:     " << chain.mode() << "\n";
    out << "Script:   " << chain.script << "\n";
    if (!chain.script_args.empty())
    {
        out << "Args:     " << join_strings(chain.script_args, " ") << "\n";
    }
    if (!chain.original_array_spec.empty())
    {
        out << "Array:    " << chain.original_array_spec << " (" << chain.total_tasks
            << " tasks)\n";
    }
    out << "Created:  " << record.created << "\n";
    out << "Updated:  " << record.updated << "\n";
    out << "\n";

    out << "Status:   " << to_string(state.status) << "\n";
    out << "Level:    " << state.current_level << " / "
        << (chain.levels.empty() ? 0 : chain.max_level()) << "\n";
    out << "Memory:   " << state.current_memory << "\n";
    out << "Time:     " << state.current_time << "\n";

    const Round* last = record.last_round();
    if (state.status == ChainStatus::Escalating && record.rounds.size() >= 2)
    {
        // The closed round is the one before the pending retry
        const Round& closed = record.rounds[record.rounds.size() - 2];
        const size_t escalating = closed.oom_count + closed.timeout_count;
        const size_t failed = closed.failed_count ? closed.failed_count : state.failed_count;
        out << "\nFailures from last round:\n";
        if (escalating > 0)
        {
            out << "  Escalating:  " << escalating << " tasks (OOM: " << closed.oom_count
                << ", TIMEOUT: " << closed.timeout_count << ")\n";
        }
        if (failed > 0)
        {
            out << "  Not Retried: " << failed << " tasks (code errors)\n";
        }
        out << "  Indices:     " << tracker_dir << "/indices/" << chain.chain_id << "/\n";
    }

    if (!state.pending_indices.empty())
    {
        out << "Pending:  " << truncate(state.pending_indices, 50) << "\n";
    }
    if (!state.failed_indices.empty())
    {
        out << "Failed:   " << truncate(state.failed_indices, 50) << "\n";
    }
    out << "\n";

    if (!last)
    {
        out << "No rounds recorded yet.\n";
    }
    else
    {
        out << "Rounds:\n";
        out << kThinRule << "\n";
        for (const auto& round : record.rounds)
        {
            write_round(out, record, round, live, tracker_dir);
        }
    }
    out << kRule << "\n";
}

void write_checkpoint_list(std::ostream& out, const ICheckpointStore& store)
{
    const std::string rule(40, '=');
    out << rule << "\n";
    out << "Available Checkpoints\n";
    out << rule << "\n";

    const std::vector<std::string> ids = store.list();
    for (const auto& chain_id : ids)
    {
        try
        {
            auto record = store.load(chain_id);
            if (!record)
            {
                continue;
            }
            const ChainState& state = record->state;
            out << "  " << record->chain.chain_id << "\n";
            out << "    Script:   " << record->chain.script << "\n";
            out << "    Status:   " << to_string(state.status) << "\n";
            out << "    Level:    " << state.current_level << " (" << state.current_memory << ")\n";
            out << "    Rounds:   " << record->rounds.size() << "\n";
            out << "    Updated:  " << record->updated << "\n";
            out << "\n";
        }
        catch (const EscalationError& e)
        {
            out << "  Error reading " << store.location_of(chain_id) << ": " << e.what() << "\n";
        }
    }

    if (ids.empty())
    {
        out << "No checkpoints found.\n";
    }
    else
    {
        out << "Total: " << ids.size() << " checkpoint(s)\n";
    }
    out << "\n";
    out << "To resume: memescalate load-checkpoint <chain_id>\n";
}

} // namespace memescalate
