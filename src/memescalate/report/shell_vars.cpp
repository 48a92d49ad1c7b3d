/**
 * @file shell_vars.cpp
 */
#include "memescalate/report/shell_vars.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/text_utils.hpp"

namespace memescalate
{

void write_shell_var(std::ostream& out, const std::string& name, const std::string& value)
{
    out << name << '=' << shell_quote(value) << '\n';
}

void write_config_vars(std::ostream& out, const EscalationConfig& config)
{
    write_shell_var(out, "PARTITION", config.levels.front().partition);
    out << "MAX_LEVEL=" << config.max_level() << '\n';
    out << "LEVELS_CONFIG=true\n";

    for (size_t i = 0; i < config.levels.size(); ++i)
    {
        const std::string prefix = "LEVEL_" + std::to_string(i) + "_";
        write_shell_var(out, prefix + "PARTITION", config.levels[i].partition);
        write_shell_var(out, prefix + "MEM", config.levels[i].memory);
        write_shell_var(out, prefix + "TIME", config.levels[i].time);
    }

    out << "SACCT_DELAY=" << config.sacct_delay << '\n';
    out << "QUERY_TIMEOUT=" << config.query_timeout_seconds << '\n';

    write_shell_var(out, "TRACKER_DIR", config.tracker.base_dir);
    write_shell_var(out, "HISTORY_LOG", config.tracker.history_log);
    write_shell_var(out, "CHECKPOINT_DIR", config.tracker.checkpoint_dir);
    write_shell_var(out, "OUTPUT_DIR", config.tracker.output_dir);

    out << "LOGGING_ENABLED=" << (config.audit.enabled ? "true" : "false") << '\n';
    write_shell_var(out, "LOGGING_DB_PATH", config.audit.db_path);
    write_shell_var(out, "DB_PATH", config.audit.db_path);
    write_shell_var(out, "LOG_LEVEL", config.logging.level);

    out << "MAX_ARRAY_SPEC_LEN=" << config.max_array_spec_len << '\n';
    out << "BATCH_SIZE=" << config.batch_size << '\n';

    write_shell_var(out, "CLUSTER_NAME", config.cluster.name);
    write_shell_var(out, "CLUSTER_PARTITION", config.cluster.partition);
    write_shell_var(out, "CLUSTER_NODES", config.cluster.nodes);
}

void write_resume_vars(std::ostream& out, const ChainRecord& record, const std::string& location)
{
    const EscalationChain& chain = record.chain;
    const ChainState& state = record.state;

    write_shell_var(out, "CHECKPOINT_FILE", location);
    write_shell_var(out, "CHAIN_ID", chain.chain_id);
    write_shell_var(out, "SCRIPT", chain.script);
    write_shell_var(out, "PARTITION", chain.levels.empty() ? "" : chain.levels.front().partition);

    std::vector<std::string> quoted;
    for (const auto& arg : chain.script_args)
    {
        quoted.push_back(shell_quote(arg));
    }
    out << "SCRIPT_ARGS=(" << join_strings(quoted, " ") << ")\n";

    write_shell_var(out, "ARRAY_SPEC", chain.original_array_spec);
    out << "TOTAL_TASKS=" << chain.total_tasks << '\n';
    out << "RESUME_LEVEL=" << state.current_level << '\n';
    write_shell_var(out, "RESUME_MEMORY", state.current_memory);
    write_shell_var(out, "RESUME_TIME", state.current_time);
    write_shell_var(out, "RESUME_STATUS", to_string(state.status));
    write_shell_var(out, "RESUME_PENDING", state.pending_indices);
    out << "MAX_LEVEL=" << (chain.levels.empty() ? 0 : chain.max_level()) << '\n';
    write_shell_var(out, "RESUME_CHAIN", join_strings(record.all_job_ids(), ","));
}

void write_analysis_vars(std::ostream& out, const ClassificationResult& result)
{
    out << "TOTAL_COUNT=" << result.total_count() << '\n';
    out << "COMPLETED_COUNT=" << result.completed.size() << '\n';
    out << "OOM_COUNT=" << result.oom_count() << '\n';
    out << "TIMEOUT_COUNT=" << result.timeout_count() << '\n';
    out << "OTHER_FAILED_COUNT=" << result.no_retry.size() << '\n';
    out << "ESCALATE_COUNT=" << result.escalate.size() << '\n';
    out << "NO_RETRY_COUNT=" << result.no_retry.size() << '\n';

    out << "OOM_INDICES=" << join_indices(result.oom) << '\n';
    out << "TIMEOUT_INDICES=" << join_indices(result.timeout) << '\n';
    out << "OTHER_FAILED_INDICES=" << join_indices(result.no_retry) << '\n';
    out << "ESCALATE_INDICES=" << join_indices(result.escalate) << '\n';
    out << "NO_RETRY_INDICES=" << join_indices(result.no_retry) << '\n';
}

void write_decision_vars(std::ostream& out, const EscalationDecision& decision)
{
    out << "DECISION=" << to_string(decision.kind) << '\n';
    if (decision.kind == DecisionKind::Escalate)
    {
        out << "NEXT_LEVEL=" << decision.next_level << '\n';
        write_shell_var(out, "NEXT_PARTITION", decision.next_tier.partition);
        write_shell_var(out, "NEXT_MEMORY", decision.next_tier.memory);
        write_shell_var(out, "NEXT_TIME", decision.next_tier.time);
    }
    write_shell_var(out, "ESCALATE_SPEC",
        decision.kind == DecisionKind::Escalate ? decision.escalate_spec : "");
    write_shell_var(out, "FAILED_SPEC",
        decision.kind == DecisionKind::Fail ? decision.escalate_spec : "");
    write_shell_var(out, "FAIL_REASON",
        decision.kind == DecisionKind::Fail ? to_string(decision.fail_reason) : "");
    if (decision.kind == DecisionKind::Unknown)
    {
        out << "MISSING_COUNT=" << decision.missing_count << '\n';
        write_shell_var(out, "MISSING_SPEC", decision.missing_spec);
    }

    out << "BATCH_COUNT=" << decision.batch_specs.size() << '\n';
    for (size_t i = 0; i < decision.batch_specs.size(); ++i)
    {
        write_shell_var(out, "BATCH_" + std::to_string(i), decision.batch_specs[i]);
    }
}

} // namespace memescalate
