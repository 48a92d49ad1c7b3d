/**
 * @file cli_app.cpp
 */
#include "memescalate/cli/cli_app.hpp"
#include "memescalate/chain/escalation_machine.hpp"
#include "memescalate/chain/escalation_planner.hpp"
#include "memescalate/classify/outcome_classifier.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"
#include "memescalate/common/text_utils.hpp"
#include "memescalate/report/markdown_report.hpp"
#include "memescalate/report/shell_vars.hpp"
#include "memescalate/report/status_report.hpp"

#include <cstdlib>
#include <filesystem>

namespace memescalate
{

namespace
{

constexpr const char* kUsage = R"(Usage: memescalate [--config FILE] [--checkpoint-dir DIR] [--db FILE] <command> [args]

Index sets:
  compress-indices <list>                 Compress a comma list into an array spec
  expand-indices <spec>                   Expand an array spec into a comma list
  batch-specs <list> [--max-len N] [--batch-size N]
                                          Split an index list into submittable specs

Configuration:
  load-config <file>                      Print the configuration as shell variables

Escalation chains:
  analyze-job <job_ids> [--chain ID]      Classify finished tasks and plan the next step
  create-chain <chain_id> <script> [--array SPEC] [--total-tasks N] [--no-overwrite] [-- args]
  record-round <chain_id> <job_ids> <handler_id> <array_spec> <level> <memory>
  escalate <chain_id> <next_level> <next_memory> <spec> <retry_job_ids> <handler_id>
           <completed> <escalate_count> [--oom-count N] [--timeout-count N] [--failed-count N]
  mark-completed <chain_id> <job_id> <completed_count>
  mark-failed <chain_id> <failed_indices> [MEMORY|TIME|LEVEL]
  get-chain-state <chain_id>
  load-checkpoint <chain_id>              Print resume variables for a chain

Monitoring:
  show-status <chain_id>
  list-checkpoints
  generate-report [--all | <chain_id>...] [--detailed]

Audit database:
  log-action <chain_id> <action_type> [--job-id X] [--memory-level N] [--time-level N]
             [--indices S] [--details S]
  db-save-tasks <chain_id> <round_num> <job_id>
)";

IndexSet parse_index_list(const std::string& text)
{
    IndexSet indices;
    for (const auto& item : split_list(text))
    {
        indices.insert(parse_count(item, "index"));
    }
    return indices;
}

std::optional<size_t> optional_count(const ParsedArgs& parsed, const std::string& name)
{
    auto value = parsed.option(name);
    if (!value)
    {
        return std::nullopt;
    }
    return parse_count(*value, name.c_str());
}

} // namespace

const std::map<std::string, CliApp::Handler> CliApp::s_commands = {
    {"help", &CliApp::cmd_help},
    {"compress-indices", &CliApp::cmd_compress_indices},
    {"expand-indices", &CliApp::cmd_expand_indices},
    {"batch-specs", &CliApp::cmd_batch_specs},
    {"load-config", &CliApp::cmd_load_config},
    {"analyze-job", &CliApp::cmd_analyze_job},
    {"create-chain", &CliApp::cmd_create_chain},
    {"record-round", &CliApp::cmd_record_round},
    {"escalate", &CliApp::cmd_escalate},
    {"mark-completed", &CliApp::cmd_mark_completed},
    {"mark-failed", &CliApp::cmd_mark_failed},
    {"get-chain-state", &CliApp::cmd_get_chain_state},
    {"load-checkpoint", &CliApp::cmd_load_checkpoint},
    {"show-status", &CliApp::cmd_show_status},
    {"list-checkpoints", &CliApp::cmd_list_checkpoints},
    {"generate-report", &CliApp::cmd_generate_report},
    {"log-action", &CliApp::cmd_log_action},
    {"db-save-tasks", &CliApp::cmd_db_save_tasks},
};

CliApp::CliApp(std::ostream& out, std::shared_ptr<const ISchedulerQuery> scheduler)
    : m_out(out)
    , m_scheduler(std::move(scheduler))
    , m_log(get_logger())
{
}

int CliApp::run(const CommandLine& line)
{
    if (line.command.empty())
    {
        write_usage(std::cerr);
        return EXIT_FAILURE;
    }

    auto it = s_commands.find(line.command);
    if (it == s_commands.end())
    {
        throw EscalationError(
            EscalationErrorCode::InvalidArgument, "Unknown command " + line.command);
    }

    setup(line.globals);
    SPDLOG_LOGGER_DEBUG(m_log, "Running {} with {} argument(s)", line.command, line.args.size());
    return (this->*(it->second))(line.args);
}

void CliApp::write_usage(std::ostream& out) const
{
    out << kUsage;
}

void CliApp::setup(const GlobalOptions& globals)
{
    if (globals.config_path)
    {
        m_config = load_config_file(*globals.config_path);
        m_config_loaded = true;
        configure_logging(m_config.logging);
        // configure_logging replaces the registered logger
        m_log = get_logger();
    }

    m_checkpoint_dir = globals.checkpoint_dir.value_or(m_config.tracker.checkpoint_dir);

    if (globals.db_path)
    {
        m_db_path = globals.db_path;
    }
    else if (m_config_loaded && m_config.audit.enabled)
    {
        m_db_path = m_config.audit.db_path;
    }
}

const EscalationConfig& CliApp::require_ladder(const char* command) const
{
    if (!m_config_loaded || m_config.levels.empty())
    {
        throw EscalationError(EscalationErrorCode::ConfigError,
            std::string(command) + " needs a configuration with levels (use --config FILE)");
    }
    return m_config;
}

ICheckpointStore& CliApp::store()
{
    if (!m_store)
    {
        m_store = std::make_unique<FileCheckpointStore>(m_checkpoint_dir);
    }
    return *m_store;
}

AuditStore* CliApp::audit()
{
    if (!m_db_path)
    {
        return nullptr;
    }
    if (!m_audit)
    {
        m_audit = std::make_unique<AuditStore>(*m_db_path);
    }
    return m_audit.get();
}

const ISchedulerQuery& CliApp::scheduler()
{
    if (!m_scheduler)
    {
        m_scheduler = std::make_shared<SlurmSchedulerQuery>(
            nullptr, std::chrono::seconds(m_config.query_timeout_seconds));
    }
    return *m_scheduler;
}

// ============================================================================
// Index set commands
// ============================================================================

int CliApp::cmd_help(const std::vector<std::string>&)
{
    write_usage(m_out);
    return EXIT_SUCCESS;
}

int CliApp::cmd_compress_indices(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "compress-indices <list>");
    m_out << compress_indices(parse_index_list(parsed.positionals[0])) << "\n";
    return EXIT_SUCCESS;
}

int CliApp::cmd_expand_indices(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "expand-indices <spec>");
    m_out << join_indices(expand_indices(parsed.positionals[0])) << "\n";
    return EXIT_SUCCESS;
}

int CliApp::cmd_batch_specs(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args, {"--max-len", "--batch-size"});
    parsed.expect_positionals(1, 1, "batch-specs <list> [--max-len N] [--batch-size N]");

    const size_t max_len = optional_count(parsed, "--max-len").value_or(m_config.max_array_spec_len);
    const size_t batch_size = optional_count(parsed, "--batch-size").value_or(m_config.batch_size);
    if (batch_size == 0)
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument, "--batch-size must be positive");
    }

    IndexSetCodec codec;
    for (const auto& spec :
        codec.split_into_batches(parse_index_list(parsed.positionals[0]), max_len, batch_size))
    {
        m_out << spec << "\n";
    }
    return EXIT_SUCCESS;
}

// ============================================================================
// Configuration
// ============================================================================

int CliApp::cmd_load_config(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "load-config <file>");
    write_config_vars(m_out, load_config_file(parsed.positionals[0]));
    return EXIT_SUCCESS;
}

// ============================================================================
// Escalation chains
// ============================================================================

int CliApp::cmd_analyze_job(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args, {"--chain"});
    parsed.expect_positionals(1, 1, "analyze-job <job_ids> [--chain ID]");

    auto job_ids = split_list(parsed.positionals[0]);
    auto raw = scheduler().query_task_results(job_ids);
    if (raw.empty())
    {
        SPDLOG_LOGGER_WARN(m_log, "No accounting data for job(s) {}", parsed.positionals[0]);
    }

    auto classification = classify_outcomes(raw, m_config.rules);
    SPDLOG_LOGGER_INFO(m_log, "{}", classification.summary());
    write_analysis_vars(m_out, classification);

    auto chain_id = parsed.option("--chain");
    if (!chain_id)
    {
        return EXIT_SUCCESS;
    }

    EscalationMachine machine(store());
    ChainRecord record = machine.load(*chain_id);
    EscalationPlanner planner(BatchLimits{m_config.max_array_spec_len, m_config.batch_size});
    auto decision = planner.plan(record, classification);
    if (decision.kind == DecisionKind::Unknown)
    {
        SPDLOG_LOGGER_WARN(m_log, "Chain {}: {} expected task(s) unreported ({}), status unknown",
            *chain_id, decision.missing_count, decision.missing_spec);
    }
    else
    {
        SPDLOG_LOGGER_INFO(m_log, "Chain {} decision: {}", *chain_id, to_string(decision.kind));
    }
    write_decision_vars(m_out, decision);
    return EXIT_SUCCESS;
}

int CliApp::cmd_create_chain(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args, {"--array", "--total-tasks"}, {"--no-overwrite"});
    parsed.expect_positionals(2, 2,
        "create-chain <chain_id> <script> [--array SPEC] [--total-tasks N] [--no-overwrite] "
        "[-- args]");
    const EscalationConfig& config = require_ladder("create-chain");

    EscalationChain chain;
    chain.chain_id = parsed.positionals[0];
    chain.script = parsed.positionals[1];
    chain.script_args = parsed.passthrough;
    chain.levels = config.levels;
    chain.original_array_spec = parsed.option("--array").value_or("");

    if (auto total = optional_count(parsed, "--total-tasks"))
    {
        chain.total_tasks = *total;
    }
    else if (!chain.original_array_spec.empty())
    {
        IndexSet indices = expand_indices(chain.original_array_spec);
        chain.total_tasks = indices.empty() ? 0 : *indices.rbegin() + 1;
    }

    AuditStore* audit_store = audit();
    EscalationMachine machine(store(), audit_store);
    machine.create_chain(chain, !parsed.has_flag("--no-overwrite"));
    if (audit_store)
    {
        audit_store->save_config(chain.chain_id, config);
    }

    m_out << store().location_of(chain.chain_id) << "\n";
    return EXIT_SUCCESS;
}

int CliApp::cmd_record_round(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(6, 6,
        "record-round <chain_id> <job_ids> <handler_id> <array_spec> <level> <memory>");
    const auto& p = parsed.positionals;

    EscalationMachine machine(store(), audit());
    machine.record_round(p[0], split_list(p[1]), p[2], p[3], parse_count(p[4], "level"), p[5]);
    return EXIT_SUCCESS;
}

int CliApp::cmd_escalate(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args, {"--oom-count", "--timeout-count", "--failed-count"});
    parsed.expect_positionals(8, 8,
        "escalate <chain_id> <next_level> <next_memory> <spec> <retry_job_ids> <handler_id> "
        "<completed> <escalate_count> [--oom-count N] [--timeout-count N] [--failed-count N]");
    const auto& p = parsed.positionals;

    EscalationRequest request;
    request.next_level = parse_count(p[1], "next_level");
    request.next_memory = p[2];
    request.escalate_spec = p[3];
    request.retry_job_ids = split_list(p[4]);
    request.handler_id = p[5];
    request.completed_count = parse_count(p[6], "completed");
    request.escalate_count = parse_count(p[7], "escalate_count");
    request.oom_count = optional_count(parsed, "--oom-count").value_or(0);
    request.timeout_count = optional_count(parsed, "--timeout-count").value_or(0);
    request.failed_count = optional_count(parsed, "--failed-count").value_or(0);

    EscalationMachine machine(store(), audit());
    machine.escalate(p[0], request);
    return EXIT_SUCCESS;
}

int CliApp::cmd_mark_completed(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(3, 3, "mark-completed <chain_id> <job_id> <completed_count>");
    const auto& p = parsed.positionals;

    EscalationMachine machine(store(), audit());
    machine.mark_completed(p[0], p[1], parse_count(p[2], "completed_count"));
    return EXIT_SUCCESS;
}

int CliApp::cmd_mark_failed(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(2, 3, "mark-failed <chain_id> <failed_indices> [MEMORY|TIME|LEVEL]");
    const auto& p = parsed.positionals;
    FailureReason reason = p.size() > 2 ? parse_failure_reason(p[2]) : FailureReason::Level;

    EscalationMachine machine(store(), audit());
    machine.mark_failed(p[0], p[1], reason);
    return EXIT_SUCCESS;
}

int CliApp::cmd_get_chain_state(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "get-chain-state <chain_id>");

    try
    {
        auto record = store().load(parsed.positionals[0]);
        m_out << (record ? to_string(record->state.status) : std::string("UNKNOWN")) << "\n";
    }
    catch (const EscalationError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "Cannot read chain {}: {}", parsed.positionals[0], e.what());
        m_out << "UNKNOWN\n";
    }
    return EXIT_SUCCESS;
}

int CliApp::cmd_load_checkpoint(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "load-checkpoint <chain_id>");
    const std::string& chain_id = parsed.positionals[0];

    EscalationMachine machine(store());
    ChainRecord record = machine.load(chain_id);
    write_resume_vars(m_out, record, store().location_of(chain_id));
    return EXIT_SUCCESS;
}

// ============================================================================
// Monitoring
// ============================================================================

int CliApp::cmd_show_status(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(1, 1, "show-status <chain_id>");

    EscalationMachine machine(store());
    ChainRecord record = machine.load(parsed.positionals[0]);
    write_chain_status(m_out, record, &scheduler(), m_config.tracker.base_dir);
    return EXIT_SUCCESS;
}

int CliApp::cmd_list_checkpoints(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(0, 0, "list-checkpoints");
    write_checkpoint_list(m_out, store());
    return EXIT_SUCCESS;
}

int CliApp::cmd_generate_report(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args, {}, {"--all", "--detailed"});
    std::vector<std::string> chain_ids = parsed.positionals;
    if (parsed.has_flag("--all"))
    {
        chain_ids = store().list();
    }
    if (chain_ids.empty())
    {
        if (parsed.has_flag("--all"))
        {
            m_out << "No checkpoints found in " << m_checkpoint_dir << "\n";
            return EXIT_SUCCESS;
        }
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            "Usage: memescalate generate-report [--all | <chain_id>...] [--detailed]");
    }

    // Reports never create the database
    AuditStore* audit_store = nullptr;
    std::error_code ec;
    if (m_db_path && std::filesystem::exists(*m_db_path, ec))
    {
        audit_store = audit();
    }

    ReportOptions options;
    options.detailed = parsed.has_flag("--detailed");
    options.generated_at = now_timestamp();
    write_markdown_report(m_out, store(), chain_ids, audit_store, options);
    return EXIT_SUCCESS;
}

// ============================================================================
// Audit database
// ============================================================================

int CliApp::cmd_log_action(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args,
        {"--job-id", "--memory-level", "--time-level", "--indices", "--details"});
    parsed.expect_positionals(2, 2,
        "log-action <chain_id> <action_type> [--job-id X] [--memory-level N] [--time-level N] "
        "[--indices S] [--details S]");

    AuditEntry entry;
    entry.timestamp = now_timestamp();
    entry.chain_id = parsed.positionals[0];
    entry.action_type = parsed.positionals[1];
    entry.job_id = parsed.option("--job-id").value_or("");
    entry.memory_level = optional_count(parsed, "--memory-level");
    entry.time_level = optional_count(parsed, "--time-level");
    entry.indices = parsed.option("--indices").value_or("");
    entry.details = parsed.option("--details").value_or("");

    AuditStore* audit_store = audit();
    if (!audit_store)
    {
        SPDLOG_LOGGER_WARN(m_log, "Audit database disabled; {} not recorded", entry.action_type);
        return EXIT_SUCCESS;
    }
    audit_store->log_action(entry);
    return EXIT_SUCCESS;
}

int CliApp::cmd_db_save_tasks(const std::vector<std::string>& args)
{
    auto parsed = parse_args(args);
    parsed.expect_positionals(3, 3, "db-save-tasks <chain_id> <round_num> <job_id>");
    const auto& p = parsed.positionals;
    const size_t round_num = parse_count(p[1], "round_num");

    AuditStore* audit_store = audit();
    if (!audit_store)
    {
        SPDLOG_LOGGER_WARN(m_log, "Audit database disabled; tasks of {} not recorded", p[2]);
        return EXIT_SUCCESS;
    }

    auto tasks = scheduler().query_task_accounting(p[2]);
    if (tasks.empty())
    {
        SPDLOG_LOGGER_WARN(m_log, "No accounting data for job {}", p[2]);
        return EXIT_SUCCESS;
    }
    audit_store->save_tasks(p[0], round_num, p[2], tasks);
    SPDLOG_LOGGER_INFO(m_log, "Saved {} task record(s) for job {}", tasks.size(), p[2]);
    return EXIT_SUCCESS;
}

} // namespace memescalate
