/**
 * @file cli_app.hpp
 * @brief The `memescalate` command dispatcher.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/audit/audit_store.hpp"
#include "memescalate/chain/checkpoint_store.hpp"
#include "memescalate/cli/arg_parser.hpp"
#include "memescalate/config/escalation_config.hpp"
#include "memescalate/scheduler/scheduler_query.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief Runs one subcommand and writes its machine- or human-readable output.
 *
 * @details
 * Results go to the output stream; diagnostics go to the logger. Errors that abort the
 * command are thrown as EscalationError and turned into a non-zero exit by the caller.
 * Transitions skipped by the state machine (missing or terminal chain) are not errors.
 *
 * The configuration is loaded only if `--config` was given. Without it, built-in defaults
 * apply and commands that need the resource ladder fail.
 */
class CliApp
{
public:
    /**
     * @param out Destination of command output.
     * @param scheduler Scheduler access; a SlurmSchedulerQuery when null.
     */
    explicit CliApp(std::ostream& out, std::shared_ptr<const ISchedulerQuery> scheduler = nullptr);

    /**
     * @brief Run a parsed command line.
     * @return Process exit code.
     */
    int run(const CommandLine& line);

    /**
     * @brief Print the command summary.
     */
    void write_usage(std::ostream& out) const;

private:
    using Handler = int (CliApp::*)(const std::vector<std::string>&);

    void setup(const GlobalOptions& globals);
    const EscalationConfig& require_ladder(const char* command) const;
    ICheckpointStore& store();
    AuditStore* audit();
    const ISchedulerQuery& scheduler();

    int cmd_help(const std::vector<std::string>& args);
    int cmd_compress_indices(const std::vector<std::string>& args);
    int cmd_expand_indices(const std::vector<std::string>& args);
    int cmd_batch_specs(const std::vector<std::string>& args);
    int cmd_load_config(const std::vector<std::string>& args);
    int cmd_analyze_job(const std::vector<std::string>& args);
    int cmd_create_chain(const std::vector<std::string>& args);
    int cmd_record_round(const std::vector<std::string>& args);
    int cmd_escalate(const std::vector<std::string>& args);
    int cmd_mark_completed(const std::vector<std::string>& args);
    int cmd_mark_failed(const std::vector<std::string>& args);
    int cmd_get_chain_state(const std::vector<std::string>& args);
    int cmd_load_checkpoint(const std::vector<std::string>& args);
    int cmd_show_status(const std::vector<std::string>& args);
    int cmd_list_checkpoints(const std::vector<std::string>& args);
    int cmd_generate_report(const std::vector<std::string>& args);
    int cmd_log_action(const std::vector<std::string>& args);
    int cmd_db_save_tasks(const std::vector<std::string>& args);

    std::ostream& m_out;
    std::shared_ptr<const ISchedulerQuery> m_scheduler;
    std::shared_ptr<spdlog::logger> m_log;

    EscalationConfig m_config;
    bool m_config_loaded{false};
    std::string m_checkpoint_dir;
    std::optional<std::string> m_db_path;
    std::unique_ptr<FileCheckpointStore> m_store;
    std::unique_ptr<AuditStore> m_audit;

    static const std::map<std::string, Handler> s_commands;
};

} // namespace memescalate
