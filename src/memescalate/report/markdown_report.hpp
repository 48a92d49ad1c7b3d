/**
 * @file markdown_report.hpp
 * @brief Markdown report over checkpoints and the audit database.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/audit/audit_store.hpp"
#include "memescalate/chain/checkpoint_store.hpp"

namespace memescalate
{

/**
 * @brief Options of a markdown report.
 */
struct ReportOptions
{
    /**
     * @brief Include per-round task breakdowns from the audit database.
     */
    bool detailed{false};

    /**
     * @brief Timestamp printed in the report header.
     */
    std::string generated_at;
};

/**
 * @brief Render a report for the given chains.
 *
 * @details
 * Each chain gets a configuration table, a rounds table, a failed-task section and a
 * summary. With an audit store, task-level tables are added: per round when `detailed`
 * is set, otherwise one chain-wide summary. A chain that cannot be loaded gets an error
 * section instead.
 *
 * @param audit Optional audit database; reads that fail are simply omitted.
 */
void write_markdown_report(
    std::ostream& out,
    const ICheckpointStore& store,
    const std::vector<std::string>& chain_ids,
    AuditStore* audit,
    const ReportOptions& options);

} // namespace memescalate
