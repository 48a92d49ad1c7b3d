/**
 * @file shell_vars.hpp
 * @brief `KEY=value` output consumed by the driving shell script through `eval`.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"
#include "memescalate/chain/escalation_planner.hpp"
#include "memescalate/classify/outcome_classifier.hpp"
#include "memescalate/config/escalation_config.hpp"

namespace memescalate
{

/**
 * @brief Write one quoted assignment per line.
 */
void write_shell_var(std::ostream& out, const std::string& name, const std::string& value);

/**
 * @brief Ladder and global settings: `PARTITION`, `MAX_LEVEL`, `LEVEL_<i>_*` and the rest.
 */
void write_config_vars(std::ostream& out, const EscalationConfig& config);

/**
 * @brief `RESUME_*` variables of a stored chain, plus its script and arguments.
 * @param location Checkpoint location printed as `CHECKPOINT_FILE`.
 */
void write_resume_vars(std::ostream& out, const ChainRecord& record, const std::string& location);

/**
 * @brief Counts and plain comma lists of one round's classification.
 */
void write_analysis_vars(std::ostream& out, const ClassificationResult& result);

/**
 * @brief The planner's decision: `DECISION`, `NEXT_*`, `ESCALATE_SPEC`, `MISSING_*`, `BATCH_<i>`.
 */
void write_decision_vars(std::ostream& out, const EscalationDecision& decision);

} // namespace memescalate
