/**
 * @file classification_rules.hpp
 * @brief Rule table mapping scheduler task states to retry actions.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"

namespace memescalate
{

/**
 * @brief One state rule: if `pattern` occurs in the task state, take `action`.
 */
struct StateRule
{
    std::string pattern;
    TaskAction action{TaskAction::NoRetry};
};

/**
 * @brief Ordered state rules plus exit-code overrides.
 *
 * @details
 * State rules are evaluated in list order and the first substring match wins, so the order
 * in which they were configured is part of the contract. Exit-code overrides are keyed by the
 * return-code portion of the scheduler's `return_code:signal` exit code and are consulted
 * before any state rule.
 */
struct ClassificationRules
{
    std::vector<StateRule> state_rules;
    std::map<int, TaskAction> exit_code_overrides;

    /**
     * @brief Built-in rules used when no `state_handling` is configured.
     *
     * @details
     * OUT_OF_MEMORY, TIMEOUT, DEADLINE, PREEMPTED, BOOT_FAIL and NODE_FAIL escalate; FAILED
     * and CANCELLED are not retried; exit code 137 (killed, usually by the OOM killer)
     * escalates.
     */
    static ClassificationRules defaults();

    /**
     * @brief Default state rules only, without exit-code overrides.
     */
    static std::vector<StateRule> default_state_rules();

    /**
     * @brief Find the first state rule whose pattern occurs in `state`.
     * @return The matching rule, or nullptr.
     */
    const StateRule* match_state(const std::string& state) const;
};

} // namespace memescalate
