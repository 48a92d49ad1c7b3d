/**
 * @file classification_rules.cpp
 */
#include "memescalate/classify/classification_rules.hpp"

namespace memescalate
{

std::vector<StateRule> ClassificationRules::default_state_rules()
{
    return {
        {"OUT_OF_MEMORY", TaskAction::Escalate},
        {"TIMEOUT", TaskAction::Escalate},
        {"DEADLINE", TaskAction::Escalate},
        {"PREEMPTED", TaskAction::Escalate},
        {"BOOT_FAIL", TaskAction::Escalate},
        {"NODE_FAIL", TaskAction::Escalate},
        {"FAILED", TaskAction::NoRetry},
        {"CANCELLED", TaskAction::NoRetry},
    };
}

ClassificationRules ClassificationRules::defaults()
{
    ClassificationRules rules;
    rules.state_rules = default_state_rules();
    rules.exit_code_overrides = {{137, TaskAction::Escalate}};
    return rules;
}

const StateRule* ClassificationRules::match_state(const std::string& state) const
{
    for (const auto& rule : state_rules)
    {
        if (state.find(rule.pattern) != std::string::npos)
        {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace memescalate
