/**
 * @file outcome_classifier.cpp
 */
#include "memescalate/classify/outcome_classifier.hpp"

#include <charconv>

namespace memescalate
{

std::optional<int> parse_return_code(const std::string& exit_code)
{
    auto colon = exit_code.find(':');
    std::string digits = exit_code.substr(0, colon);
    if (digits.empty())
    {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return value;
}

TaskOutcome classify_task(const RawTaskResult& raw, const ClassificationRules& rules)
{
    TaskOutcome outcome;
    outcome.task_id = raw.task_id;
    outcome.state = raw.state;
    outcome.exit_code = raw.exit_code;

    if (raw.state.find("COMPLETED") != std::string::npos)
    {
        outcome.action = TaskAction::Complete;
        outcome.failure_kind = FailureKind::None;
        return outcome;
    }

    if (raw.state.find("OUT_OF_MEMORY") != std::string::npos)
    {
        outcome.failure_kind = FailureKind::Oom;
    }
    else if (raw.state.find("TIMEOUT") != std::string::npos)
    {
        outcome.failure_kind = FailureKind::Timeout;
    }
    else
    {
        outcome.failure_kind = FailureKind::Other;
    }

    outcome.action = TaskAction::NoRetry;
    auto return_code = parse_return_code(raw.exit_code);
    auto override_it = return_code
        ? rules.exit_code_overrides.find(*return_code)
        : rules.exit_code_overrides.end();

    if (override_it != rules.exit_code_overrides.end())
    {
        outcome.action = override_it->second;
    }
    else if (const StateRule* rule = rules.match_state(raw.state))
    {
        outcome.action = rule->action;
    }
    return outcome;
}

ClassificationResult classify_outcomes(
    const std::vector<RawTaskResult>& raw_results,
    const ClassificationRules& rules)
{
    ClassificationResult result;
    result.outcomes.reserve(raw_results.size());

    for (const auto& raw : raw_results)
    {
        TaskOutcome outcome = classify_task(raw, rules);

        switch (outcome.action)
        {
            case TaskAction::Complete:
                result.completed.insert(outcome.task_id);
                break;
            case TaskAction::Escalate:
                result.escalate.insert(outcome.task_id);
                break;
            case TaskAction::NoRetry:
                result.no_retry.insert(outcome.task_id);
                break;
        }

        if (outcome.failure_kind == FailureKind::Oom)
        {
            result.oom.insert(outcome.task_id);
        }
        else if (outcome.failure_kind == FailureKind::Timeout)
        {
            result.timeout.insert(outcome.task_id);
        }

        result.outcomes.push_back(std::move(outcome));
    }
    return result;
}

} // namespace memescalate
