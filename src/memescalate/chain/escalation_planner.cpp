/**
 * @file escalation_planner.cpp
 */
#include "memescalate/chain/escalation_planner.hpp"

namespace memescalate
{

std::string to_string(DecisionKind kind)
{
    switch (kind)
    {
        case DecisionKind::Complete:
            return "COMPLETE";
        case DecisionKind::Escalate:
            return "ESCALATE";
        case DecisionKind::Fail:
            return "FAIL";
        case DecisionKind::Unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

EscalationPlanner::EscalationPlanner(BatchLimits limits)
    : m_limits(limits)
{
}

EscalationDecision EscalationPlanner::plan(
    const ChainRecord& record, const ClassificationResult& classification) const
{
    EscalationDecision decision;
    decision.completed_count = classification.completed.size();
    decision.escalate_count = classification.escalate.size();
    decision.no_retry_count = classification.no_retry.size();
    decision.oom_count = classification.oom_count();
    decision.timeout_count = classification.timeout_count();

    IndexSet missing;
    for (TaskIdx idx : expected_indices(record))
    {
        if (!classification.completed.count(idx) && !classification.escalate.count(idx) &&
            !classification.no_retry.count(idx))
        {
            missing.insert(idx);
        }
    }
    if (classification.total_count() == 0 || !missing.empty())
    {
        decision.kind = DecisionKind::Unknown;
        decision.missing_count = missing.size();
        decision.missing_spec = m_codec.compress(missing);
        return decision;
    }

    if (classification.escalate.empty())
    {
        decision.kind = DecisionKind::Complete;
        return decision;
    }

    decision.escalate_spec = m_codec.compress(classification.escalate);
    decision.next_level = record.state.current_level + 1;

    if (record.chain.levels.empty() || decision.next_level > record.chain.max_level())
    {
        decision.kind = DecisionKind::Fail;
        decision.next_level = record.state.current_level;
        decision.fail_reason = failure_reason_for(classification);
        return decision;
    }

    decision.kind = DecisionKind::Escalate;
    decision.next_tier = record.chain.levels[decision.next_level];
    decision.batch_specs = m_codec.split_into_batches(
        classification.escalate, m_limits.max_spec_len, m_limits.batch_size);
    return decision;
}

IndexSet EscalationPlanner::expected_indices(const ChainRecord& record)
{
    if (!record.state.pending_indices.empty())
    {
        return expand_indices(record.state.pending_indices);
    }
    if (const Round* last = record.last_round())
    {
        return expand_indices(last->array_spec);
    }
    return {};
}

FailureReason EscalationPlanner::failure_reason_for(const ClassificationResult& classification)
{
    const IndexSet& escalate = classification.escalate;
    auto all_in = [&escalate](const IndexSet& tally) {
        return std::all_of(escalate.begin(), escalate.end(),
            [&tally](TaskIdx idx) { return tally.count(idx) > 0; });
    };

    if (all_in(classification.oom))
    {
        return FailureReason::Memory;
    }
    if (all_in(classification.timeout))
    {
        return FailureReason::Time;
    }
    return FailureReason::Level;
}

} // namespace memescalate
