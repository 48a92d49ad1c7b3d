/**
 * @file chain_record.cpp
 */
#include "memescalate/chain/chain_record.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

namespace memescalate
{

void validate_chain(const EscalationChain& chain)
{
    if (chain.chain_id.empty())
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument, "Chain id must not be empty");
    }
    if (chain.chain_id.find('/') != std::string::npos || chain.chain_id == "." ||
        chain.chain_id == "..")
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            "Chain id '" + chain.chain_id + "' is not a valid file name");
    }
    if (chain.script.empty())
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            "Chain " + chain.chain_id + " has no script");
    }
    if (chain.levels.empty())
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            "Chain " + chain.chain_id + " has an empty resource ladder");
    }
}

Round* ChainRecord::find_round_by_job(const std::string& job_id)
{
    for (auto& round : rounds)
    {
        if (round.owns_job(job_id))
        {
            return &round;
        }
    }
    return nullptr;
}

std::vector<std::string> ChainRecord::all_job_ids() const
{
    std::vector<std::string> ids;
    for (const auto& round : rounds)
    {
        ids.insert(ids.end(), round.job_ids.begin(), round.job_ids.end());
    }
    return ids;
}

ChainRecord make_initial_record(const EscalationChain& chain, const std::string& timestamp)
{
    validate_chain(chain);

    ChainRecord record;
    record.chain = chain;
    record.state.current_level = 0;
    record.state.current_memory = chain.levels.front().memory;
    record.state.current_time = chain.levels.front().time;
    record.state.status = ChainStatus::Starting;
    record.state.pending_indices = chain.original_array_spec;
    record.created = timestamp;
    record.updated = timestamp;
    return record;
}

} // namespace memescalate
