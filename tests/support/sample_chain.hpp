/**
 * @file sample_chain.hpp
 * Chain definitions and audit sinks shared by the chain, report and audit tests.
 */
#pragma once
#include "memescalate/audit/audit_sink.hpp"
#include "memescalate/chain/chain_record.hpp"

#include <string>
#include <vector>

namespace memescalate::test_support
{

/**
 * A three-level ladder: 1G/5min on devel, 4G/1h on short, 16G/4h on long.
 */
inline std::vector<ResourceLevel> sample_levels()
{
    return {
        {"devel", "1G", "00:05:00"},
        {"short", "4G", "01:00:00"},
        {"long", "16G", "04:00:00"},
    };
}

inline EscalationChain sample_chain(const std::string& chain_id, size_t total_tasks = 40)
{
    EscalationChain chain;
    chain.chain_id = chain_id;
    chain.script = "/home/user/jobs/process.sh";
    chain.script_args = {"--input", "data set.csv"};
    chain.total_tasks = total_tasks;
    chain.original_array_spec = total_tasks > 0 ? "0-" + std::to_string(total_tasks - 1) : "";
    chain.levels = sample_levels();
    return chain;
}

class RecordingAuditSink : public IAuditSink
{
public:
    void log_action(const AuditEntry& entry) override
    {
        entries.push_back(entry);
    }

    void sync_chain(const ChainRecord& record) override
    {
        synced.push_back(record);
    }

    std::vector<AuditEntry> entries;
    std::vector<ChainRecord> synced;
};

} // namespace memescalate::test_support
