/**
 * @file audit_sink.hpp
 * @brief IAuditSink interface and AuditEntry.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"

namespace memescalate
{

/**
 * @brief One row of the action log.
 */
struct AuditEntry
{
    std::string timestamp;
    std::string chain_id;

    /**
     * @brief Upper-case verb, e.g. `CREATED`, `ESCALATED`, `COMPLETED`.
     */
    std::string action_type;

    std::string job_id;
    std::optional<size_t> memory_level;
    std::optional<size_t> time_level;
    std::string indices;
    std::string details;
};

/**
 * @brief Receiver of state-machine transitions for reporting.
 *
 * @details
 * Sinks are best-effort observers: implementations must not throw from these methods and
 * must not be consulted for decisions. A lost write only costs observability.
 */
class IAuditSink
{
public:
    virtual ~IAuditSink() = default;

    /**
     * @brief Append an entry to the action log.
     */
    virtual void log_action(const AuditEntry& entry) = 0;

    /**
     * @brief Mirror a chain and its rounds after a transition.
     */
    virtual void sync_chain(const ChainRecord& record) = 0;
};

} // namespace memescalate
