/**
 * @file escalation_enums.cpp
 */
#include "memescalate/common/escalation_enums.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

namespace memescalate
{

std::string to_string(ChainStatus status)
{
    switch (status)
    {
        case ChainStatus::Starting:
            return "STARTING";
        case ChainStatus::Running:
            return "RUNNING";
        case ChainStatus::Escalating:
            return "ESCALATING";
        case ChainStatus::Completed:
            return "COMPLETED";
        case ChainStatus::FailedMaxMemory:
            return "FAILED_MAX_MEMORY";
        case ChainStatus::FailedMaxTime:
            return "FAILED_MAX_TIME";
        case ChainStatus::FailedMaxLevel:
            return "FAILED_MAX_LEVEL";
    }
    return "UNKNOWN";
}

std::string to_string(RoundStatus status)
{
    switch (status)
    {
        case RoundStatus::Running:
            return "RUNNING";
        case RoundStatus::Completed:
            return "COMPLETED";
        case RoundStatus::Escalating:
            return "ESCALATING";
        case RoundStatus::Pending:
            return "PENDING";
    }
    return "UNKNOWN";
}

std::string to_string(EscalationReason reason)
{
    switch (reason)
    {
        case EscalationReason::None:
            return "NONE";
        case EscalationReason::Oom:
            return "OOM";
        case EscalationReason::Timeout:
            return "TIMEOUT";
        case EscalationReason::Mixed:
            return "MIXED";
    }
    return "NONE";
}

std::string to_string(FailureReason reason)
{
    switch (reason)
    {
        case FailureReason::Memory:
            return "MEMORY";
        case FailureReason::Time:
            return "TIME";
        case FailureReason::Level:
            return "LEVEL";
    }
    return "LEVEL";
}

std::string to_string(TaskAction action)
{
    switch (action)
    {
        case TaskAction::Complete:
            return "complete";
        case TaskAction::Escalate:
            return "escalate";
        case TaskAction::NoRetry:
            return "no_retry";
    }
    return "no_retry";
}

std::string to_string(FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::None:
            return "NONE";
        case FailureKind::Oom:
            return "OOM";
        case FailureKind::Timeout:
            return "TIMEOUT";
        case FailureKind::Other:
            return "OTHER";
    }
    return "OTHER";
}

ChainStatus parse_chain_status(const std::string& text)
{
    static const std::map<std::string, ChainStatus> table = {
        {"STARTING", ChainStatus::Starting},
        {"RUNNING", ChainStatus::Running},
        {"ESCALATING", ChainStatus::Escalating},
        {"COMPLETED", ChainStatus::Completed},
        {"FAILED_MAX_MEMORY", ChainStatus::FailedMaxMemory},
        {"FAILED_MAX_TIME", ChainStatus::FailedMaxTime},
        {"FAILED_MAX_LEVEL", ChainStatus::FailedMaxLevel},
    };
    auto it = table.find(text);
    if (it == table.end())
    {
        throw EscalationError(
            EscalationErrorCode::CheckpointIO,
            "Unknown chain status '" + text + "'");
    }
    return it->second;
}

RoundStatus parse_round_status(const std::string& text)
{
    static const std::map<std::string, RoundStatus> table = {
        {"RUNNING", RoundStatus::Running},
        {"COMPLETED", RoundStatus::Completed},
        {"ESCALATING", RoundStatus::Escalating},
        {"PENDING", RoundStatus::Pending},
    };
    auto it = table.find(text);
    if (it == table.end())
    {
        throw EscalationError(
            EscalationErrorCode::CheckpointIO,
            "Unknown round status '" + text + "'");
    }
    return it->second;
}

EscalationReason parse_escalation_reason(const std::string& text)
{
    if (text.empty() || text == "NONE" || text == "null" || text == "~")
    {
        return EscalationReason::None;
    }
    if (text == "OOM")
    {
        return EscalationReason::Oom;
    }
    if (text == "TIMEOUT")
    {
        return EscalationReason::Timeout;
    }
    if (text == "MIXED")
    {
        return EscalationReason::Mixed;
    }
    throw EscalationError(
        EscalationErrorCode::CheckpointIO,
        "Unknown escalation reason '" + text + "'");
}

FailureReason parse_failure_reason(const std::string& text)
{
    if (text == "MEMORY")
    {
        return FailureReason::Memory;
    }
    if (text == "TIME")
    {
        return FailureReason::Time;
    }
    if (text == "LEVEL")
    {
        return FailureReason::Level;
    }
    throw EscalationError(
        EscalationErrorCode::InvalidArgument,
        "Unknown failure reason '" + text + "'; expected MEMORY, TIME or LEVEL");
}

TaskAction parse_rule_action(const std::string& text)
{
    if (text == "escalate")
    {
        return TaskAction::Escalate;
    }
    if (text == "no_retry")
    {
        return TaskAction::NoRetry;
    }
    throw EscalationError(
        EscalationErrorCode::ConfigError,
        "Unknown rule action '" + text + "'; expected escalate or no_retry");
}

bool is_terminal(ChainStatus status) noexcept
{
    return status == ChainStatus::Completed ||
           status == ChainStatus::FailedMaxMemory ||
           status == ChainStatus::FailedMaxTime ||
           status == ChainStatus::FailedMaxLevel;
}

ChainStatus failed_status_for(FailureReason reason) noexcept
{
    switch (reason)
    {
        case FailureReason::Memory:
            return ChainStatus::FailedMaxMemory;
        case FailureReason::Time:
            return ChainStatus::FailedMaxTime;
        case FailureReason::Level:
            return ChainStatus::FailedMaxLevel;
    }
    return ChainStatus::FailedMaxLevel;
}

} // namespace memescalate
