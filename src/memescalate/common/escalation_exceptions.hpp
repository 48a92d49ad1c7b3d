/**
 * @file escalation_exceptions.hpp
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

/**
 * @brief Error codes for escalation engine operations.
 *
 * @details
 * The code decides how a caller reacts. Configuration, level and argument errors abort the
 * current invocation. Checkpoint errors are fatal for reads that produce output but only skip
 * read-modify-write transitions. Scheduler and audit errors never leave their component.
 */
enum class EscalationErrorCode
{
    ConfigError,
    CheckpointIO,
    ChainNotFound,
    ChainExists,
    InvalidLevel,
    SchedulerQuery,
    CodecInput,
    AuditWrite,
    InvalidArgument
};

/**
 * @brief Get a stable name for an error code, for diagnostics.
 */
inline const char* to_string(EscalationErrorCode code) noexcept
{
    switch (code)
    {
        case EscalationErrorCode::ConfigError:
            return "ConfigError";
        case EscalationErrorCode::CheckpointIO:
            return "CheckpointIO";
        case EscalationErrorCode::ChainNotFound:
            return "ChainNotFound";
        case EscalationErrorCode::ChainExists:
            return "ChainExists";
        case EscalationErrorCode::InvalidLevel:
            return "InvalidLevel";
        case EscalationErrorCode::SchedulerQuery:
            return "SchedulerQuery";
        case EscalationErrorCode::CodecInput:
            return "CodecInput";
        case EscalationErrorCode::AuditWrite:
            return "AuditWrite";
        case EscalationErrorCode::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * @brief Exception class for escalation engine errors.
 *
 * @details
 * `EscalationError` is thrown when configuration is invalid, a checkpoint cannot be read or
 * written, an index spec is malformed, or a transition would break a chain invariant. Each
 * exception carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class EscalationError : public std::exception
{
public:
    /**
     * @brief Construct an EscalationError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    EscalationError(EscalationErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    EscalationErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    EscalationErrorCode m_code;
    std::string m_message;
};

} // namespace memescalate
