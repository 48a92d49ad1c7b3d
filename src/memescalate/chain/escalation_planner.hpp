/**
 * @file escalation_planner.hpp
 * @brief Decides the next step of a chain from a round's classification.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"
#include "memescalate/classify/outcome_classifier.hpp"
#include "memescalate/codec/index_set_codec.hpp"

namespace memescalate
{

/**
 * @brief What the driver should do after a round.
 */
enum class DecisionKind
{
    Complete,
    Escalate,
    Fail,

    /**
     * @brief Some expected tasks have no accounting yet; ask again later.
     */
    Unknown
};

std::string to_string(DecisionKind kind);

/**
 * @brief Outcome of planning one round.
 */
struct EscalationDecision
{
    DecisionKind kind{DecisionKind::Complete};

    size_t completed_count{0};
    size_t escalate_count{0};
    size_t oom_count{0};
    size_t timeout_count{0};

    /**
     * @brief Tasks that failed for reasons more resources will not fix.
     */
    size_t no_retry_count{0};

    /**
     * @brief Target tier; meaningful for `Escalate` only.
     */
    size_t next_level{0};
    ResourceLevel next_tier;

    /**
     * @brief Compressed escalate set; the failed set for `Fail`.
     */
    std::string escalate_spec;

    /**
     * @brief Submission specs for the retry, batched to the spec length limit.
     */
    std::vector<std::string> batch_specs;

    /**
     * @brief Why the chain cannot continue; meaningful for `Fail` only.
     */
    FailureReason fail_reason{FailureReason::Level};

    /**
     * @brief Compressed set of expected tasks the scheduler did not report; `Unknown` only.
     */
    std::string missing_spec;
    size_t missing_count{0};
};

/**
 * @brief Limits applied when splitting a retry into submissions.
 */
struct BatchLimits
{
    size_t max_spec_len{3000};
    size_t batch_size{500};
};

/**
 * @brief Turns a classification and a chain's ladder into a decision.
 *
 * @details
 * - No results, or some of the round's expected tasks unreported: UNKNOWN. The expected set is
 *   the chain's pending indices, else the last round's spec.
 * - Nothing to escalate: COMPLETE.
 * - The next level is within the ladder: ESCALATE to it.
 * - Otherwise FAIL with MEMORY if every escalating task ran out of memory, TIME if every
 *   one timed out, LEVEL for any other mix.
 *
 * Planning reads the record and never writes it.
 */
class EscalationPlanner
{
public:
    explicit EscalationPlanner(BatchLimits limits = {});

    /**
     * @throw EscalationError with `CodecInput` if the record's pending spec is malformed.
     */
    EscalationDecision plan(
        const ChainRecord& record, const ClassificationResult& classification) const;

    /**
     * @brief Indices the round is waiting on; empty if the record names none.
     */
    static IndexSet expected_indices(const ChainRecord& record);

private:
    static FailureReason failure_reason_for(const ClassificationResult& classification);

    BatchLimits m_limits;
    IndexSetCodec m_codec;
};

} // namespace memescalate
