/**
 * @file compression_strategies.hpp
 * @brief Individual heuristics tried in order by IndexSetCodec::compress().
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"

namespace memescalate
{

/**
 * @brief Sorted, de-duplicated indices with their consecutive gaps precomputed.
 *
 * @details
 * `gaps[i] == values[i + 1] - values[i]`, so `gaps.size() == values.size() - 1` for a
 * non-empty set.
 */
struct SortedIndices
{
    std::vector<TaskIdx> values;
    std::vector<TaskIdx> gaps;

    static SortedIndices from(const IndexSet& indices);

    size_t size() const noexcept
    {
        return values.size();
    }
};

/**
 * @brief One compression heuristic.
 *
 * @details
 * A strategy either produces a complete spec for the whole input or declines with
 * `std::nullopt`, in which case the codec tries the next one. Strategies hold no state and
 * may be shared.
 */
class ICompressionStrategy
{
public:
    virtual ~ICompressionStrategy() = default;

    /**
     * @brief Short name used in debug logs and tests.
     */
    virtual const char* name() const noexcept = 0;

    /**
     * @brief Try to encode the whole input.
     * @param input Sorted, de-duplicated indices.
     * @return The spec, or `std::nullopt` to defer to the next strategy.
     */
    virtual std::optional<std::string> try_compress(const SortedIndices& input) const = 0;
};

using CompressionStrategyPtr = std::shared_ptr<const ICompressionStrategy>;

/**
 * @brief Sets of at most two values: `""`, `n`, `a-b` (adjacent) or `a,b`.
 */
class SmallSetStrategy : public ICompressionStrategy
{
public:
    const char* name() const noexcept override
    {
        return "small-set";
    }
    std::optional<std::string> try_compress(const SortedIndices& input) const override;
};

/**
 * @brief A single range when every gap is the same, e.g. `8-38:10`.
 */
class UniformStrideStrategy : public ICompressionStrategy
{
public:
    const char* name() const noexcept override
    {
        return "uniform-stride";
    }
    std::optional<std::string> try_compress(const SortedIndices& input) const override;
};

/**
 * @brief Interleaved lanes when the gap sequence repeats with a short period.
 *
 * @details
 * For period P in 2..5 (smallest first) the gaps must satisfy `gaps[i] == gaps[i % P]` and
 * there must be at least `2P + 1` gaps. Values are then split into P lanes by position, each
 * lane strided by the sum of one period of gaps. `5,6,15,16,25,26` becomes
 * `5-25:10,6-26:10`. Declines when all gaps are equal.
 */
class PeriodicLaneStrategy : public ICompressionStrategy
{
public:
    const char* name() const noexcept override
    {
        return "periodic-lane";
    }
    std::optional<std::string> try_compress(const SortedIndices& input) const override;

    /**
     * @brief Detect the smallest repeating gap period.
     * @return The period, or 0 if none of 2..5 fits.
     */
    static size_t detect_period(const std::vector<TaskIdx>& gaps);
};

/**
 * @brief Group by `value mod stride` and compress each residue class.
 *
 * @details
 * Candidate strides are tried largest first. A stride is skipped when there are fewer than
 * `3 * stride` values or fewer than two residue classes with three or more members. The result
 * is accepted only when it averages under two characters per index.
 */
class ModuloGroupStrategy : public ICompressionStrategy
{
public:
    explicit ModuloGroupStrategy(std::vector<TaskIdx> strides = {10, 5, 2});

    const char* name() const noexcept override
    {
        return "modulo-group";
    }
    std::optional<std::string> try_compress(const SortedIndices& input) const override;

private:
    std::vector<TaskIdx> m_strides;
};

/**
 * @brief Left-to-right greedy runs; always succeeds.
 *
 * @details
 * A run with a constant gap is emitted as a range when it has three or more members, or two
 * members with gap 1. Anything else is emitted as a literal.
 */
class GreedyRunStrategy : public ICompressionStrategy
{
public:
    const char* name() const noexcept override
    {
        return "greedy-run";
    }
    std::optional<std::string> try_compress(const SortedIndices& input) const override;
};

/**
 * @brief The production strategy order.
 *
 * @details
 * Small set, uniform stride, periodic lanes, modulo grouping, greedy runs. The order favors
 * the encodings that are shortest for uniform batches failing at regular offsets; it is not a
 * globally optimal encoder.
 */
std::vector<CompressionStrategyPtr> default_compression_strategies();

} // namespace memescalate
