/**
 * @file index_set_codec.hpp
 * @brief Compact textual encoding of array task index sets.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/escalation_enums.hpp"
#include "memescalate/codec/compression_strategies.hpp"

namespace memescalate
{

/**
 * @brief Encodes index sets as scheduler array specs and decodes them back.
 *
 * @details
 * A spec is a comma-separated list of tokens, each `n`, `a-b` (stride 1) or `a-b:s`. The
 * encoding is lossless with respect to the set of values; order and duplicates in the input
 * are not preserved.
 *
 * `compress()` walks its strategy list and returns the first spec produced. With the default
 * list the greedy fallback guarantees a result.
 *
 * @par Thread safety
 * - Stateless after construction; all methods are const and may be called concurrently.
 */
class IndexSetCodec
{
public:
    /**
     * @brief Construct a codec with the production strategy order.
     */
    IndexSetCodec();

    /**
     * @brief Construct a codec with a custom strategy order.
     * @param strategies Tried front to back. If none accepts, a plain literal list is emitted.
     */
    explicit IndexSetCodec(std::vector<CompressionStrategyPtr> strategies);

    /**
     * @brief Compress a set of indices into a spec.
     * @return The spec; empty for an empty set.
     */
    std::string compress(const IndexSet& indices) const;

    /**
     * @brief Expand a spec into its set of indices.
     * @param spec Comma-separated `n`, `a-b` or `a-b:s` tokens. Surrounding blanks are ignored.
     * @return The decoded set; empty for an empty spec.
     * @throw EscalationError with `CodecInput` for empty tokens, non-numeric parts, `a > b`,
     *        a zero stride, or a range larger than `kMaxExpandedSize`.
     */
    IndexSet expand(const std::string& spec) const;

    /**
     * @brief Split an index set into specs short enough for one submission each.
     *
     * @details
     * If the compressed spec of the whole set fits in `max_spec_len` characters it is
     * returned alone. Otherwise the sorted indices are cut into consecutive chunks of
     * `batch_size` and each chunk is compressed separately.
     *
     * @return One spec per submission; empty for an empty set.
     * @throw EscalationError with `InvalidArgument` if `batch_size` is 0.
     */
    std::vector<std::string> split_into_batches(
        const IndexSet& indices, size_t max_spec_len, size_t batch_size) const;

    /**
     * @brief Name of the strategy that would encode `indices`, for diagnostics.
     */
    std::string strategy_for(const IndexSet& indices) const;

    /**
     * @brief Upper bound on the number of values one spec may expand to.
     */
    static constexpr size_t kMaxExpandedSize = 10'000'000;

private:
    std::vector<CompressionStrategyPtr> m_strategies;
};

/**
 * @brief Compress with the default codec.
 */
std::string compress_indices(const IndexSet& indices);

/**
 * @brief Expand with the default codec.
 * @throw EscalationError with `CodecInput` on malformed input.
 */
IndexSet expand_indices(const std::string& spec);

/**
 * @brief Number of indices a spec denotes.
 * @throw EscalationError with `CodecInput` on malformed input.
 */
size_t count_indices(const std::string& spec);

/**
 * @brief Render indices as a plain comma list (`1,2,3`), the form shell drivers pass around.
 */
std::string join_indices(const IndexSet& indices);

} // namespace memescalate
