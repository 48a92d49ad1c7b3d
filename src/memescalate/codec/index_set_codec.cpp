/**
 * @file index_set_codec.cpp
 */
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"

#include <charconv>
#include <string_view>

namespace memescalate
{

namespace
{

std::string_view trim(std::string_view text)
{
    const char* blanks = " \t\r\n";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos)
    {
        return {};
    }
    auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

[[noreturn]] void throw_malformed(std::string_view token, const std::string& why)
{
    throw EscalationError(
        EscalationErrorCode::CodecInput,
        "Malformed index token '" + std::string(token) + "': " + why);
}

TaskIdx parse_number(std::string_view digits, std::string_view token)
{
    if (digits.empty())
    {
        throw_malformed(token, "missing number");
    }
    TaskIdx value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        throw_malformed(token, "number out of range");
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        throw_malformed(token, "expected a non-negative integer");
    }
    return value;
}

void expand_token(std::string_view token, IndexSet& out)
{
    auto dash = token.find('-');
    if (dash == std::string_view::npos)
    {
        if (token.find(':') != std::string_view::npos)
        {
            throw_malformed(token, "stride without a range");
        }
        out.insert(parse_number(token, token));
        return;
    }

    std::string_view first_part = token.substr(0, dash);
    std::string_view rest = token.substr(dash + 1);
    std::string_view last_part = rest;
    TaskIdx stride = 1;

    auto colon = rest.find(':');
    if (colon != std::string_view::npos)
    {
        last_part = rest.substr(0, colon);
        stride = parse_number(rest.substr(colon + 1), token);
        if (stride == 0)
        {
            throw_malformed(token, "stride must be positive");
        }
    }

    TaskIdx first = parse_number(first_part, token);
    TaskIdx last = parse_number(last_part, token);
    if (first > last)
    {
        throw_malformed(token, "range start exceeds range end");
    }
    if ((last - first) / stride >= IndexSetCodec::kMaxExpandedSize)
    {
        throw_malformed(token, "range expands to too many indices");
    }

    for (TaskIdx value = first;; value += stride)
    {
        out.insert(value);
        if (last - value < stride)
        {
            break;
        }
    }
}

} // namespace

IndexSetCodec::IndexSetCodec()
    : m_strategies{default_compression_strategies()}
{
}

IndexSetCodec::IndexSetCodec(std::vector<CompressionStrategyPtr> strategies)
    : m_strategies{std::move(strategies)}
{
}

std::string IndexSetCodec::compress(const IndexSet& indices) const
{
    SortedIndices sorted = SortedIndices::from(indices);
    for (const auto& strategy : m_strategies)
    {
        if (auto spec = strategy->try_compress(sorted))
        {
            return *spec;
        }
    }
    return join_indices(indices);
}

std::string IndexSetCodec::strategy_for(const IndexSet& indices) const
{
    SortedIndices sorted = SortedIndices::from(indices);
    for (const auto& strategy : m_strategies)
    {
        if (strategy->try_compress(sorted))
        {
            return strategy->name();
        }
    }
    return "literal-list";
}

IndexSet IndexSetCodec::expand(const std::string& spec) const
{
    IndexSet result;
    std::string_view whole = trim(spec);
    if (whole.empty())
    {
        return result;
    }

    size_t pos = 0;
    while (pos <= whole.size())
    {
        size_t comma = whole.find(',', pos);
        if (comma == std::string_view::npos)
        {
            comma = whole.size();
        }
        std::string_view token = trim(whole.substr(pos, comma - pos));
        if (token.empty())
        {
            throw EscalationError(
                EscalationErrorCode::CodecInput,
                "Empty token in index spec '" + spec + "'");
        }
        expand_token(token, result);
        if (result.size() > kMaxExpandedSize)
        {
            throw EscalationError(
                EscalationErrorCode::CodecInput,
                "Index spec expands to more than " + std::to_string(kMaxExpandedSize) + " indices");
        }
        pos = comma + 1;
    }
    return result;
}

std::vector<std::string> IndexSetCodec::split_into_batches(
    const IndexSet& indices, size_t max_spec_len, size_t batch_size) const
{
    if (batch_size == 0)
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument, "Batch size must be positive");
    }

    std::vector<std::string> batches;
    if (indices.empty())
    {
        return batches;
    }

    std::string whole = compress(indices);
    if (whole.size() <= max_spec_len)
    {
        batches.push_back(std::move(whole));
        return batches;
    }

    auto logger = get_logger();
    SPDLOG_LOGGER_INFO(logger, "Array spec too long ({} chars > {}), splitting {} indices into batches of {}",
                       whole.size(), max_spec_len, indices.size(), batch_size);

    IndexSet chunk;
    for (TaskIdx value : indices)
    {
        chunk.insert(value);
        if (chunk.size() == batch_size)
        {
            batches.push_back(compress(chunk));
            chunk.clear();
        }
    }
    if (!chunk.empty())
    {
        batches.push_back(compress(chunk));
    }
    return batches;
}

// ============================================================================
// Free functions
// ============================================================================

std::string compress_indices(const IndexSet& indices)
{
    static const IndexSetCodec codec;
    return codec.compress(indices);
}

IndexSet expand_indices(const std::string& spec)
{
    static const IndexSetCodec codec;
    return codec.expand(spec);
}

size_t count_indices(const std::string& spec)
{
    return expand_indices(spec).size();
}

std::string join_indices(const IndexSet& indices)
{
    std::string out;
    for (TaskIdx value : indices)
    {
        if (!out.empty())
        {
            out += ",";
        }
        out += std::to_string(value);
    }
    return out;
}

} // namespace memescalate
