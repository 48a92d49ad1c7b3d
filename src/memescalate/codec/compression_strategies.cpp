/**
 * @file compression_strategies.cpp
 */
#include "memescalate/codec/compression_strategies.hpp"

#include <numeric>

namespace memescalate
{

namespace
{

std::string render_range(TaskIdx first, TaskIdx last, TaskIdx stride)
{
    std::string out = std::to_string(first) + "-" + std::to_string(last);
    if (stride != 1)
    {
        out += ":" + std::to_string(stride);
    }
    return out;
}

std::string render_pair(TaskIdx first, TaskIdx second)
{
    if (second == first + 1)
    {
        return std::to_string(first) + "-" + std::to_string(second);
    }
    return std::to_string(first) + "," + std::to_string(second);
}

std::string join(const std::vector<std::string>& parts)
{
    std::string out;
    for (const auto& part : parts)
    {
        if (!out.empty())
        {
            out += ",";
        }
        out += part;
    }
    return out;
}

bool all_gaps_equal(const std::vector<TaskIdx>& gaps)
{
    return std::all_of(gaps.begin(), gaps.end(),
                       [&](TaskIdx g) { return g == gaps.front(); });
}

// Greedy runs of exactly `stride` inside one residue class; two members already make a range.
void compress_group_greedy(const std::vector<TaskIdx>& group, TaskIdx stride,
                           std::vector<std::string>& parts)
{
    size_t gi = 0;
    while (gi < group.size())
    {
        TaskIdx run_start = group[gi];
        TaskIdx run_end = run_start;
        size_t run_count = 1;
        size_t gj = gi + 1;
        while (gj < group.size() && group[gj] == run_end + stride)
        {
            run_end = group[gj];
            ++run_count;
            ++gj;
        }
        if (run_count >= 2)
        {
            parts.push_back(render_range(run_start, run_end, stride));
            gi = gj;
        }
        else
        {
            parts.push_back(std::to_string(run_start));
            ++gi;
        }
    }
}

} // namespace

// ============================================================================
// SortedIndices
// ============================================================================

SortedIndices SortedIndices::from(const IndexSet& indices)
{
    SortedIndices result;
    result.values.assign(indices.begin(), indices.end());
    if (result.values.size() > 1)
    {
        result.gaps.reserve(result.values.size() - 1);
        for (size_t i = 1; i < result.values.size(); ++i)
        {
            result.gaps.push_back(result.values[i] - result.values[i - 1]);
        }
    }
    return result;
}

// ============================================================================
// Strategies
// ============================================================================

std::optional<std::string> SmallSetStrategy::try_compress(const SortedIndices& input) const
{
    switch (input.size())
    {
        case 0:
            return std::string{};
        case 1:
            return std::to_string(input.values[0]);
        case 2:
            return render_pair(input.values[0], input.values[1]);
        default:
            return std::nullopt;
    }
}

std::optional<std::string> UniformStrideStrategy::try_compress(const SortedIndices& input) const
{
    // Three members with one shared gap always qualify as a run
    if (input.size() < 3 || !all_gaps_equal(input.gaps))
    {
        return std::nullopt;
    }
    return render_range(input.values.front(), input.values.back(), input.gaps.front());
}

size_t PeriodicLaneStrategy::detect_period(const std::vector<TaskIdx>& gaps)
{
    for (size_t period = 2; period <= 5; ++period)
    {
        if (gaps.size() < period * 2 + 1)
        {
            continue;
        }
        bool periodic = true;
        for (size_t i = period; i < gaps.size(); ++i)
        {
            if (gaps[i] != gaps[i % period])
            {
                periodic = false;
                break;
            }
        }
        if (periodic)
        {
            return period;
        }
    }
    return 0;
}

std::optional<std::string> PeriodicLaneStrategy::try_compress(const SortedIndices& input) const
{
    if (input.size() < 3 || all_gaps_equal(input.gaps))
    {
        return std::nullopt;
    }

    size_t period = detect_period(input.gaps);
    if (period == 0)
    {
        return std::nullopt;
    }

    TaskIdx total_stride = std::accumulate(
        input.gaps.begin(), input.gaps.begin() + static_cast<std::ptrdiff_t>(period),
        TaskIdx{0});

    std::vector<std::string> parts;
    for (size_t offset = 0; offset < period; ++offset)
    {
        std::vector<TaskIdx> lane;
        for (size_t j = offset; j < input.size(); j += period)
        {
            lane.push_back(input.values[j]);
        }

        if (lane.size() >= 3)
        {
            parts.push_back(render_range(lane.front(), lane.back(), total_stride));
        }
        else if (lane.size() == 2)
        {
            parts.push_back(render_pair(lane.front(), lane.back()));
        }
        else
        {
            parts.push_back(std::to_string(lane.front()));
        }
    }
    return join(parts);
}

ModuloGroupStrategy::ModuloGroupStrategy(std::vector<TaskIdx> strides)
    : m_strides{std::move(strides)}
{
}

std::optional<std::string> ModuloGroupStrategy::try_compress(const SortedIndices& input) const
{
    const size_t count = input.size();

    for (TaskIdx stride : m_strides)
    {
        if (stride < 2 || count < stride * 3)
        {
            continue;
        }

        // Ordered by modulus; each group stays sorted because input is sorted
        std::map<TaskIdx, std::vector<TaskIdx>> groups;
        for (TaskIdx value : input.values)
        {
            groups[value % stride].push_back(value);
        }

        size_t useful_groups = 0;
        for (const auto& [mod, group] : groups)
        {
            if (group.size() >= 3)
            {
                ++useful_groups;
            }
        }
        if (useful_groups < 2)
        {
            continue;
        }

        std::vector<std::string> parts;
        for (const auto& [mod, group] : groups)
        {
            if (group.size() == 1)
            {
                parts.push_back(std::to_string(group[0]));
            }
            else if (group.size() == 2)
            {
                if (group[1] - group[0] == stride)
                {
                    parts.push_back(render_range(group[0], group[1], stride));
                }
                else
                {
                    parts.push_back(std::to_string(group[0]) + "," + std::to_string(group[1]));
                }
            }
            else
            {
                compress_group_greedy(group, stride, parts);
            }
        }

        std::string grouped = join(parts);
        if (grouped.size() < count * 2)
        {
            return grouped;
        }
    }
    return std::nullopt;
}

std::optional<std::string> GreedyRunStrategy::try_compress(const SortedIndices& input) const
{
    const auto& values = input.values;
    const size_t count = values.size();
    std::vector<std::string> parts;

    size_t i = 0;
    while (i < count)
    {
        TaskIdx start = values[i];
        if (i + 1 >= count)
        {
            parts.push_back(std::to_string(start));
            ++i;
            continue;
        }

        TaskIdx stride = values[i + 1] - values[i];
        TaskIdx range_end = start;
        size_t range_count = 1;
        size_t j = i + 1;
        while (j < count && values[j] == range_end + stride)
        {
            range_end = values[j];
            ++range_count;
            ++j;
        }

        if (range_count >= 3 || (range_count == 2 && stride == 1))
        {
            parts.push_back(render_range(start, range_end, stride));
            i = j;
        }
        else
        {
            parts.push_back(std::to_string(start));
            ++i;
        }
    }
    return join(parts);
}

std::vector<CompressionStrategyPtr> default_compression_strategies()
{
    return {
        std::make_shared<SmallSetStrategy>(),
        std::make_shared<UniformStrideStrategy>(),
        std::make_shared<PeriodicLaneStrategy>(),
        std::make_shared<ModuloGroupStrategy>(),
        std::make_shared<GreedyRunStrategy>(),
    };
}

} // namespace memescalate
