/**
 * @file index_set_codec_tests.cpp
 * Unit tests for memescalate::IndexSetCodec
 */
#include <gtest/gtest.h>
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

#include <string>
#include <vector>

using namespace memescalate;

namespace
{

IndexSet range_set(TaskIdx first, TaskIdx last, TaskIdx stride = 1)
{
    IndexSet out;
    for (TaskIdx v = first; v <= last; v += stride)
    {
        out.insert(v);
    }
    return out;
}

// Residues 0 and 3 mod 10 with uneven tails, plus a stray 57; neither uniform nor periodic.
IndexSet residue_classes_sample()
{
    IndexSet out = range_set(0, 190, 10);
    IndexSet threes = range_set(3, 143, 10);
    out.insert(threes.begin(), threes.end());
    out.insert(57);
    return out;
}

EscalationErrorCode expand_error_code(const std::string& spec)
{
    try
    {
        expand_indices(spec);
    }
    catch (const EscalationError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected '" << spec << "' to be rejected";
    return EscalationErrorCode::InvalidArgument;
}

} // namespace

// ============================================================================
// Compress - pinned outputs
// ============================================================================

TEST(IndexSetCodecTests, Compress_EmptySetIsEmptyString)
{
    EXPECT_EQ(compress_indices({}), "");
}

TEST(IndexSetCodecTests, Compress_SingleIndex)
{
    EXPECT_EQ(compress_indices({7}), "7");
}

TEST(IndexSetCodecTests, Compress_AdjacentPairIsRange)
{
    EXPECT_EQ(compress_indices({3, 4}), "3-4");
}

TEST(IndexSetCodecTests, Compress_DistantPairIsList)
{
    EXPECT_EQ(compress_indices({3, 9}), "3,9");
}

TEST(IndexSetCodecTests, Compress_ContiguousRun)
{
    EXPECT_EQ(compress_indices(range_set(0, 4)), "0-4");
}

TEST(IndexSetCodecTests, Compress_UniformStride)
{
    EXPECT_EQ(compress_indices({8, 18, 28, 38}), "8-38:10");
    EXPECT_EQ(compress_indices({100, 200, 300}), "100-300:100");
}

TEST(IndexSetCodecTests, Compress_TwoPeriodicLanes)
{
    EXPECT_EQ(compress_indices({5, 6, 15, 16, 25, 26}), "5-25:10,6-26:10");
}

TEST(IndexSetCodecTests, Compress_ThreePeriodicLanes)
{
    EXPECT_EQ(compress_indices({1, 2, 3, 11, 12, 13, 21, 22, 23}), "1-21:10,2-22:10,3-23:10");
}

TEST(IndexSetCodecTests, Compress_ModuloGroupPerResidueClass)
{
    IndexSet sample = residue_classes_sample();
    ASSERT_EQ(sample.size(), 36u);
    EXPECT_EQ(compress_indices(sample), "0-190:10,3-143:10,57");
}

TEST(IndexSetCodecTests, ModuloGroup_DeclinesWhenGroupingIsNotShorter)
{
    ModuloGroupStrategy strategy;
    EXPECT_FALSE(
        strategy.try_compress(SortedIndices::from({0, 10, 20, 30, 1, 11, 21, 31, 4, 99})).has_value());
    EXPECT_TRUE(strategy.try_compress(SortedIndices::from(residue_classes_sample())).has_value());
}

TEST(IndexSetCodecTests, Compress_GreedyRunsWithMixedStrides)
{
    EXPECT_EQ(compress_indices({1, 2, 3, 10, 12, 14}), "1-3,10-14:2");
}

TEST(IndexSetCodecTests, Compress_IrregularSetStaysLiteral)
{
    EXPECT_EQ(compress_indices({5, 17, 42}), "5,17,42");
}

// ============================================================================
// Strategy selection
// ============================================================================

TEST(IndexSetCodecTests, StrategyFor_ReportsFirstApplicableStrategy)
{
    IndexSetCodec codec;
    EXPECT_EQ(codec.strategy_for({7}), "small-set");
    EXPECT_EQ(codec.strategy_for({8, 18, 28, 38}), "uniform-stride");
    EXPECT_EQ(codec.strategy_for({5, 6, 15, 16, 25, 26}), "periodic-lane");
    EXPECT_EQ(codec.strategy_for(residue_classes_sample()), "modulo-group");
    EXPECT_EQ(codec.strategy_for({5, 17, 42}), "greedy-run");
}

TEST(IndexSetCodecTests, CustomStrategyList_FallsBackToLiteralList)
{
    IndexSetCodec codec(std::vector<CompressionStrategyPtr>{});
    EXPECT_EQ(codec.compress({1, 2, 3}), "1,2,3");
    EXPECT_EQ(codec.strategy_for({1, 2, 3}), "literal-list");
}

TEST(IndexSetCodecTests, PeriodicLane_DetectPeriodNeedsTwoFullCycles)
{
    EXPECT_EQ(PeriodicLaneStrategy::detect_period({1, 9, 1, 9, 1}), 2u);
    EXPECT_EQ(PeriodicLaneStrategy::detect_period({1, 9, 1}), 0u);
    EXPECT_EQ(PeriodicLaneStrategy::detect_period({3, 5, 8, 13, 21}), 0u);
}

// ============================================================================
// Expand
// ============================================================================

TEST(IndexSetCodecTests, Expand_EmptyAndBlankSpecs)
{
    EXPECT_TRUE(expand_indices("").empty());
    EXPECT_TRUE(expand_indices("   ").empty());
}

TEST(IndexSetCodecTests, Expand_MixedTokens)
{
    IndexSet expected{0, 1, 2, 3, 10, 20, 30, 42};
    EXPECT_EQ(expand_indices("0-3,10-30:10,42"), expected);
}

TEST(IndexSetCodecTests, Expand_StrideNotReachingEnd)
{
    IndexSet expected{1, 4, 7};
    EXPECT_EQ(expand_indices("1-8:3"), expected);
}

TEST(IndexSetCodecTests, Expand_ToleratesWhitespaceAroundTokens)
{
    IndexSet expected{1, 2, 5};
    EXPECT_EQ(expand_indices(" 1-2 , 5 "), expected);
}

TEST(IndexSetCodecTests, Expand_DuplicatesCollapse)
{
    IndexSet expected{1, 2, 3};
    EXPECT_EQ(expand_indices("1-3,2,3"), expected);
}

TEST(IndexSetCodecTests, Expand_MalformedTokensAreCodecInputErrors)
{
    EXPECT_EQ(expand_error_code("abc"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("5-3"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("1-5:0"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("1,,2"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("3:2"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("-4"), EscalationErrorCode::CodecInput);
    EXPECT_EQ(expand_error_code("1-"), EscalationErrorCode::CodecInput);
}

TEST(IndexSetCodecTests, Expand_RejectsHugeRanges)
{
    EXPECT_EQ(expand_error_code("0-99999999999"), EscalationErrorCode::CodecInput);
}

TEST(IndexSetCodecTests, CountIndices_MatchesExpandedSize)
{
    EXPECT_EQ(count_indices("0-9,20-40:10"), 13u);
    EXPECT_EQ(count_indices(""), 0u);
}

// ============================================================================
// Round trip
// ============================================================================

TEST(IndexSetCodecTests, RoundTrip_ExpandOfCompressIsIdentity)
{
    std::vector<IndexSet> samples = {
        {},
        {0},
        {3, 4},
        {3, 9},
        range_set(0, 99),
        range_set(7, 700, 7),
        {5, 6, 15, 16, 25, 26},
        {1, 2, 3, 11, 12, 13, 21, 22, 23},
        {0, 10, 20, 30, 1, 11, 21, 31, 4, 99},
        {1, 2, 3, 10, 12, 14},
        {5, 17, 42, 43, 44, 1000},
        residue_classes_sample(),
    };
    for (const auto& sample : samples)
    {
        std::string spec = compress_indices(sample);
        EXPECT_EQ(expand_indices(spec), sample) << "spec: " << spec;
    }
}

// ============================================================================
// Batching
// ============================================================================

TEST(IndexSetCodecTests, SplitIntoBatches_EmptyInputHasNoBatches)
{
    IndexSetCodec codec;
    EXPECT_TRUE(codec.split_into_batches({}, 3000, 500).empty());
}

TEST(IndexSetCodecTests, SplitIntoBatches_ShortSpecStaysWhole)
{
    IndexSetCodec codec;
    auto batches = codec.split_into_batches(range_set(0, 9), 3000, 4);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0], "0-9");
}

TEST(IndexSetCodecTests, SplitIntoBatches_LongSpecSplitsByBatchSize)
{
    IndexSetCodec codec;
    auto batches = codec.split_into_batches(range_set(0, 9), 1, 4);
    std::vector<std::string> expected{"0-3", "4-7", "8-9"};
    EXPECT_EQ(batches, expected);
}

TEST(IndexSetCodecTests, SplitIntoBatches_BatchesCoverEveryIndexOnce)
{
    IndexSetCodec codec;
    IndexSet input;
    for (TaskIdx v = 0; v < 2000; v += 3)
    {
        input.insert(v);
        input.insert(v * 7 + 1);
    }
    auto batches = codec.split_into_batches(input, 20, 100);
    ASSERT_GT(batches.size(), 1u);

    IndexSet covered;
    size_t total = 0;
    for (const auto& spec : batches)
    {
        IndexSet part = expand_indices(spec);
        EXPECT_LE(part.size(), 100u);
        total += part.size();
        covered.insert(part.begin(), part.end());
    }
    EXPECT_EQ(total, input.size());
    EXPECT_EQ(covered, input);
}

TEST(IndexSetCodecTests, SplitIntoBatches_ZeroBatchSizeIsRejected)
{
    IndexSetCodec codec;
    EXPECT_THROW(codec.split_into_batches({1, 2}, 1, 0), EscalationError);
}

TEST(IndexSetCodecTests, JoinIndices_PlainCommaList)
{
    EXPECT_EQ(join_indices({3, 1, 2}), "1,2,3");
    EXPECT_EQ(join_indices({}), "");
}
