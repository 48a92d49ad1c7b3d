/**
 * @file escalation_planner_tests.cpp
 * Unit tests for memescalate::EscalationPlanner
 */
#include <gtest/gtest.h>
#include "memescalate/chain/escalation_planner.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "../support/sample_chain.hpp"

#include <string>
#include <vector>

using namespace memescalate;

class EscalationPlannerTests : public ::testing::Test
{
protected:
    ChainRecord record = make_initial_record(test_support::sample_chain("plan"), "t");
    ClassificationRules rules = ClassificationRules::defaults();

    ClassificationResult classify(const std::vector<RawTaskResult>& raw)
    {
        return classify_outcomes(raw, rules);
    }

    static std::vector<RawTaskResult> tasks(TaskIdx first, TaskIdx last, const std::string& state)
    {
        std::vector<RawTaskResult> out;
        for (TaskIdx i = first; i <= last; ++i)
        {
            out.push_back(RawTaskResult{i, state, state == "COMPLETED" ? "0:0" : "0:125"});
        }
        return out;
    }

    static std::vector<RawTaskResult> concat(
        std::vector<RawTaskResult> a, const std::vector<RawTaskResult>& b)
    {
        a.insert(a.end(), b.begin(), b.end());
        return a;
    }
};

TEST_F(EscalationPlannerTests, Plan_AllCompletedIsComplete)
{
    auto decision = EscalationPlanner().plan(record, classify(tasks(0, 39, "COMPLETED")));
    EXPECT_EQ(decision.kind, DecisionKind::Complete);
    EXPECT_EQ(decision.completed_count, 40u);
    EXPECT_EQ(decision.escalate_spec, "");
    EXPECT_TRUE(decision.batch_specs.empty());
}

TEST_F(EscalationPlannerTests, Plan_OnlyNoRetryFailuresIsComplete)
{
    auto raw = concat(tasks(0, 37, "COMPLETED"), tasks(38, 39, "FAILED"));
    auto decision = EscalationPlanner().plan(record, classify(raw));
    EXPECT_EQ(decision.kind, DecisionKind::Complete);
    EXPECT_EQ(decision.no_retry_count, 2u);
}

TEST_F(EscalationPlannerTests, Plan_OomTasksEscalateToNextTier)
{
    auto raw = concat(tasks(0, 9, "OUT_OF_MEMORY"), tasks(10, 39, "COMPLETED"));
    auto decision = EscalationPlanner().plan(record, classify(raw));

    EXPECT_EQ(decision.kind, DecisionKind::Escalate);
    EXPECT_EQ(decision.next_level, 1u);
    EXPECT_EQ(decision.next_tier, (ResourceLevel{"short", "4G", "01:00:00"}));
    EXPECT_EQ(decision.escalate_spec, "0-9");
    EXPECT_EQ(decision.escalate_count, 10u);
    EXPECT_EQ(decision.oom_count, 10u);
    EXPECT_EQ(decision.completed_count, 30u);
    EXPECT_EQ(decision.batch_specs, (std::vector<std::string>{"0-9"}));
}

TEST_F(EscalationPlannerTests, Plan_LongSpecIsBatched)
{
    std::vector<RawTaskResult> raw;
    for (TaskIdx i = 0; i < 40; ++i)
    {
        raw.push_back(i % 3 == 0 ? RawTaskResult{i, "TIMEOUT", "0:15"}
                                 : RawTaskResult{i, "COMPLETED", "0:0"});
    }
    auto decision = EscalationPlanner(BatchLimits{1, 5}).plan(record, classify(raw));

    ASSERT_EQ(decision.kind, DecisionKind::Escalate);
    ASSERT_EQ(decision.batch_specs.size(), 3u);
    IndexSet covered;
    for (const auto& spec : decision.batch_specs)
    {
        IndexSet part = expand_indices(spec);
        covered.insert(part.begin(), part.end());
    }
    EXPECT_EQ(covered, expand_indices(decision.escalate_spec));
}

TEST_F(EscalationPlannerTests, Plan_TopLevelOomFailsWithMemory)
{
    record.state.current_level = 2;
    record.state.pending_indices = "4-6";
    auto decision = EscalationPlanner().plan(record, classify(tasks(4, 6, "OUT_OF_MEMORY")));
    EXPECT_EQ(decision.kind, DecisionKind::Fail);
    EXPECT_EQ(decision.next_level, 2u);
    EXPECT_EQ(decision.fail_reason, FailureReason::Memory);
    EXPECT_EQ(decision.escalate_spec, "4-6");
}

TEST_F(EscalationPlannerTests, Plan_TopLevelTimeoutFailsWithTime)
{
    record.state.current_level = 2;
    record.state.pending_indices = "4-6";
    auto decision = EscalationPlanner().plan(record, classify(tasks(4, 6, "TIMEOUT")));
    EXPECT_EQ(decision.kind, DecisionKind::Fail);
    EXPECT_EQ(decision.fail_reason, FailureReason::Time);
}

TEST_F(EscalationPlannerTests, Plan_TopLevelMixedFailsWithLevel)
{
    record.state.current_level = 2;
    record.state.pending_indices = "0-3";
    auto raw = concat(tasks(0, 1, "OUT_OF_MEMORY"), tasks(2, 3, "TIMEOUT"));
    auto decision = EscalationPlanner().plan(record, classify(raw));
    EXPECT_EQ(decision.kind, DecisionKind::Fail);
    EXPECT_EQ(decision.fail_reason, FailureReason::Level);
}

// ============================================================================
// Incomplete accounting
// ============================================================================

TEST_F(EscalationPlannerTests, Plan_NoResultsIsUnknown)
{
    auto decision = EscalationPlanner().plan(record, classify({}));
    EXPECT_EQ(decision.kind, DecisionKind::Unknown);
    EXPECT_EQ(decision.missing_count, 40u);
    EXPECT_EQ(decision.missing_spec, "0-39");
    EXPECT_TRUE(decision.batch_specs.empty());
}

TEST_F(EscalationPlannerTests, Plan_PartialResultsAreUnknown)
{
    auto decision = EscalationPlanner().plan(record, classify(tasks(0, 4, "COMPLETED")));
    EXPECT_EQ(decision.kind, DecisionKind::Unknown);
    EXPECT_EQ(decision.completed_count, 5u);
    EXPECT_EQ(decision.missing_count, 35u);
    EXPECT_EQ(decision.missing_spec, "5-39");
}

TEST_F(EscalationPlannerTests, Plan_PartialResultsWithOomAreUnknown)
{
    auto raw = concat(tasks(0, 29, "COMPLETED"), tasks(30, 34, "OUT_OF_MEMORY"));
    auto decision = EscalationPlanner().plan(record, classify(raw));
    EXPECT_EQ(decision.kind, DecisionKind::Unknown);
    EXPECT_EQ(decision.missing_spec, "35-39");
    EXPECT_EQ(decision.escalate_spec, "");
}

TEST_F(EscalationPlannerTests, Plan_CoverageFollowsPendingIndices)
{
    record.state.pending_indices = "8-9";
    auto decision = EscalationPlanner().plan(record, classify(tasks(8, 9, "COMPLETED")));
    EXPECT_EQ(decision.kind, DecisionKind::Complete);
}

TEST_F(EscalationPlannerTests, ExpectedIndices_FallsBackToLastRound)
{
    record.state.pending_indices.clear();
    EXPECT_TRUE(EscalationPlanner::expected_indices(record).empty());

    Round round;
    round.array_spec = "3-5";
    record.rounds.push_back(round);
    EXPECT_EQ(EscalationPlanner::expected_indices(record), (IndexSet{3, 4, 5}));
}

TEST_F(EscalationPlannerTests, DecisionKind_ToString)
{
    EXPECT_EQ(to_string(DecisionKind::Complete), "COMPLETE");
    EXPECT_EQ(to_string(DecisionKind::Escalate), "ESCALATE");
    EXPECT_EQ(to_string(DecisionKind::Fail), "FAIL");
    EXPECT_EQ(to_string(DecisionKind::Unknown), "UNKNOWN");
}
