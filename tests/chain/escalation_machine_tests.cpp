/**
 * @file escalation_machine_tests.cpp
 * Unit tests for memescalate::EscalationMachine
 */
#include <gtest/gtest.h>
#include "memescalate/chain/escalation_machine.hpp"
#include "memescalate/codec/index_set_codec.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "../support/sample_chain.hpp"

#include <algorithm>
#include <string>

using namespace memescalate;

class EscalationMachineTests : public ::testing::Test
{
protected:
    InMemoryCheckpointStore store;
    test_support::RecordingAuditSink sink;
    EscalationMachine machine{store, &sink};

    void start_chain(const std::string& chain_id = "chain1")
    {
        machine.create_chain(test_support::sample_chain(chain_id));
        ASSERT_TRUE(machine.record_round(chain_id, {"1001"}, "1002", "0-39", 0, "1G"));
    }

    EscalationRequest oom_request(size_t next_level, const std::string& spec, size_t completed)
    {
        EscalationRequest request;
        request.next_level = next_level;
        request.next_memory = test_support::sample_levels()[next_level].memory;
        request.escalate_spec = spec;
        request.retry_job_ids = {"2001"};
        request.handler_id = "2002";
        request.completed_count = completed;
        request.escalate_count = count_indices(spec);
        request.oom_count = request.escalate_count;
        return request;
    }

    static size_t pending_rounds(const ChainRecord& record)
    {
        return static_cast<size_t>(std::count_if(record.rounds.begin(), record.rounds.end(),
            [](const Round& r) { return r.status == RoundStatus::Pending; }));
    }
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(EscalationMachineTests, CreateChain_StartsAtLevelZero)
{
    ChainRecord record = machine.create_chain(test_support::sample_chain("c"));
    EXPECT_EQ(record.state.status, ChainStatus::Starting);
    EXPECT_EQ(record.state.current_level, 0u);
    EXPECT_EQ(record.state.current_memory, "1G");
    EXPECT_EQ(record.state.current_time, "00:05:00");
    EXPECT_EQ(record.state.pending_indices, "0-39");
    EXPECT_EQ(record.revision, 1u);
    EXPECT_TRUE(record.rounds.empty());
    EXPECT_TRUE(store.exists("c"));

    ASSERT_EQ(sink.entries.size(), 1u);
    EXPECT_EQ(sink.entries[0].action_type, "CREATED");
    EXPECT_EQ(sink.synced.size(), 1u);
}

TEST_F(EscalationMachineTests, CreateChain_OverwritesByDefault)
{
    machine.create_chain(test_support::sample_chain("c"));
    ASSERT_TRUE(machine.record_round("c", {"1"}, "2", "0-39", 0, "1G"));

    ChainRecord fresh = machine.create_chain(test_support::sample_chain("c"));
    EXPECT_TRUE(fresh.rounds.empty());
    EXPECT_TRUE(machine.load("c").rounds.empty());
}

TEST_F(EscalationMachineTests, CreateChain_NoOverwriteRaisesChainExists)
{
    machine.create_chain(test_support::sample_chain("c"));
    try
    {
        machine.create_chain(test_support::sample_chain("c"), false);
        FAIL() << "expected ChainExists";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::ChainExists);
    }
}

TEST_F(EscalationMachineTests, CreateChain_InvalidChainIsRejected)
{
    EscalationChain chain = test_support::sample_chain("bad/id");
    EXPECT_THROW(machine.create_chain(chain), EscalationError);

    chain = test_support::sample_chain("no_levels");
    chain.levels.clear();
    EXPECT_THROW(machine.create_chain(chain), EscalationError);
    EXPECT_FALSE(store.exists("no_levels"));
}

// ============================================================================
// Rounds
// ============================================================================

TEST_F(EscalationMachineTests, RecordRound_AppendsRunningRound)
{
    start_chain();
    ChainRecord record = machine.load("chain1");
    EXPECT_EQ(record.state.status, ChainStatus::Running);
    ASSERT_EQ(record.rounds.size(), 1u);
    EXPECT_EQ(record.rounds[0].ordinal, 1u);
    EXPECT_EQ(record.rounds[0].primary_job_id(), "1001");
    EXPECT_EQ(record.rounds[0].partition, "devel");
    EXPECT_EQ(record.rounds[0].status, RoundStatus::Running);
    EXPECT_EQ(record.revision, 2u);
    EXPECT_EQ(sink.entries.back().action_type, "SUBMITTED");
}

TEST_F(EscalationMachineTests, RecordRound_LevelAboveLadderIsInvalidLevel)
{
    machine.create_chain(test_support::sample_chain("c"));
    try
    {
        machine.record_round("c", {"1"}, "2", "0-39", 3, "64G");
        FAIL() << "expected InvalidLevel";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::InvalidLevel);
    }
    EXPECT_TRUE(machine.load("c").rounds.empty());
}

TEST_F(EscalationMachineTests, RecordRound_MissingChainIsSkipped)
{
    EXPECT_FALSE(machine.record_round("ghost", {"1"}, "2", "0", 0, "1G"));
    EXPECT_EQ(store.save_count(), 0u);
    EXPECT_TRUE(sink.entries.empty());
}

// ============================================================================
// Escalation
// ============================================================================

TEST_F(EscalationMachineTests, Escalate_LeavesExactlyOnePendingRound)
{
    start_chain();
    ASSERT_TRUE(machine.escalate("chain1", oom_request(1, "0-9", 30)));

    ChainRecord record = machine.load("chain1");
    EXPECT_EQ(record.state.status, ChainStatus::Escalating);
    EXPECT_EQ(record.state.current_level, 1u);
    EXPECT_LE(record.state.current_level, record.chain.max_level());
    EXPECT_EQ(record.state.current_memory, "4G");
    EXPECT_EQ(record.state.current_time, "01:00:00");
    EXPECT_EQ(record.state.pending_indices, "0-9");
    EXPECT_EQ(record.state.escalate_count, 10u);
    EXPECT_EQ(record.state.last_escalation_reason, EscalationReason::Oom);

    ASSERT_EQ(record.rounds.size(), 2u);
    EXPECT_EQ(pending_rounds(record), 1u);
    EXPECT_EQ(record.rounds[0].status, RoundStatus::Escalating);
    EXPECT_EQ(record.rounds[0].oom_count, 10u);
    EXPECT_EQ(record.rounds[0].escalate_indices, "0-9");
    EXPECT_EQ(record.rounds[1].status, RoundStatus::Pending);
    EXPECT_EQ(record.rounds[1].array_spec, "0-9");
    EXPECT_EQ(record.rounds[1].partition, "short");
    EXPECT_EQ(sink.entries.back().action_type, "ESCALATED");
}

TEST_F(EscalationMachineTests, Escalate_SecondStepStillHasOnePendingRound)
{
    start_chain();
    ASSERT_TRUE(machine.escalate("chain1", oom_request(1, "0-9", 30)));
    ASSERT_TRUE(machine.escalate("chain1", oom_request(2, "3,7", 8)));

    ChainRecord record = machine.load("chain1");
    EXPECT_EQ(record.state.current_level, 2u);
    EXPECT_EQ(record.state.completed_count, 38u);
    ASSERT_EQ(record.rounds.size(), 3u);
    EXPECT_EQ(pending_rounds(record), 1u);
    EXPECT_EQ(record.rounds[2].ordinal, 3u);
}

TEST_F(EscalationMachineTests, Escalate_MixedReasonWhenBothKindsPresent)
{
    start_chain();
    EscalationRequest request = oom_request(1, "0-9", 30);
    request.oom_count = 6;
    request.timeout_count = 4;
    ASSERT_TRUE(machine.escalate("chain1", request));
    EXPECT_EQ(machine.load("chain1").state.last_escalation_reason, EscalationReason::Mixed);
}

TEST_F(EscalationMachineTests, Escalate_LevelAboveLadderIsInvalidLevel)
{
    start_chain();
    try
    {
        machine.escalate("chain1", oom_request(1, "0-9", 30));
        EscalationRequest request = oom_request(2, "0-9", 0);
        request.next_level = 5;
        machine.escalate("chain1", request);
        FAIL() << "expected InvalidLevel";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::InvalidLevel);
    }
    EXPECT_EQ(machine.load("chain1").state.current_level, 1u);
}

TEST_F(EscalationMachineTests, Escalate_IndexOutsideChainIsRejected)
{
    start_chain();
    EXPECT_THROW(machine.escalate("chain1", oom_request(1, "38-41", 0)), EscalationError);
    EXPECT_EQ(machine.load("chain1").rounds.size(), 1u);
}

// ============================================================================
// Terminal transitions
// ============================================================================

TEST_F(EscalationMachineTests, MarkCompleted_ClearsPending)
{
    start_chain();
    ASSERT_TRUE(machine.mark_completed("chain1", "1001", 40));

    ChainRecord record = machine.load("chain1");
    EXPECT_EQ(record.state.status, ChainStatus::Completed);
    EXPECT_EQ(record.state.pending_indices, "");
    EXPECT_EQ(record.state.completed_count, 40u);
    EXPECT_EQ(record.rounds[0].status, RoundStatus::Completed);
    EXPECT_EQ(record.rounds[0].completed_count, 40u);
}

TEST_F(EscalationMachineTests, MarkCompleted_TwiceIsIdempotent)
{
    start_chain();
    ASSERT_TRUE(machine.mark_completed("chain1", "1001", 40));
    ChainRecord first = machine.load("chain1");
    size_t saves = store.save_count();
    size_t actions = sink.entries.size();

    EXPECT_FALSE(machine.mark_completed("chain1", "1001", 40));
    ChainRecord second = machine.load("chain1");
    EXPECT_EQ(second.state.completed_count, first.state.completed_count);
    EXPECT_EQ(second.revision, first.revision);
    EXPECT_EQ(second.updated, first.updated);
    EXPECT_EQ(store.save_count(), saves);
    EXPECT_EQ(sink.entries.size(), actions);
}

TEST_F(EscalationMachineTests, MarkFailed_PendingIsNeverRetriedIndices)
{
    start_chain();
    ASSERT_TRUE(machine.escalate("chain1", oom_request(1, "0-9", 30)));
    ASSERT_TRUE(machine.escalate("chain1", oom_request(2, "2,5", 8)));
    ASSERT_TRUE(machine.mark_failed("chain1", "5", FailureReason::Memory));

    ChainRecord record = machine.load("chain1");
    EXPECT_EQ(record.state.status, ChainStatus::FailedMaxMemory);
    EXPECT_EQ(record.state.pending_indices, "5");
    EXPECT_EQ(record.state.failed_indices, "5");
    EXPECT_EQ(record.state.failed_count, 1u);
    EXPECT_EQ(sink.entries.back().action_type, "FAILED");
}

TEST_F(EscalationMachineTests, MarkFailed_ReasonSelectsStatus)
{
    start_chain("t");
    ASSERT_TRUE(machine.mark_failed("t", "1,2", FailureReason::Time));
    EXPECT_EQ(machine.load("t").state.status, ChainStatus::FailedMaxTime);

    start_chain("l");
    ASSERT_TRUE(machine.mark_failed("l", "1", FailureReason::Level));
    EXPECT_EQ(machine.load("l").state.status, ChainStatus::FailedMaxLevel);
}

TEST_F(EscalationMachineTests, TerminalChain_IgnoresFurtherTransitions)
{
    start_chain();
    ASSERT_TRUE(machine.mark_failed("chain1", "0-3", FailureReason::Level));
    EXPECT_FALSE(machine.escalate("chain1", oom_request(1, "0-3", 0)));
    EXPECT_FALSE(machine.record_round("chain1", {"9"}, "10", "0-3", 1, "4G"));
    EXPECT_FALSE(machine.mark_completed("chain1", "9", 4));
    EXPECT_EQ(machine.load("chain1").state.status, ChainStatus::FailedMaxLevel);
}

TEST_F(EscalationMachineTests, AuditEntries_CarryMemoryLevelOnly)
{
    start_chain();
    ASSERT_TRUE(machine.escalate("chain1", oom_request(1, "0-9", 30)));

    ASSERT_EQ(sink.entries.size(), 3u);
    EXPECT_EQ(sink.entries[2].action_type, "ESCALATED");
    EXPECT_EQ(sink.entries[2].memory_level, std::optional<size_t>(1));
    for (const auto& entry : sink.entries)
    {
        EXPECT_FALSE(entry.time_level.has_value()) << entry.action_type;
    }
}

TEST_F(EscalationMachineTests, Load_MissingChainIsChainNotFound)
{
    try
    {
        machine.load("ghost");
        FAIL() << "expected ChainNotFound";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::ChainNotFound);
    }
}

// ============================================================================
// End to end
// ============================================================================

TEST_F(EscalationMachineTests, EndToEnd_OomTasksRecoverAtSecondLevel)
{
    machine.create_chain(test_support::sample_chain("e2e", 40));
    ASSERT_TRUE(machine.record_round("e2e", {"5000"}, "5001", "0-39", 0, "1G"));

    // Level 0: tasks 0..9 run out of memory, the rest complete
    EscalationRequest request = oom_request(1, "0-9", 30);
    request.retry_job_ids = {"5002"};
    request.handler_id = "5003";
    ASSERT_TRUE(machine.escalate("e2e", request));

    // Level 1: every retried task completes
    ASSERT_TRUE(machine.mark_completed("e2e", "5002", 10));

    ChainRecord record = machine.load("e2e");
    EXPECT_EQ(record.state.status, ChainStatus::Completed);
    EXPECT_EQ(record.state.pending_indices, "");
    EXPECT_EQ(record.state.completed_count, 40u);
    ASSERT_EQ(record.rounds.size(), 2u);
    EXPECT_EQ(record.rounds[0].status, RoundStatus::Escalating);
    EXPECT_EQ(record.rounds[1].status, RoundStatus::Completed);
    EXPECT_EQ(record.rounds[1].completed_count, 10u);

    std::vector<std::string> actions;
    for (const auto& entry : sink.entries)
    {
        actions.push_back(entry.action_type);
    }
    EXPECT_EQ(actions, (std::vector<std::string>{"CREATED", "SUBMITTED", "ESCALATED", "COMPLETED"}));
    EXPECT_EQ(sink.synced.back().state.status, ChainStatus::Completed);
}
