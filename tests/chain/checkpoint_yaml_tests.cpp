/**
 * @file checkpoint_yaml_tests.cpp
 * Unit tests for memescalate::encode_checkpoint and memescalate::decode_checkpoint
 */
#include <gtest/gtest.h>
#include "memescalate/chain/checkpoint_yaml.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "../support/sample_chain.hpp"

#include <string>

using namespace memescalate;

class CheckpointYamlTests : public ::testing::Test
{
protected:
    ChainRecord escalated_record()
    {
        ChainRecord record = make_initial_record(test_support::sample_chain("chain_a"), "2026-01-05T10:00:00");
        record.updated = "2026-01-05T11:30:00";
        record.revision = 3;

        Round first;
        first.ordinal = 1;
        first.job_ids = {"9001"};
        first.handler_id = "9002";
        first.array_spec = "0-39";
        first.level = 0;
        first.memory = "1G";
        first.time = "00:05:00";
        first.partition = "devel";
        first.status = RoundStatus::Escalating;
        first.completed_count = 30;
        first.oom_count = 10;
        first.escalate_indices = "0-9";
        first.submitted = "2026-01-05T10:00:01";

        Round retry;
        retry.ordinal = 2;
        retry.job_ids = {"9003", "9004"};
        retry.handler_id = "9005";
        retry.array_spec = "0-9";
        retry.level = 1;
        retry.memory = "4G";
        retry.time = "01:00:00";
        retry.partition = "short";
        retry.status = RoundStatus::Pending;
        retry.submitted = "2026-01-05T11:30:00";

        record.rounds = {first, retry};
        record.state.current_level = 1;
        record.state.current_memory = "4G";
        record.state.current_time = "01:00:00";
        record.state.status = ChainStatus::Escalating;
        record.state.pending_indices = "0-9";
        record.state.completed_count = 30;
        record.state.escalate_count = 10;
        record.state.last_escalation_reason = EscalationReason::Oom;
        return record;
    }
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(CheckpointYamlTests, Encode_TopLevelKeysInStableOrder)
{
    std::string text = encode_checkpoint(escalated_record());
    const char* keys[] = {"chain_id:", "mode:", "partition:", "original_script:", "script_args:",
        "original_array_spec:", "total_tasks:", "max_level:", "levels:", "created:", "updated:",
        "revision:", "state:", "rounds:"};

    size_t last = 0;
    for (const char* key : keys)
    {
        size_t pos = text.find(std::string("\n") + key);
        if (std::string(key) == "chain_id:")
        {
            pos = text.find(key);
        }
        ASSERT_NE(pos, std::string::npos) << key;
        EXPECT_GE(pos, last) << key;
        last = pos;
    }
}

TEST_F(CheckpointYamlTests, Encode_IncludesModeAndPrimaryJobId)
{
    std::string text = encode_checkpoint(escalated_record());
    EXPECT_NE(text.find("mode: handler_chain"), std::string::npos);
    EXPECT_NE(text.find("job_id: "), std::string::npos);
    EXPECT_NE(text.find("9003"), std::string::npos);
    EXPECT_NE(text.find("status: ESCALATING"), std::string::npos);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(CheckpointYamlTests, Decode_RestoresEncodedRecord)
{
    ChainRecord original = escalated_record();
    ChainRecord decoded = decode_checkpoint(encode_checkpoint(original));

    EXPECT_EQ(decoded.chain.chain_id, "chain_a");
    EXPECT_EQ(decoded.chain.script, original.chain.script);
    EXPECT_EQ(decoded.chain.script_args, original.chain.script_args);
    EXPECT_EQ(decoded.chain.original_array_spec, "0-39");
    EXPECT_EQ(decoded.chain.total_tasks, 40u);
    EXPECT_EQ(decoded.chain.levels, original.chain.levels);
    EXPECT_EQ(decoded.created, "2026-01-05T10:00:00");
    EXPECT_EQ(decoded.updated, "2026-01-05T11:30:00");
    EXPECT_EQ(decoded.revision, 3u);

    EXPECT_EQ(decoded.state.current_level, 1u);
    EXPECT_EQ(decoded.state.current_time, "01:00:00");
    EXPECT_EQ(decoded.state.status, ChainStatus::Escalating);
    EXPECT_EQ(decoded.state.pending_indices, "0-9");
    EXPECT_EQ(decoded.state.failed_indices, "");
    EXPECT_EQ(decoded.state.completed_count, 30u);
    EXPECT_EQ(decoded.state.last_escalation_reason, EscalationReason::Oom);

    ASSERT_EQ(decoded.rounds.size(), 2u);
    EXPECT_EQ(decoded.rounds[0].oom_count, 10u);
    EXPECT_EQ(decoded.rounds[0].escalate_indices, "0-9");
    EXPECT_EQ(decoded.rounds[1].job_ids, (std::vector<std::string>{"9003", "9004"}));
    EXPECT_EQ(decoded.rounds[1].status, RoundStatus::Pending);
    EXPECT_EQ(decoded.rounds[1].partition, "short");
}

TEST_F(CheckpointYamlTests, Decode_SingleJobIdWithoutList)
{
    const std::string text =
        "chain_id: legacy\n"
        "original_script: run.sh\n"
        "levels:\n"
        "  - {partition: devel, memory: 2G, time: '00:10:00'}\n"
        "state: {current_level: 0, status: RUNNING}\n"
        "rounds:\n"
        "  - {round: 7, job_id: '4242', status: RUNNING}\n";

    ChainRecord decoded = decode_checkpoint(text);
    EXPECT_EQ(decoded.chain.levels[0].memory, "2G");
    EXPECT_EQ(decoded.chain.mode(), "single");
    ASSERT_EQ(decoded.rounds.size(), 1u);
    EXPECT_EQ(decoded.rounds[0].ordinal, 1u);
    EXPECT_EQ(decoded.rounds[0].job_ids, (std::vector<std::string>{"4242"}));
    EXPECT_EQ(decoded.state.status, ChainStatus::Running);
}

TEST_F(CheckpointYamlTests, Decode_MissingChainIdIsCheckpointIO)
{
    try
    {
        decode_checkpoint("levels:\n  - {mem: 1G, time: '1'}\n");
        FAIL() << "expected CheckpointIO";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::CheckpointIO);
    }
}

TEST_F(CheckpointYamlTests, Decode_MissingLevelsIsCheckpointIO)
{
    try
    {
        decode_checkpoint("chain_id: x\n");
        FAIL() << "expected CheckpointIO";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::CheckpointIO);
    }
}

TEST_F(CheckpointYamlTests, Decode_MalformedYamlIsCheckpointIO)
{
    try
    {
        decode_checkpoint("chain_id: [broken\n");
        FAIL() << "expected CheckpointIO";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::CheckpointIO);
    }
}

TEST_F(CheckpointYamlTests, Decode_LevelAboveLadderIsCheckpointIO)
{
    ChainRecord record = escalated_record();
    record.state.current_level = record.chain.max_level() + 1;
    const std::string text = encode_checkpoint(record);
    try
    {
        decode_checkpoint(text);
        FAIL() << "expected CheckpointIO";
    }
    catch (const EscalationError& e)
    {
        EXPECT_EQ(e.code(), EscalationErrorCode::CheckpointIO);
    }

    record.state.current_level = record.chain.max_level();
    EXPECT_EQ(decode_checkpoint(encode_checkpoint(record)).state.current_level, record.chain.max_level());
}
