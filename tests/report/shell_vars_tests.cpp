/**
 * @file shell_vars_tests.cpp
 * Unit tests for the shell assignment writers
 */
#include <gtest/gtest.h>
#include "memescalate/report/shell_vars.hpp"
#include "memescalate/common/text_utils.hpp"
#include "../support/sample_chain.hpp"

#include <sstream>
#include <string>

using namespace memescalate;

namespace
{

bool has_line(const std::string& text, const std::string& line)
{
    return ("\n" + text).find("\n" + line + "\n") != std::string::npos;
}

} // namespace

// ============================================================================
// Quoting
// ============================================================================

TEST(ShellVarsTests, ShellQuote_SafeWordsStayBare)
{
    EXPECT_EQ(shell_quote("node01"), "node01");
    EXPECT_EQ(shell_quote("/data/tracker/x.db"), "/data/tracker/x.db");
    EXPECT_EQ(shell_quote("0-9:2,11"), "0-9:2,11");
}

TEST(ShellVarsTests, ShellQuote_UnsafeTextIsSingleQuoted)
{
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("data set.csv"), "'data set.csv'");
    EXPECT_EQ(shell_quote("node[01-10]"), "'node[01-10]'");
    EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
}

TEST(ShellVarsTests, WriteShellVar_OneAssignmentPerLine)
{
    std::ostringstream out;
    write_shell_var(out, "NAME", "a b");
    EXPECT_EQ(out.str(), "NAME='a b'\n");
}

// ============================================================================
// Config
// ============================================================================

TEST(ShellVarsTests, ConfigVars_ListEveryLevel)
{
    EscalationConfig config = parse_config(
        "levels:\n"
        "  - {partition: devel, mem: 1G, time: '00:05:00'}\n"
        "  - {partition: long, mem: 8G, time: '02:00:00'}\n"
        "cluster: {name: hpc1, nodes: 'node[01-10]'}\n");
    std::ostringstream out;
    write_config_vars(out, config);
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "PARTITION=devel"));
    EXPECT_TRUE(has_line(text, "MAX_LEVEL=1"));
    EXPECT_TRUE(has_line(text, "LEVELS_CONFIG=true"));
    EXPECT_TRUE(has_line(text, "LEVEL_0_MEM=1G"));
    EXPECT_TRUE(has_line(text, "LEVEL_1_PARTITION=long"));
    EXPECT_TRUE(has_line(text, "LEVEL_1_TIME=02:00:00"));
    EXPECT_TRUE(has_line(text, "SACCT_DELAY=2"));
    EXPECT_TRUE(has_line(text, "CHECKPOINT_DIR=/data/tracker/checkpoints"));
    EXPECT_TRUE(has_line(text, "LOGGING_ENABLED=true"));
    EXPECT_TRUE(has_line(text, "BATCH_SIZE=500"));
    EXPECT_TRUE(has_line(text, "HISTORY_LOG=''"));
    EXPECT_TRUE(has_line(text, "CLUSTER_NAME=hpc1"));
    EXPECT_TRUE(has_line(text, "CLUSTER_NODES='node[01-10]'"));
}

// ============================================================================
// Resume
// ============================================================================

TEST(ShellVarsTests, ResumeVars_DescribeChainState)
{
    ChainRecord record = make_initial_record(test_support::sample_chain("resume_me"), "t");
    Round round;
    round.job_ids = {"10", "11"};
    record.rounds.push_back(round);
    round.job_ids = {"12"};
    record.rounds.push_back(round);

    std::ostringstream out;
    write_resume_vars(out, record, "/ck/resume_me.checkpoint");
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "CHECKPOINT_FILE=/ck/resume_me.checkpoint"));
    EXPECT_TRUE(has_line(text, "CHAIN_ID=resume_me"));
    EXPECT_TRUE(has_line(text, "SCRIPT_ARGS=(--input 'data set.csv')"));
    EXPECT_TRUE(has_line(text, "ARRAY_SPEC=0-39"));
    EXPECT_TRUE(has_line(text, "TOTAL_TASKS=40"));
    EXPECT_TRUE(has_line(text, "RESUME_LEVEL=0"));
    EXPECT_TRUE(has_line(text, "RESUME_MEMORY=1G"));
    EXPECT_TRUE(has_line(text, "RESUME_STATUS=STARTING"));
    EXPECT_TRUE(has_line(text, "RESUME_PENDING=0-39"));
    EXPECT_TRUE(has_line(text, "MAX_LEVEL=2"));
    EXPECT_TRUE(has_line(text, "RESUME_CHAIN=10,11,12"));
}

// ============================================================================
// Analysis and decisions
// ============================================================================

TEST(ShellVarsTests, AnalysisVars_CountsAndPlainIndexLists)
{
    auto result = classify_outcomes({{0, "COMPLETED", "0:0"}, {3, "OUT_OF_MEMORY", "0:125"},
                                        {4, "OUT_OF_MEMORY", "0:125"}, {7, "FAILED", "1:0"}},
        ClassificationRules::defaults());
    std::ostringstream out;
    write_analysis_vars(out, result);
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "TOTAL_COUNT=4"));
    EXPECT_TRUE(has_line(text, "COMPLETED_COUNT=1"));
    EXPECT_TRUE(has_line(text, "OOM_COUNT=2"));
    EXPECT_TRUE(has_line(text, "ESCALATE_COUNT=2"));
    EXPECT_TRUE(has_line(text, "NO_RETRY_COUNT=1"));
    EXPECT_TRUE(has_line(text, "OOM_INDICES=3,4"));
    EXPECT_TRUE(has_line(text, "ESCALATE_INDICES=3,4"));
    EXPECT_TRUE(has_line(text, "NO_RETRY_INDICES=7"));
    EXPECT_TRUE(has_line(text, "TIMEOUT_INDICES="));
}

TEST(ShellVarsTests, DecisionVars_Escalate)
{
    EscalationDecision decision;
    decision.kind = DecisionKind::Escalate;
    decision.next_level = 1;
    decision.next_tier = ResourceLevel{"short", "4G", "01:00:00"};
    decision.escalate_spec = "3-4";
    decision.batch_specs = {"3-4"};

    std::ostringstream out;
    write_decision_vars(out, decision);
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "DECISION=ESCALATE"));
    EXPECT_TRUE(has_line(text, "NEXT_LEVEL=1"));
    EXPECT_TRUE(has_line(text, "NEXT_MEMORY=4G"));
    EXPECT_TRUE(has_line(text, "ESCALATE_SPEC=3-4"));
    EXPECT_TRUE(has_line(text, "FAIL_REASON=''"));
    EXPECT_TRUE(has_line(text, "BATCH_COUNT=1"));
    EXPECT_TRUE(has_line(text, "BATCH_0=3-4"));
}

TEST(ShellVarsTests, DecisionVars_FailHasNoNextTier)
{
    EscalationDecision decision;
    decision.kind = DecisionKind::Fail;
    decision.escalate_spec = "5";
    decision.fail_reason = FailureReason::Memory;

    std::ostringstream out;
    write_decision_vars(out, decision);
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "DECISION=FAIL"));
    EXPECT_EQ(text.find("NEXT_LEVEL="), std::string::npos);
    EXPECT_TRUE(has_line(text, "ESCALATE_SPEC=''"));
    EXPECT_TRUE(has_line(text, "FAILED_SPEC=5"));
    EXPECT_TRUE(has_line(text, "FAIL_REASON=MEMORY"));
    EXPECT_TRUE(has_line(text, "BATCH_COUNT=0"));
}

TEST(ShellVarsTests, DecisionVars_UnknownListsMissingTasks)
{
    EscalationDecision decision;
    decision.kind = DecisionKind::Unknown;
    decision.missing_count = 3;
    decision.missing_spec = "7-9";

    std::ostringstream out;
    write_decision_vars(out, decision);
    const std::string text = out.str();

    EXPECT_TRUE(has_line(text, "DECISION=UNKNOWN"));
    EXPECT_TRUE(has_line(text, "MISSING_COUNT=3"));
    EXPECT_TRUE(has_line(text, "MISSING_SPEC=7-9"));
    EXPECT_TRUE(has_line(text, "ESCALATE_SPEC=''"));
    EXPECT_TRUE(has_line(text, "BATCH_COUNT=0"));
}
