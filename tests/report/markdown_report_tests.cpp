/**
 * @file markdown_report_tests.cpp
 * Unit tests for memescalate::write_markdown_report
 */
#include <gtest/gtest.h>
#include "memescalate/report/markdown_report.hpp"
#include "memescalate/chain/escalation_machine.hpp"
#include "../support/sample_chain.hpp"
#include "../support/scratch_dir.hpp"

#include <sstream>
#include <string>

using namespace memescalate;

class MarkdownReportTests : public ::testing::Test
{
protected:
    InMemoryCheckpointStore store;
    EscalationMachine machine{store};
    ReportOptions options{false, "2026-05-01T12:00:00"};

    void run_escalated_chain(const std::string& chain_id)
    {
        machine.create_chain(test_support::sample_chain(chain_id));
        ASSERT_TRUE(machine.record_round(chain_id, {"900"}, "901", "0-39", 0, "1G"));
        EscalationRequest request;
        request.next_level = 1;
        request.next_memory = "4G";
        request.escalate_spec = "0-9";
        request.retry_job_ids = {"902"};
        request.handler_id = "903";
        request.completed_count = 28;
        request.escalate_count = 10;
        request.oom_count = 10;
        request.failed_count = 2;
        ASSERT_TRUE(machine.escalate(chain_id, request));
    }

    std::string render(const std::vector<std::string>& ids, AuditStore* audit = nullptr)
    {
        std::ostringstream out;
        write_markdown_report(out, store, ids, audit, options);
        return out.str();
    }
};

TEST_F(MarkdownReportTests, Header_HasTitleAndTimestamp)
{
    std::string text = render({});
    EXPECT_EQ(text.rfind("# Escalation Report\n", 0), 0u);
    EXPECT_NE(text.find("Generated: 2026-05-01T12:00:00"), std::string::npos);
}

TEST_F(MarkdownReportTests, Chain_ConfigurationAndRoundsTables)
{
    run_escalated_chain("rep1");
    std::string text = render({"rep1"});

    EXPECT_NE(text.find("## Chain: rep1"), std::string::npos);
    EXPECT_NE(text.find("| Script | `/home/user/jobs/process.sh` |"), std::string::npos);
    EXPECT_NE(text.find("| Array | `0-39` (40 tasks) |"), std::string::npos);
    EXPECT_NE(text.find("| Status | **ESCALATING** |"), std::string::npos);
    EXPECT_NE(text.find("### Escalation Rounds"), std::string::npos);
    EXPECT_NE(text.find("| 1 | 900 | 901 | 1G | 40 | 28 | 10 | 0 | 2 | ESCALATING |"),
        std::string::npos);
    EXPECT_NE(text.find("| 2 | 902 | 903 | 4G | 10 | 0 | 0 | 0 | 0 | PENDING |"),
        std::string::npos);
    EXPECT_NE(text.find("Chain status: ESCALATING"), std::string::npos);
    EXPECT_NE(text.find("---"), std::string::npos);
}

TEST_F(MarkdownReportTests, Chain_FailedTasksSection)
{
    run_escalated_chain("rep2");
    ASSERT_TRUE(machine.mark_failed("rep2", "4,7", FailureReason::Level));
    std::string text = render({"rep2"});

    EXPECT_NE(text.find("### Failed Tasks (Not Retried)"), std::string::npos);
    EXPECT_NE(text.find("Failed task indices: `4,7`"), std::string::npos);
    EXPECT_NE(text.find("Chain FAILED_MAX_LEVEL with 4 unrecoverable tasks."), std::string::npos);
}

TEST_F(MarkdownReportTests, Chain_CompletedSummary)
{
    machine.create_chain(test_support::sample_chain("rep3"));
    ASSERT_TRUE(machine.record_round("rep3", {"50"}, "51", "0-39", 0, "1G"));
    ASSERT_TRUE(machine.mark_completed("rep3", "50", 40));
    std::string text = render({"rep3"});

    EXPECT_NE(text.find("All **40** tasks completed successfully."), std::string::npos);
    EXPECT_EQ(text.find("### Failed Tasks"), std::string::npos);
}

TEST_F(MarkdownReportTests, Chain_WithoutRounds)
{
    machine.create_chain(test_support::sample_chain("rep4"));
    std::string text = render({"rep4"});
    EXPECT_NE(text.find("*No rounds recorded yet.*"), std::string::npos);
}

TEST_F(MarkdownReportTests, Chain_MissingCheckpointGetsErrorSection)
{
    std::string text = render({"ghost"});
    EXPECT_NE(text.find("## Error reading ghost"), std::string::npos);
}

TEST_F(MarkdownReportTests, Audit_SummaryAndDetailedSections)
{
    test_support::ScratchDir scratch;
    AuditStore audit(scratch.path("report.db"));
    run_escalated_chain("rep5");

    TaskAccounting ok;
    ok.task_id = 12;
    ok.state = "COMPLETED";
    ok.node = "node07";
    ok.elapsed = "00:02:00";
    TaskAccounting failed = ok;
    failed.task_id = 4;
    failed.state = "FAILED";
    failed.return_code = 1;
    audit.save_tasks("rep5", 1, "900", {ok, failed});

    std::string summary = render({"rep5"}, &audit);
    EXPECT_NE(summary.find("### Database Task Summary"), std::string::npos);
    EXPECT_NE(summary.find("Total task records: 2"), std::string::npos);
    EXPECT_NE(summary.find("| 4 | FAILED | 1 | node07 | 00:02:00 |"), std::string::npos);

    options.detailed = true;
    std::string detailed = render({"rep5"}, &audit);
    EXPECT_NE(detailed.find("#### Round 1: 1G"), std::string::npos);
    EXPECT_NE(detailed.find("| node07 | 2 |"), std::string::npos);
    EXPECT_NE(detailed.find("**Runtime:** min=00:02:00, max=00:02:00"), std::string::npos);
    EXPECT_EQ(detailed.find("### Database Task Summary"), std::string::npos);
}
