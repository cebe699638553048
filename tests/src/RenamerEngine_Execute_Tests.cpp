#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/RenamerEngine.h"
#include "../../src/Logic/AuditLog.h"
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class RenamerEngineExecuteTest : public RenamerEngineFilesystemTest
{
protected:
    FakeLabelExtractor extractor;

    RenamePlan PlanIntroPair()
    {
        CreateDummyFile(tempTestDir / "a.pdf", "content A");
        CreateDummyFile(tempTestDir / "b.pdf", "content B");
        extractor.SetLabel("a.pdf", "Intro");
        extractor.SetLabel("b.pdf", "Intro");

        RenamerConfig config;
        config.root = tempTestDir;
        return RenamerEngine::BuildPlan(config, extractor);
    }

    std::set<std::string> ListNames()
    {
        std::set<std::string> names;
        for (const auto &entry : fs::recursive_directory_iterator(tempTestDir))
        {
            names.insert(fs::relative(entry.path(), tempTestDir).string());
        }
        return names;
    }
};

TEST_F(RenamerEngineExecuteTest, Commit_RenamesInPlanOrder)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit);

    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Applied);
    EXPECT_FALSE(report.outcomes[0].Simulated);
    EXPECT_EQ(report.outcomes[1].Status, OutcomeStatus::Applied);
    EXPECT_TRUE(report.overallSuccess);
    EXPECT_EQ(report.summary.renamed, 2u);

    EXPECT_FALSE(fs::exists(tempTestDir / "a.pdf"));
    EXPECT_FALSE(fs::exists(tempTestDir / "b.pdf"));
    EXPECT_EQ(ReadFile(tempTestDir / "Intro.pdf"), "content A");
    EXPECT_EQ(ReadFile(tempTestDir / "Intro (1).pdf"), "content B");
}

TEST_F(RenamerEngineExecuteTest, DryRun_LeavesTreeUntouched)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);
    const std::set<std::string> before = ListNames();

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::DryRun);

    EXPECT_EQ(ListNames(), before);
    ASSERT_EQ(report.outcomes.size(), 2u);
    for (const auto &outcome : report.outcomes)
    {
        EXPECT_EQ(outcome.Status, OutcomeStatus::Applied);
        EXPECT_TRUE(outcome.Simulated);
    }
    EXPECT_EQ(report.summary.renamed, 2u);
}

TEST_F(RenamerEngineExecuteTest, DryRunThenCommit_SameTargets)
{
    RenamePlan dryPlan = PlanIntroPair();
    ExecutionReport dry = RenamerEngine::ExecutePlan(dryPlan, ExecutionMode::DryRun);

    RenamerConfig config;
    config.root = tempTestDir;
    RenamePlan commitPlan = RenamerEngine::BuildPlan(config, extractor);
    ExecutionReport commit = RenamerEngine::ExecutePlan(commitPlan, ExecutionMode::Commit);

    ASSERT_EQ(dry.outcomes.size(), commit.outcomes.size());
    for (std::size_t i = 0; i < dry.outcomes.size(); ++i)
    {
        EXPECT_EQ(dry.outcomes[i].Operation.From, commit.outcomes[i].Operation.From);
        EXPECT_EQ(dry.outcomes[i].Operation.To, commit.outcomes[i].Operation.To);
        EXPECT_TRUE(fs::exists(commit.outcomes[i].Operation.To));
    }
}

TEST_F(RenamerEngineExecuteTest, Commit_TargetCreatedAfterPlanningIsNotOverwritten)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);
    CreateDummyFile(tempTestDir / "Intro.pdf", "external");

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit);

    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Failed);
    EXPECT_EQ(report.outcomes[0].Cause, FailureCause::TargetNowExists);
    EXPECT_EQ(ReadFile(tempTestDir / "Intro.pdf"), "external");
    EXPECT_EQ(ReadFile(tempTestDir / "a.pdf"), "content A");

    // One failure does not stop the rest of the plan
    EXPECT_EQ(report.outcomes[1].Status, OutcomeStatus::Applied);
    EXPECT_EQ(ReadFile(tempTestDir / "Intro (1).pdf"), "content B");

    EXPECT_EQ(report.summary.errors, 1u);
    EXPECT_FALSE(report.overallSuccess);
}

TEST_F(RenamerEngineExecuteTest, Commit_VanishedSourceFails)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);
    fs::remove(tempTestDir / "a.pdf");

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit);

    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Failed);
    EXPECT_EQ(report.outcomes[0].Cause, FailureCause::SourceVanished);
    EXPECT_FALSE(fs::exists(tempTestDir / "Intro.pdf"));
    EXPECT_EQ(report.outcomes[1].Status, OutcomeStatus::Applied);
}

TEST_F(RenamerEngineExecuteTest, Commit_SourceReplacedBySymlinkFails)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);
    fs::remove(tempTestDir / "a.pdf");
    std::error_code ec;
    fs::create_symlink(tempTestDir / "b.pdf", tempTestDir / "a.pdf", ec);
    ASSERT_FALSE(ec) << ec.message();

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit);

    EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Failed);
    EXPECT_EQ(report.outcomes[0].Cause, FailureCause::SourceVanished);
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(tempTestDir / "a.pdf")));
}

TEST_F(RenamerEngineExecuteTest, ExtractionErrorsBecomeFailures)
{
    CreateDummyFile(tempTestDir / "bad.pdf");
    extractor.SetFailure("bad.pdf", "Not a PDF file (missing %PDF- header)");
    RenamerConfig config;
    config.root = tempTestDir;
    RenamePlan plan = RenamerEngine::BuildPlan(config, extractor);

    for (ExecutionMode mode : {ExecutionMode::DryRun, ExecutionMode::Commit})
    {
        ExecutionReport report = RenamerEngine::ExecutePlan(plan, mode);
        ASSERT_EQ(report.outcomes.size(), 1u);
        EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Failed);
        EXPECT_EQ(report.outcomes[0].Cause, FailureCause::ExtractionFailed);
        EXPECT_EQ(report.outcomes[0].Detail, "Not a PDF file (missing %PDF- header)");
        EXPECT_EQ(report.summary.errors, 1u);
    }
    EXPECT_TRUE(fs::exists(tempTestDir / "bad.pdf"));
}

TEST_F(RenamerEngineExecuteTest, SkipsPassThroughWithReason)
{
    CreateDummyFile(tempTestDir / "c.pdf");
    RenamerConfig config;
    config.root = tempTestDir;
    RenamePlan plan = RenamerEngine::BuildPlan(config, extractor);

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].Status, OutcomeStatus::Skipped);
    EXPECT_EQ(report.outcomes[0].Detail, "No title in metadata");
    EXPECT_TRUE(report.overallSuccess);
}

TEST_F(RenamerEngineExecuteTest, Cancellation_StopsBetweenItems)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);

    int checks = 0;
    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit, nullptr,
                                                        [&checks]()
                                                        { return ++checks > 1; });

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.overallSuccess);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.summary.discovered, 2u);
    EXPECT_EQ(report.summary.renamed, 1u);

    // Completed renames stay, the rest is untouched
    EXPECT_TRUE(fs::exists(tempTestDir / "Intro.pdf"));
    EXPECT_TRUE(fs::exists(tempTestDir / "b.pdf"));
    EXPECT_FALSE(fs::exists(tempTestDir / "Intro (1).pdf"));
}

TEST_F(RenamerEngineExecuteTest, Commit_WritesAuditTrail)
{
    RenamePlan plan = PlanIntroPair();
    CreateDummyFile(tempTestDir / "c.pdf");
    RenamerConfig config;
    config.root = tempTestDir;
    plan = RenamerEngine::BuildPlan(config, extractor);
    ASSERT_EQ(plan.Operations.size(), 3u);

    const fs::path logDir = tempTestDir / "logs";
    fs::create_directories(logDir);
    AuditLog audit;
    ASSERT_TRUE(audit.Open(logDir, plan.Root, ExecutionMode::Commit, plan.Policy)) << audit.GetLastError();

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::Commit, &audit);
    EXPECT_FALSE(audit.IsOpen());

    const std::string log = ReadFile(audit.GetPath());
    EXPECT_NE(log.find("\tRENAMED\t" + (tempTestDir / "a.pdf").string() + "\t" + (tempTestDir / "Intro.pdf").string() + "\ttitle: Intro"),
              std::string::npos);
    EXPECT_NE(log.find("\tSKIPPED\t" + (tempTestDir / "c.pdf").string() + "\t" + AuditLog::NotApplicable + "\tNo title in metadata"),
              std::string::npos);
    EXPECT_NE(log.find("renamed 2, skipped 1, errors 0"), std::string::npos);
    EXPECT_EQ(report.summary.renamed, 2u);
}

TEST_F(RenamerEngineExecuteTest, DryRun_WritesAuditTrail)
{
    RenamePlan plan = PlanIntroPair();
    ASSERT_TRUE(plan.success);

    const fs::path logDir = tempTestDir / "logs";
    fs::create_directories(logDir);
    AuditLog audit;
    ASSERT_TRUE(audit.Open(logDir, plan.Root, ExecutionMode::DryRun, plan.Policy)) << audit.GetLastError();

    ExecutionReport report = RenamerEngine::ExecutePlan(plan, ExecutionMode::DryRun, &audit);
    EXPECT_FALSE(audit.IsOpen());

    const std::string log = ReadFile(audit.GetPath());
    EXPECT_NE(log.find("# Mode: dry-run"), std::string::npos);
    EXPECT_NE(log.find("\tWOULD_RENAME\t" + (tempTestDir / "a.pdf").string() + "\t" + (tempTestDir / "Intro.pdf").string()),
              std::string::npos);
    EXPECT_NE(log.find("\tWOULD_RENAME\t" + (tempTestDir / "b.pdf").string() + "\t" + (tempTestDir / "Intro (1).pdf").string()),
              std::string::npos);
    EXPECT_EQ(log.find("\tRENAMED\t"), std::string::npos);
    EXPECT_EQ(report.summary.renamed, 2u);

    // Only the log was added
    EXPECT_TRUE(fs::exists(tempTestDir / "a.pdf"));
    EXPECT_TRUE(fs::exists(tempTestDir / "b.pdf"));
    EXPECT_FALSE(fs::exists(tempTestDir / "Intro.pdf"));
}

TEST(RenamerEngineExecute, DescribeSkip_Messages)
{
    PlannedOperation op;
    op.Kind = OperationKind::SkipLabelTooLong;
    op.LabelLength = 1200;
    EXPECT_EQ(RenamerEngine::DescribeSkip(op), "Title too long (1200 characters, limit 1000), possible metadata corruption");

    op.Kind = OperationKind::SkipTargetExists;
    op.Cause = "Intro.pdf";
    EXPECT_EQ(RenamerEngine::DescribeSkip(op), "File already exists with name 'Intro.pdf'");

    op.Kind = OperationKind::SkipAlreadyNamed;
    EXPECT_EQ(RenamerEngine::DescribeSkip(op), "Already named correctly");

    op.Kind = OperationKind::SkipSymlink;
    EXPECT_EQ(RenamerEngine::DescribeSkip(op), "Symbolic link");
}
