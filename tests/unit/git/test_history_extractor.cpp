#include "rha/git/history_extractor.hpp"
#include "support/fake_command_runner.hpp"

#include <gtest/gtest.h>

namespace rha::git
{
    using rha::test::FakeCommandRunner;
    using namespace std::string_literals;

    class HistoryExtractorTest : public ::testing::Test {
    protected:
        FakeCommandRunner runner;
        HistoryExtractor extractor{runner, std::chrono::seconds(30)};
    };

    TEST_F(HistoryExtractorTest, ValidateAcceptsWorkTree) {
        runner.respond({"rev-parse", "--is-inside-work-tree"}, "true\n");

        EXPECT_TRUE(extractor.validate_repository(std::chrono::seconds(5)).is_ok());
    }

    TEST_F(HistoryExtractorTest, ValidateRejectsNonRepository) {
        runner.respond({"rev-parse", "--is-inside-work-tree"},
                       "fatal: not a git repository (or any of the parent directories): .git\n", 128);

        const auto result = extractor.validate_repository(std::chrono::seconds(5));
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ValidationError);
    }

    TEST_F(HistoryExtractorTest, ValidateReportsRunnerFailureAsValidationError) {
        runner.fail({"rev-parse", "--is-inside-work-tree"}, Error::extraction_error("timed out"));

        const auto result = extractor.validate_repository(std::chrono::seconds(5));
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ValidationError);
    }

    TEST_F(HistoryExtractorTest, DefaultBranchFromRemoteHead) {
        runner.respond({"symbolic-ref", "refs/remotes/origin/HEAD"}, "refs/remotes/origin/trunk\n");

        const auto branch = extractor.resolve_default_branch();
        ASSERT_TRUE(branch.is_ok());
        EXPECT_EQ(branch.value(), "trunk");
    }

    TEST_F(HistoryExtractorTest, DefaultBranchFromCheckedOutHead) {
        runner.respond({"rev-parse", "--abbrev-ref", "HEAD"}, "feature/x\n");

        const auto branch = extractor.resolve_default_branch();
        ASSERT_TRUE(branch.is_ok());
        EXPECT_EQ(branch.value(), "feature/x");
    }

    TEST_F(HistoryExtractorTest, DefaultBranchFromCandidates) {
        runner.respond({"rev-parse", "--abbrev-ref", "HEAD"}, "HEAD\n");
        runner.respond({"branch", "--format=%(refname:short)"}, "develop\nmaster\ntopic\n");

        const auto branch = extractor.resolve_default_branch();
        ASSERT_TRUE(branch.is_ok());
        EXPECT_EQ(branch.value(), "master");
    }

    TEST_F(HistoryExtractorTest, DefaultBranchFallsBackToMaster) {
        const auto branch = extractor.resolve_default_branch();
        ASSERT_TRUE(branch.is_ok());
        EXPECT_EQ(branch.value(), "master");
    }

    TEST_F(HistoryExtractorTest, CountRevisionsUsesFirstParentScope) {
        runner.respond({"rev-list", "--count", "--first-parent", "main", "--"}, "42\n");

        HistoryQuery query;
        query.branch = "main";
        const auto count = extractor.count_revisions(query);
        ASSERT_TRUE(count.is_ok());
        EXPECT_EQ(count.value(), 42u);
    }

    TEST_F(HistoryExtractorTest, CountRevisionsAllBranchesWithSince) {
        runner.respond({"rev-list", "--count", "--since=2024-01-01", "--all", "--"}, "7\n");

        HistoryQuery query;
        query.scope = BranchScope::AllBranches;
        query.since = "2024-01-01";
        const auto count = extractor.count_revisions(query);
        ASSERT_TRUE(count.is_ok());
        EXPECT_EQ(count.value(), 7u);
    }

    TEST_F(HistoryExtractorTest, NonZeroExitIsExtractionError) {
        HistoryQuery query;
        query.branch = "missing";

        const auto count = extractor.count_revisions(query);
        ASSERT_TRUE(count.is_err());
        EXPECT_EQ(count.error().code(), ErrorCode::ExtractionError);
    }

    TEST_F(HistoryExtractorTest, ExtractCommitsStreamsLog) {
        const std::string log =
            std::string(1, record_separator) +
            "aaaaaaa1\tAlice\talice@example.com\t1700000000\t2023-11-14 22:13:20 +0000\tFirst\n\n5\t0\ta.cpp\n" +
            std::string(1, record_separator) +
            "bbbbbbb2\tBob\tbob@example.com\t1700003600\t2023-11-14 23:13:20 +0000\tSecond\n\n1\t1\ta.cpp\n";
        runner.respond({"-c", "core.quotePath=false", "log", "--numstat", "--no-renames", "--no-color",
                        std::string(log_format), "--first-parent", "main", "--"}, log);

        HistoryQuery query;
        query.branch = "main";
        auto stream = extractor.extract_commits(query);
        ASSERT_TRUE(stream.is_ok()) << stream.error().to_string();

        std::vector<std::string> authors;
        while (auto next = stream.value().next()) {
            ASSERT_TRUE(next->is_ok());
            authors.push_back(next->value().author);
        }
        EXPECT_EQ(authors, (std::vector<std::string>{"Alice", "Bob"}));
    }

    TEST_F(HistoryExtractorTest, ListTrackedFilesSplitsOnNul) {
        runner.respond({"ls-files", "-z"}, "src/a.cpp\0docs/read me.md\0"s);

        const auto files = extractor.list_tracked_files();
        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value(), (std::vector<std::string>{"src/a.cpp", "docs/read me.md"}));
    }

    TEST_F(HistoryExtractorTest, ListBranchesWithMergeStatus) {
        runner.respond({"for-each-ref", "--format=%(refname:short)%09%(committerdate:unix)%09%(authorname)",
                        "refs/heads"},
                       "main\t1700000000\tAlice\nfeature\t1700003600\tBob\nold\t1600000000\tCarol\n");
        runner.respond({"branch", "--merged", "main", "--format=%(refname:short)"}, "main\nold\n");
        runner.respond({"rev-list", "--count", "main", "--"}, "10\n");
        runner.respond({"rev-list", "--count", "feature", "--"}, "12\n");
        runner.respond({"rev-list", "--count", "old", "--"}, "4\n");

        const auto branches = extractor.list_branches("main");
        ASSERT_TRUE(branches.is_ok()) << branches.error().to_string();
        ASSERT_EQ(branches.value().size(), 3u);

        const auto& main = branches.value()[0];
        EXPECT_EQ(main.name, "main");
        EXPECT_FALSE(main.is_merged);
        EXPECT_EQ(main.commit_count, 10u);

        const auto& feature = branches.value()[1];
        EXPECT_FALSE(feature.is_merged);
        EXPECT_EQ(feature.last_commit_author, "Bob");
        EXPECT_EQ(feature.last_commit_date, Timestamp(std::chrono::seconds(1700003600)));

        EXPECT_TRUE(branches.value()[2].is_merged);
    }

    TEST_F(HistoryExtractorTest, CancelledTokenStopsQueries) {
        CancellationToken cancel;
        cancel.request();
        HistoryExtractor cancelled(runner, std::chrono::seconds(30), &cancel);
        runner.respond({"ls-files", "-z"}, "a.cpp");

        const auto files = cancelled.list_tracked_files();
        ASSERT_TRUE(files.is_err());
        EXPECT_EQ(files.error().code(), ErrorCode::Cancelled);
    }
}
