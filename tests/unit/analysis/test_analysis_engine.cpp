#include "rha/analysis/analysis_engine.hpp"
#include "rha/git/history_extractor.hpp"
#include "support/fake_command_runner.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <random>

namespace rha::analysis
{
    using rha::test::FakeCommandRunner;
    using namespace std::string_literals;

    namespace {
        const std::string kAliceHeader =
            "1111111111111111111111111111111111111111\tAlice\talice@example.com\t"
            "1700000000\t2023-11-14 22:13:20 +0000\tAdd shape";
        const std::string kBobHeader =
            "2222222222222222222222222222222222222222\tBob\tbob@example.org\t"
            "1700086400\t2023-11-15 23:13:20 +0100\tAdd main";

        std::string record(const std::string& header, const std::string& numstat) {
            return std::string(1, git::record_separator) + header + "\n\n" + numstat;
        }

        class RecordingObserver : public IProgressObserver {
        public:
            void on_progress(const double fraction, const std::string&) override {
                fractions.push_back(fraction);
            }

            [[nodiscard]] bool cancel_requested() const override {
                return cancel.load();
            }

            std::vector<double> fractions;
            std::atomic<bool> cancel{false};
        };

        fs::path make_temp_directory() {
            std::random_device rd;
            const auto dir = fs::temp_directory_path() / ("rha_engine_" + std::to_string(rd()));
            fs::create_directories(dir);
            return dir;
        }

        void write_file(const fs::path& path, const std::string& content) {
            fs::create_directories(path.parent_path());
            std::ofstream out(path, std::ios::binary);
            out << content;
        }
    }

    class AnalysisEngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = make_temp_directory();
            write_file(root_ / "src/shape.hpp",
                       "#pragma once\n"
                       "class Shape {\n"
                       "public:\n"
                       "    virtual ~Shape() = default;\n"
                       "    virtual double area() const = 0;\n"
                       "};\n");
            write_file(root_ / "src/main.cpp",
                       "#include \"shape.hpp\"\n"
                       "\n"
                       "int main(int argc, char** argv) {\n"
                       "    if (argc > 1 && argv[1]) {\n"
                       "        return 1;\n"
                       "    }\n"
                       "    return 0;\n"
                       "}\n");
            write_file(root_ / "README.md", "# demo\n");

            runner_ = std::make_unique<FakeCommandRunner>(root_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        void respond_repository(const std::string& log) {
            runner_->respond({"rev-parse", "--is-inside-work-tree"}, "true\n");
            runner_->respond({"symbolic-ref", "refs/remotes/origin/HEAD"}, "refs/remotes/origin/main\n");
            runner_->respond({"rev-list", "--count", "--first-parent", "main", "--"}, "2\n");
            runner_->respond({"-c", "core.quotePath=false", "log", "--numstat", "--no-renames", "--no-color",
                              std::string(git::log_format), "--first-parent", "main", "--"}, log);
            runner_->respond({"ls-files", "-z"}, "README.md\0src/main.cpp\0src/shape.hpp\0"s);
            runner_->respond({"for-each-ref", "--format=%(refname:short)%09%(committerdate:unix)%09%(authorname)",
                              "refs/heads"}, "main\t1700086400\tBob\n");
            runner_->respond({"branch", "--merged", "main", "--format=%(refname:short)"}, "main\n");
            runner_->respond({"rev-list", "--count", "main", "--"}, "2\n");
        }

        std::string default_log() const {
            return record(kBobHeader, "8\t0\tsrc/main.cpp\n")
                 + record(kAliceHeader, "6\t0\tsrc/shape.hpp\n1\t0\tREADME.md\n");
        }

        AnalysisConfig config() const {
            AnalysisConfig config;
            config.workers = 2;
            return config;
        }

        fs::path root_;
        std::unique_ptr<FakeCommandRunner> runner_;
    };

    TEST_F(AnalysisEngineTest, ProducesCompleteReport) {
        respond_repository(default_log());
        RecordingObserver observer;

        Engine engine(config(), *runner_);
        const auto result = engine.analyze(&observer);
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();

        const auto& data = result.value().data;
        EXPECT_EQ(data.project_name, root_.filename().string());
        EXPECT_EQ(data.main_branch, "main");
        EXPECT_EQ(data.total_commits, 2u);
        EXPECT_EQ(data.total_authors, 2u);
        EXPECT_EQ(data.total_files, 2u);
        EXPECT_EQ(data.total_lines_added, 15u);
        EXPECT_EQ(data.code_metrics.size(), 2u);
        EXPECT_FALSE(data.files.contains("README.md"));
        EXPECT_EQ(data.files.at("src/main.cpp").last_modified_by, "Bob");
        EXPECT_EQ(data.files.at("src/shape.hpp").line_count, 6u);
        EXPECT_EQ(data.branches.at("main").commit_count, 2u);
        EXPECT_FALSE(data.branches.at("main").is_merged);

        EXPECT_EQ(data.coupling.at("src/main.cpp").efferent, 1u);
        EXPECT_EQ(data.coupling.at("src/shape.hpp").afferent, 1u);
        EXPECT_EQ(data.coupling.at("src/main.cpp").dependencies, (std::set<std::string>{"src/shape.hpp"}));

        const auto& health = result.value().health;
        EXPECT_EQ(health.bus_factor, 1u);
        EXPECT_GE(health.code_quality_score, 0.0);
        EXPECT_LE(health.code_quality_score, 100.0);

        const auto& diagnostics = result.value().diagnostics;
        EXPECT_EQ(diagnostics.parse_errors, 0u);
        EXPECT_TRUE(diagnostics.skipped_files.empty());
        EXPECT_EQ(diagnostics.phase_durations.size(), 7u);

        ASSERT_FALSE(observer.fractions.empty());
        EXPECT_DOUBLE_EQ(observer.fractions.back(), 1.0);
        EXPECT_TRUE(std::ranges::is_sorted(observer.fractions));
    }

    TEST_F(AnalysisEngineTest, RunsAreDeterministic) {
        respond_repository(default_log());

        Engine engine(config(), *runner_);
        const auto first = engine.analyze();
        const auto second = engine.analyze();
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(first.value().data, second.value().data);
        EXPECT_EQ(first.value().health, second.value().health);
        EXPECT_EQ(first.value().hotspots, second.value().hotspots);
    }

    TEST_F(AnalysisEngineTest, RanksHotspotsOfAnalysedFiles) {
        respond_repository(record(kBobHeader, "8\t0\tsrc/main.cpp\n2\t0\tsrc/shape.hpp\n")
                           + record(kAliceHeader, "6\t0\tsrc/shape.hpp\n1\t0\tREADME.md\n"));

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();

        const auto& report = result.value();
        ASSERT_EQ(report.hotspots.size(), 2u);
        EXPECT_EQ(report.hotspot_summary.files_analyzed, 2u);
        EXPECT_EQ(report.hotspot_summary.files_with_coupling, 2u);
        EXPECT_EQ(report.data.recent_change_sets.size(), 2u);

        const auto shape = std::ranges::find(report.hotspots, std::string("src/shape.hpp"), &Hotspot::path);
        ASSERT_NE(shape, report.hotspots.end());
        EXPECT_EQ(shape->revisions, 2u);
        EXPECT_DOUBLE_EQ(shape->churn_score, 100.0);
        ASSERT_EQ(shape->coupled_files.size(), 1u);
        EXPECT_EQ(shape->coupled_files[0].path, "src/main.cpp");
        EXPECT_DOUBLE_EQ(shape->coupled_files[0].strength, 1.0);
    }

    TEST_F(AnalysisEngineTest, MalformedRecordsAreCountedAndSkipped) {
        respond_repository(default_log() + record("not-a-header", "") + record(kAliceHeader, "x\t1\ta.cpp\n"));

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().data.total_commits, 2u);
        EXPECT_EQ(result.value().diagnostics.parse_errors, 2u);
        EXPECT_EQ(result.value().diagnostics.parse_error_samples.size(), 2u);
    }

    TEST_F(AnalysisEngineTest, MissingWorkingTreeFileIsSkipped) {
        respond_repository(default_log());
        runner_->respond({"ls-files", "-z"}, "src/gone.cpp\0src/main.cpp\0src/shape.hpp\0"s);

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_ok());

        const auto& skipped = result.value().diagnostics.skipped_files;
        ASSERT_EQ(skipped.size(), 1u);
        EXPECT_EQ(skipped[0].path, "src/gone.cpp");
        EXPECT_EQ(result.value().data.total_files, 3u);
        EXPECT_FALSE(result.value().data.coupling.contains("src/gone.cpp"));

        const auto& placeholder = result.value().data.code_metrics.at("src/gone.cpp");
        EXPECT_FALSE(placeholder.valid);
        EXPECT_EQ(placeholder.language, Language::Cpp);
        EXPECT_EQ(placeholder.loc_physical, 0u);
    }

    TEST_F(AnalysisEngineTest, OversizedFileIsSkipped) {
        respond_repository(default_log());
        write_file(root_ / "src/main.cpp", std::string(3 * 1024, 'x'));

        auto limited = config();
        limited.max_file_size_kb = 2;
        Engine engine(limited, *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_ok());

        const auto& skipped = result.value().diagnostics.skipped_files;
        ASSERT_EQ(skipped.size(), 1u);
        EXPECT_EQ(skipped[0].path, "src/main.cpp");
        EXPECT_FALSE(result.value().data.code_metrics.at("src/main.cpp").valid);
        EXPECT_EQ(result.value().data.files.at("src/main.cpp").current_size, 3u * 1024);
        EXPECT_EQ(result.value().data.coupling.at("src/shape.hpp").afferent, 0u);
    }

    TEST_F(AnalysisEngineTest, EmptyHistoryIsExtractionError) {
        respond_repository("");

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ExtractionError);
    }

    TEST_F(AnalysisEngineTest, OnlyMalformedHistoryIsExtractionError) {
        respond_repository(record("garbage", "") + record("more garbage", ""));

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ExtractionError);
    }

    TEST_F(AnalysisEngineTest, NonRepositoryIsValidationError) {
        runner_->respond({"rev-parse", "--is-inside-work-tree"},
                         "fatal: not a git repository\n", 128);

        Engine engine(config(), *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ValidationError);
    }

    TEST_F(AnalysisEngineTest, MissingDirectoryIsValidationError) {
        FakeCommandRunner runner(root_ / "does-not-exist");

        Engine engine(config(), runner);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ValidationError);
        EXPECT_TRUE(runner.calls().empty());
    }

    TEST_F(AnalysisEngineTest, InvalidConfigIsRejected) {
        respond_repository(default_log());
        auto broken = config();
        broken.workers = 0;

        Engine engine(broken, *runner_);
        const auto result = engine.analyze();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(AnalysisEngineTest, CancellationStopsTheRun) {
        respond_repository(default_log());
        RecordingObserver observer;
        observer.cancel = true;

        Engine engine(config(), *runner_);
        const auto result = engine.analyze(&observer);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::Cancelled);
    }
}
