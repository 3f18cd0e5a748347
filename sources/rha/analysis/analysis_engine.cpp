#include "rha/analysis/analysis_engine.hpp"

#include "rha/analyzers/aggregator.hpp"
#include "rha/analyzers/coupling_analyzer.hpp"
#include "rha/analyzers/file_analyzer.hpp"
#include "rha/analyzers/health_scorer.hpp"
#include "rha/analyzers/hotspot_analyzer.hpp"
#include "rha/cancellation.hpp"
#include "rha/git/history_extractor.hpp"
#include "rha/utils/file_utils.hpp"
#include "rha/utils/parallel.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <future>
#include <limits>
#include <map>
#include <optional>

namespace rha::analysis {

    namespace {

        using Clock = std::chrono::steady_clock;

        /**
         * Appends the elapsed time of a scope to the diagnostics.
         */
        class PhaseTimer {
        public:
            PhaseTimer(AnalysisDiagnostics& diagnostics, std::string name)
                : diagnostics_(diagnostics), name_(std::move(name)), start_(Clock::now()) {}

            ~PhaseTimer() {
                const auto elapsed = std::chrono::duration_cast<Duration>(Clock::now() - start_);
                spdlog::debug("Phase {} took {} ms", name_,
                              std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
                diagnostics_.phase_durations.emplace_back(std::move(name_), elapsed);
            }

            PhaseTimer(const PhaseTimer&) = delete;
            PhaseTimer& operator=(const PhaseTimer&) = delete;

        private:
            AnalysisDiagnostics& diagnostics_;
            std::string name_;
            Clock::time_point start_;
        };

        /**
         * Never fails: unreadable files and analyzer exceptions become a
         * zero-metrics entry with a skip reason.
         */
        analyzers::FileAnalysis analyze_or_skip(const fs::path& root, const std::string& path, const std::size_t max_bytes) {
            try {
                auto result = analyzers::analyze_file(root, path, max_bytes);
                if (result.is_ok()) {
                    return std::move(result).value();
                }
                return analyzers::skipped_analysis(path, 0, result.error().message());
            } catch (const std::exception& e) {
                return analyzers::skipped_analysis(
                    path, file_utils::file_size_or_zero(root / fs::path(path)), std::string("analysis failed: ") + e.what());
            }
        }

        Result<ProjectReport> cancelled_run() {
            spdlog::info("Analysis cancelled");
            return Result<ProjectReport>::failure(Error::cancelled("Analysis cancelled by caller"));
        }

        std::string project_name_of(const fs::path& root) {
            std::error_code ec;
            fs::path resolved = fs::weakly_canonical(root, ec);
            if (ec) {
                resolved = root.lexically_normal();
            }
            if (!resolved.has_filename()) {
                resolved = resolved.parent_path();
            }
            return resolved.filename().string();
        }

        std::size_t size_limit_bytes(const std::size_t max_file_size_kb) noexcept {
            if (max_file_size_kb == 0) {
                return std::numeric_limits<std::size_t>::max();
            }
            return max_file_size_kb * 1024;
        }

    }  // namespace

    Engine::Engine(AnalysisConfig config, git::ICommandRunner& runner)
        : config_(std::move(config)), runner_(runner) {}

    Result<ProjectReport> Engine::analyze(IProgressObserver* observer) {
        if (auto valid = config_.validate(); valid.is_err()) {
            return Result<ProjectReport>::failure(valid.error());
        }

        ProgressDispatcher progress(observer);
        const CancellationToken cancel([&progress] { return progress.cancel_requested(); });
        git::HistoryExtractor extractor(runner_, config_.timeouts.command, &cancel);
        analyzers::Aggregator aggregator(config_.filter, config_.hotspots.commit_window);

        const fs::path& root = runner_.working_directory();
        ProjectReport report;
        auto& diagnostics = report.diagnostics;

        spdlog::info("Analyzing repository {}", root.string());
        progress.report(0.0, "Validating repository");

        std::string main_branch;
        {
            PhaseTimer timer(diagnostics, "validate");
            std::error_code ec;
            if (!fs::is_directory(root, ec)) {
                return Result<ProjectReport>::failure(
                    Error::validation_error("Repository path is not a directory", root.string()));
            }
            if (auto valid = extractor.validate_repository(config_.timeouts.validation); valid.is_err()) {
                return Result<ProjectReport>::failure(valid.error());
            }
            auto branch = extractor.resolve_default_branch();
            if (branch.is_err()) {
                return Result<ProjectReport>::failure(branch.error());
            }
            main_branch = std::move(branch.value());
        }
        spdlog::info("Default branch: {}", main_branch);

        if (cancel.is_requested()) {
            return cancelled_run();
        }

        // Commit history
        {
            PhaseTimer timer(diagnostics, "history");
            progress.report(0.0, "Reading commit history");

            git::HistoryQuery query;
            query.scope = config_.default_branch_only ? git::BranchScope::DefaultBranch
                                                      : git::BranchScope::AllBranches;
            query.branch = main_branch;
            query.since = config_.since;

            auto expected = extractor.count_revisions(query);
            if (expected.is_err()) {
                return Result<ProjectReport>::failure(expected.error());
            }
            auto stream = extractor.extract_commits(query);
            if (stream.is_err()) {
                return Result<ProjectReport>::failure(stream.error());
            }

            auto& commits = stream.value();
            std::size_t records = 0;
            while (auto entry = commits.next()) {
                if (cancel.is_requested()) {
                    return cancelled_run();
                }
                ++records;
                if (entry->is_err()) {
                    ++diagnostics.parse_errors;
                    spdlog::warn("Skipping malformed log record: {}", entry->error().to_string());
                    if (diagnostics.parse_error_samples.size() < max_parse_error_samples) {
                        diagnostics.parse_error_samples.push_back(entry->error().to_string());
                    }
                    continue;
                }
                aggregator.add_commit(entry->value());
                if (records % 100 == 0) {
                    progress.report_slice(0.0, 0.4, records, expected.value(), "Processing commits");
                }
            }

            const std::size_t parsed = records - diagnostics.parse_errors;
            if (parsed == 0) {
                return Result<ProjectReport>::failure(
                    Error::extraction_error("Repository history contains no readable commits", root.string()));
            }
            spdlog::info("Processed {} commits ({} malformed)", parsed, diagnostics.parse_errors);
            progress.report(0.4, "Processed " + std::to_string(parsed) + " commits");
        }

        // Working-tree files
        std::map<std::string, analyzers::FileStructure> structures;
        {
            PhaseTimer timer(diagnostics, "files");

            auto tracked = extractor.list_tracked_files();
            if (tracked.is_err()) {
                return Result<ProjectReport>::failure(tracked.error());
            }

            std::vector<std::string> included;
            for (const auto& path : tracked.value()) {
                if (aggregator.add_tracked_file(path)) {
                    included.push_back(path);
                }
            }
            spdlog::info("Analyzing {} of {} tracked files on {} workers",
                         included.size(), tracked.value().size(), config_.workers);

            const std::size_t max_bytes = size_limit_bytes(config_.max_file_size_kb);
            std::atomic<std::size_t> finished{0};
            parallel::ThreadPool pool(config_.workers);

            using Outcome = std::optional<analyzers::FileAnalysis>;
            std::vector<std::future<Outcome>> futures;
            futures.reserve(included.size());

            for (const auto& path : included) {
                if (cancel.is_requested()) {
                    break;
                }
                futures.push_back(pool.submit([&, file = &path]() -> Outcome {
                    if (cancel.is_requested()) {
                        return std::nullopt;
                    }
                    auto analysis = analyze_or_skip(root, *file, max_bytes);
                    aggregator.record_file_analysis(analysis);
                    progress.report_slice(0.4, 0.7, ++finished, included.size(), "Analyzing files");
                    return analysis;
                }));
            }

            for (auto& future : futures) {
                auto analysis = future.get();
                if (!analysis) {
                    continue;
                }
                if (analysis->skip_reason) {
                    spdlog::warn("Skipping {}: {}", analysis->path, *analysis->skip_reason);
                    diagnostics.skipped_files.push_back({analysis->path, *analysis->skip_reason});
                    continue;
                }
                structures.emplace(analysis->path, std::move(analysis->structure));
            }

            const auto grace = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeouts.shutdown_grace);
            if (const auto discarded = pool.shutdown(grace); discarded > 0) {
                spdlog::debug("Discarded {} queued file tasks", discarded);
            }
            if (cancel.is_requested()) {
                return cancelled_run();
            }
            progress.report(0.7, "Analyzed " + std::to_string(structures.size()) + " files");
        }

        // Branches
        {
            PhaseTimer timer(diagnostics, "branches");
            progress.report(0.7, "Listing branches");
            auto branches = extractor.list_branches(main_branch);
            if (branches.is_err()) {
                return Result<ProjectReport>::failure(branches.error());
            }
            spdlog::info("Found {} branches", branches.value().size());
            aggregator.set_branches(branches.value());
            progress.report(0.8, "Listed branches");
        }

        if (cancel.is_requested()) {
            return cancelled_run();
        }

        // Dependency graph and coupling
        {
            PhaseTimer timer(diagnostics, "coupling");
            progress.report(0.8, "Computing coupling metrics");
            auto coupling = analyzers::analyze_coupling(structures);
            if (!coupling.cycles.empty()) {
                spdlog::info("Sampled {} dependency cycles", coupling.cycles.size());
            }
            diagnostics.dependency_cycles = coupling.cycles;
            aggregator.set_coupling(std::move(coupling));
            aggregator.set_identity(project_name_of(root), main_branch);
            progress.report(0.9, "Computed coupling metrics");
        }

        // Health
        {
            PhaseTimer timer(diagnostics, "health");
            progress.report(0.9, "Scoring project health");
            report.data = aggregator.snapshot();
            report.health = analyzers::score_health(report.data);
        }

        {
            PhaseTimer timer(diagnostics, "hotspots");
            auto ranked = analyzers::HotspotAnalyzer::rank_all(report.data);
            report.hotspot_summary = analyzers::HotspotAnalyzer::summarize(ranked);
            if (config_.hotspots.top > 0 && ranked.size() > config_.hotspots.top) {
                ranked.resize(config_.hotspots.top);
            }
            report.hotspots = std::move(ranked);
            spdlog::debug("Ranked hotspots: {} critical, {} high", report.hotspot_summary.critical,
                          report.hotspot_summary.high);
        }

        spdlog::info("Analysis complete: {} commits, {} authors, {} files, quality score {:.1f}",
                     report.data.total_commits, report.data.total_authors,
                     report.data.total_files, report.health.code_quality_score);
        progress.report(1.0, "Analysis complete");
        return Result<ProjectReport>::success(std::move(report));
    }

    Result<ProjectReport> analyze_repository(
        const fs::path& repository,
        const AnalysisConfig& config,
        IProgressObserver* observer
    ) {
        git::GitCommandRunner runner(repository);
        Engine engine(config, runner);
        return engine.analyze(observer);
    }

}  // namespace rha::analysis
