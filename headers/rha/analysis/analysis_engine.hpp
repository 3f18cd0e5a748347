#ifndef RHA_ANALYSIS_ANALYSIS_ENGINE_HPP
#define RHA_ANALYSIS_ANALYSIS_ENGINE_HPP

/**
 * @file analysis_engine.hpp
 * @brief Single entry point that runs the whole analysis pipeline.
 *
 * Phases and their share of the progress range:
 * - validate repository, resolve default branch      0.00
 * - extract and aggregate commits                    0.00 - 0.40
 * - analyze tracked files on the worker pool         0.40 - 0.70
 * - list branches                                    0.70 - 0.80
 * - build dependency graph, coupling metrics         0.80 - 0.90
 * - health scoring                                   0.90 - 1.00
 *
 * A run either returns a complete ProjectReport or one terminal Error.
 * Per-file read failures and malformed log records are recovered and
 * reported in the diagnostics.
 */

#include "rha/analysis/progress.hpp"
#include "rha/config.hpp"
#include "rha/git/command_runner.hpp"
#include "rha/repository_data.hpp"
#include "rha/result.hpp"

namespace rha::analysis {

    /// Malformed log records kept verbatim in the diagnostics.
    inline constexpr std::size_t max_parse_error_samples = 10;

    class Engine {
    public:
        /**
         * @param config Configuration snapshot; copied.
         * @param runner Command collaborator bound to the repository root;
         *               must outlive the engine.
         */
        Engine(AnalysisConfig config, git::ICommandRunner& runner);

        /**
         * Analyzes the repository the runner is bound to.
         *
         * @param observer Optional progress sink and cancellation source.
         * @return The report, or ValidationError / ExtractionError /
         *         Cancelled / ConfigError.
         */
        [[nodiscard]] Result<ProjectReport> analyze(IProgressObserver* observer = nullptr);

        [[nodiscard]] const AnalysisConfig& config() const noexcept {
            return config_;
        }

    private:
        AnalysisConfig config_;
        git::ICommandRunner& runner_;
    };

    /**
     * Runs an Engine over @p repository with the system git.
     */
    [[nodiscard]] Result<ProjectReport> analyze_repository(
        const fs::path& repository,
        const AnalysisConfig& config,
        IProgressObserver* observer = nullptr
    );

}  // namespace rha::analysis

#endif // RHA_ANALYSIS_ANALYSIS_ENGINE_HPP
