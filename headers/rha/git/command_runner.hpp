#ifndef RHA_GIT_COMMAND_RUNNER_HPP
#define RHA_GIT_COMMAND_RUNNER_HPP

/**
 * @file command_runner.hpp
 * @brief Runs git subcommands inside the repository being analysed.
 *
 * The engine talks to git only through ICommandRunner, so tests can feed
 * canned output through a fake runner. GitCommandRunner is the POSIX
 * implementation:
 * - working directory is the repository root
 * - stderr is merged into stdout
 * - a timeout or cancellation sends SIGTERM, then SIGKILL after 100 ms
 * - a non-zero exit code is returned, not turned into an error
 */

#include "rha/cancellation.hpp"
#include "rha/result.hpp"
#include "rha/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rha::git {

    /**
     * Output of a finished command.
     */
    struct CommandResult {
        int exit_code = 0;
        std::string output;  // stdout and stderr, interleaved
        Duration execution_time = Duration::zero();

        [[nodiscard]] bool success() const noexcept {
            return exit_code == 0;
        }
    };

    class ICommandRunner {
    public:
        virtual ~ICommandRunner() = default;

        /**
         * Runs `git <args...>`.
         *
         * @param args Arguments after "git".
         * @param timeout Upper bound on wall time.
         * @param cancel Optional token polled while waiting.
         * @return The result; ExtractionError on spawn failure or timeout,
         *         Cancelled if the token fired.
         */
        [[nodiscard]] virtual Result<CommandResult> run(
            const std::vector<std::string>& args,
            std::chrono::seconds timeout,
            const CancellationToken* cancel = nullptr
        ) = 0;

        /**
         * Directory the commands run in.
         */
        [[nodiscard]] virtual const fs::path& working_directory() const noexcept = 0;
    };

    class GitCommandRunner final : public ICommandRunner {
    public:
        explicit GitCommandRunner(fs::path repository_root, std::string git_executable = "git");

        [[nodiscard]] Result<CommandResult> run(
            const std::vector<std::string>& args,
            std::chrono::seconds timeout,
            const CancellationToken* cancel = nullptr
        ) override;

        [[nodiscard]] const fs::path& working_directory() const noexcept override {
            return root_;
        }

    private:
        fs::path root_;
        std::string git_;
    };

    /**
     * Formats "git a b c" for log lines and error context.
     */
    std::string format_command(const std::vector<std::string>& args);

}  // namespace rha::git

#endif // RHA_GIT_COMMAND_RUNNER_HPP
