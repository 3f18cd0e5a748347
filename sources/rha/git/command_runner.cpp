#include "rha/git/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rha::git {

    namespace {

        constexpr auto poll_interval = std::chrono::milliseconds(10);
        constexpr auto term_grace = std::chrono::milliseconds(100);

        /**
         * Reads whatever is currently available on a non-blocking fd.
         */
        void drain(const int fd, std::string& out) {
            char buffer[4096];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
        }

        /**
         * SIGTERM, short grace, then SIGKILL; always reaps the child.
         */
        void terminate_child(const pid_t pid) {
            int status = 0;
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(term_grace);
            if (waitpid(pid, &status, WNOHANG) == 0) {
                kill(pid, SIGKILL);
                waitpid(pid, &status, 0);
            }
        }

        int decode_status(const int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return -WTERMSIG(status);
            }
            return -1;
        }

    }  // namespace

    std::string format_command(const std::vector<std::string>& args) {
        std::ostringstream cmd;
        cmd << "git";
        for (const auto& arg : args) {
            cmd << ' ';
            if (arg.find(' ') != std::string::npos) {
                cmd << '"' << arg << '"';
            } else {
                cmd << arg;
            }
        }
        return cmd.str();
    }

    GitCommandRunner::GitCommandRunner(fs::path repository_root, std::string git_executable)
        : root_(std::move(repository_root))
        , git_(std::move(git_executable)) {}

    Result<CommandResult> GitCommandRunner::run(
        const std::vector<std::string>& args,
        const std::chrono::seconds timeout,
        const CancellationToken* cancel
    ) {
        const std::string command_line = format_command(args);

        if (std::error_code ec; !fs::is_directory(root_, ec)) {
            return Result<CommandResult>::failure(
                Error::not_found("Working directory does not exist", root_.string()));
        }

        std::vector<std::string> argv_storage;
        argv_storage.reserve(args.size() + 1);
        argv_storage.push_back(git_);
        argv_storage.insert(argv_storage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argv_storage.size() + 1);
        for (auto& arg : argv_storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        int output_pipe[2];
        if (pipe(output_pipe) < 0) {
            return Result<CommandResult>::failure(
                Error::io_error("Failed to create pipe", command_line));
        }

        const auto start_time = std::chrono::steady_clock::now();
        const pid_t pid = fork();
        if (pid < 0) {
            close(output_pipe[0]);
            close(output_pipe[1]);
            return Result<CommandResult>::failure(
                Error::io_error("Failed to fork", command_line));
        }

        if (pid == 0) {
            // Child: stdout and stderr share the pipe
            close(output_pipe[0]);
            dup2(output_pipe[1], STDOUT_FILENO);
            dup2(output_pipe[1], STDERR_FILENO);
            close(output_pipe[1]);

            if (chdir(root_.c_str()) != 0) {
                _exit(127);
            }

            execvp(argv[0], argv.data());
            _exit(127);
        }

        close(output_pipe[1]);
        fcntl(output_pipe[0], F_SETFL, O_NONBLOCK);

        CommandResult result;
        const auto deadline = start_time + timeout;
        int status = 0;

        while (true) {
            drain(output_pipe[0], result.output);

            if (const pid_t wpid = waitpid(pid, &status, WNOHANG); wpid > 0) {
                drain(output_pipe[0], result.output);
                result.exit_code = decode_status(status);
                break;
            }

            if (cancel != nullptr && cancel->is_requested()) {
                terminate_child(pid);
                close(output_pipe[0]);
                spdlog::debug("{} terminated on cancellation", command_line);
                return Result<CommandResult>::failure(Error::cancelled("Analysis cancelled"));
            }

            if (std::chrono::steady_clock::now() > deadline) {
                terminate_child(pid);
                close(output_pipe[0]);
                spdlog::warn("{} timed out after {}s", command_line, timeout.count());
                return Result<CommandResult>::failure(
                    Error::extraction_error("Command timed out after " + std::to_string(timeout.count()) + "s",
                                            command_line));
            }

            pollfd readiness{output_pipe[0], POLLIN, 0};
            poll(&readiness, 1, static_cast<int>(poll_interval.count()));
        }

        close(output_pipe[0]);

        result.execution_time = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start_time);

        spdlog::debug("{} exited {} in {} ms, {} bytes",
                      command_line,
                      result.exit_code,
                      std::chrono::duration_cast<std::chrono::milliseconds>(result.execution_time).count(),
                      result.output.size());

        return Result<CommandResult>::success(std::move(result));
    }

}  // namespace rha::git
