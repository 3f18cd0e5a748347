#include "app.hpp"

#include "rha/analysis/analysis_engine.hpp"
#include "rha/cli/formatter.hpp"
#include "rha/cli/progress.hpp"
#include "rha/logging.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace rha::cli {

    namespace {
        std::atomic<bool> g_stop_requested{false};

        void handle_sigint(int) {
            g_stop_requested.store(true);
        }

        /**
         * Restores the previous SIGINT disposition on scope exit.
         */
        class SigintGuard {
        public:
            SigintGuard()
                : previous_(std::signal(SIGINT, handle_sigint)) {}

            ~SigintGuard() {
                std::signal(SIGINT, previous_);
            }

            SigintGuard(const SigintGuard&) = delete;
            SigintGuard& operator=(const SigintGuard&) = delete;

        private:
            void (*previous_)(int);
        };
    }

    App::App(Options options)
        : options_(std::move(options))
    {}

    Result<AnalysisConfig> App::build_config() const {
        AnalysisConfig config;
        if (options_.config_file) {
            auto loaded = load_config_file(*options_.config_file);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded.value());
        }

        if (options_.workers) {
            config.workers = *options_.workers;
        }
        if (options_.since) {
            config.since = options_.since;
        }
        if (options_.max_file_size_kb) {
            config.max_file_size_kb = *options_.max_file_size_kb;
        }
        if (options_.all_branches) {
            config.default_branch_only = false;
        }
        if (options_.no_extension_filter) {
            config.filter.enabled = false;
        }
        if (options_.verbose) {
            config.log_level = LogLevel::Debug;
        } else if (options_.quiet) {
            config.log_level = LogLevel::Warn;
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<AnalysisConfig>::failure(valid.error());
        }
        return Result<AnalysisConfig>::success(std::move(config));
    }

    int App::run() {
        if (options_.no_color) {
            set_color_enabled(false);
        }

        auto config = build_config();
        if (config.is_err()) {
            configure_logging(LogLevel::Info);
            spdlog::error("Configuration error: {}", config.error().to_string());
            return exit_codes::usage_error;
        }
        configure_logging(config.value().log_level);

        g_stop_requested.store(false);
        SigintGuard sigint_guard;
        TerminalObserver observer(g_stop_requested, !options_.quiet);

        auto report = analysis::analyze_repository(options_.repository, config.value(), &observer);
        if (report.is_err()) {
            const auto& error = report.error();
            observer.fail(error.message());
            if (error.code() == ErrorCode::Cancelled) {
                std::cerr << "Interrupted\n";
                return exit_codes::cancelled;
            }
            spdlog::error("Analysis failed: {}", error.to_string());
            return exit_codes::analysis_failed;
        }
        observer.finish();

        print_report(report.value());
        return exit_codes::success;
    }

    void App::print_report(const ProjectReport& report) const {
        const SummaryPrinter printer(std::cout);

        if (!options_.quiet) {
            printer.print_overview(report.data);
            printer.print_authors(report.data, options_.top_n);
            printer.print_most_changed(report.data, options_.top_n);
            printer.print_hotspots(report.hotspots, report.hotspot_summary, options_.top_n);
            printer.print_code_quality(report.data, options_.top_n);
            printer.print_coupling(report.data, options_.top_n);
            printer.print_activity(report.data);
        }
        printer.print_health(report.health);
        printer.print_diagnostics(report.diagnostics, options_.verbose);
    }

} // namespace rha::cli
