#ifndef RHA_CONFIG_HPP
#define RHA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analysis configuration and fixed scoring thresholds.
 *
 * AnalysisConfig is a plain value: load it once (defaults, TOML file or
 * TOML string), then pass it into the engine. Nothing reads configuration
 * from global state.
 *
 * Example file:
 * @code
 *     [analysis]
 *     workers = 4
 *     scan_default_branch_only = true
 *     since = "2023-01-01"
 *
 *     [filter]
 *     enabled = true
 *     extensions = [".cpp", ".hpp", ".py"]
 *
 *     [timeouts]
 *     command_seconds = 300
 *
 *     [hotspots]
 *     top = 20
 *     commit_window = 500
 *
 *     [logging]
 *     level = "debug"
 * @endcode
 */

#include "rha/result.hpp"
#include "rha/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rha {

    /**
     * Scoring thresholds. These are part of the output contract and are not
     * configurable.
     */
    namespace thresholds {
        /// Complexity level upper bounds (inclusive)
        inline constexpr std::size_t simple_complexity = 10;
        inline constexpr std::size_t moderate_complexity = 20;
        inline constexpr std::size_t complex_complexity = 50;

        /// Raw maintainability index lower bounds
        inline constexpr double mi_good = 85.0;
        inline constexpr double mi_moderate = 65.0;
        inline constexpr double mi_difficult = 0.0;

        /// A file is "large" above this many physical lines
        inline constexpr std::size_t large_file_loc = 500;

        /// A file is "complex" above this cyclomatic complexity
        inline constexpr std::size_t complex_file_cc = 20;

        /// Distance from the main sequence
        inline constexpr double main_sequence_distance = 0.2;
        inline constexpr double moderate_distance = 0.4;

        /// Zone of Pain needs both A and I below this; Uselessness both above
        inline constexpr double pain_corner = 0.3;
        inline constexpr double uselessness_corner = 0.7;

        /// Quality-score penalty inputs
        inline constexpr double complexity_penalty_start = 10.0;
        inline constexpr double complexity_penalty_factor = 3.0;
        inline constexpr double complexity_penalty_cap = 30.0;
        inline constexpr double mi_penalty_start = 65.0;
        inline constexpr double mi_penalty_factor = 0.5;
        inline constexpr double mi_penalty_cap = 30.0;
        inline constexpr double large_file_penalty_cap = 20.0;
        inline constexpr std::size_t critical_bus_factor = 2;
        inline constexpr std::size_t low_bus_factor = 4;
        inline constexpr double critical_bus_factor_penalty = 20.0;
        inline constexpr double low_bus_factor_penalty = 10.0;

        /// Quality score below which a refactoring recommendation is emitted
        inline constexpr double low_quality_score = 50.0;

        /// Hotspot risk bands
        inline constexpr double critical_risk = 60.0;
        inline constexpr double high_risk = 40.0;
        inline constexpr double medium_risk = 20.0;

        /// Change coupling below this strength is not reported
        inline constexpr double min_change_coupling = 0.3;
        inline constexpr std::size_t max_coupled_files = 5;
        inline constexpr double coupling_penalty_per_file = 5.0;
        inline constexpr double coupling_penalty_cap = 25.0;

        /// Commits touching more files than this are left out of change coupling
        inline constexpr std::size_t max_change_set_files = 100;

        /// Leading bytes inspected for a NUL when detecting binary files
        inline constexpr std::size_t binary_probe_bytes = 8000;
    }

    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    inline const char* to_string(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return "trace";
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off:   return "off";
        }
        return "info";
    }

    /**
     * Parses a case-insensitive level name ("warning" is accepted for warn).
     */
    std::optional<LogLevel> parse_log_level(std::string_view name);

    /**
     * Source-file extension filter.
     */
    struct FilterConfig {
        /// When false every path passes the filter
        bool enabled = true;

        /// Lower-case suffixes including the leading dot
        std::vector<std::string> extensions = default_extensions();

        /// Extension-less build files that always pass
        std::vector<std::string> extensionless_allow_list = {
            "Makefile", "Dockerfile", "Rakefile", "Gemfile", "CMakeLists"
        };

        static std::vector<std::string> default_extensions();
    };

    struct TimeoutConfig {
        /// Bound on every history query
        std::chrono::seconds command{300};

        /// Bound on the "is this a git repository" probe
        std::chrono::seconds validation{5};

        /// Wait for queued work on pool shutdown before discarding it
        std::chrono::seconds shutdown_grace{5};
    };

    struct HotspotConfig {
        /// Hotspots kept in the report
        std::size_t top = 20;

        /// Most recent commits considered for change coupling
        std::size_t commit_window = 500;
    };

    /**
     * Read-only configuration snapshot handed to the engine.
     */
    struct AnalysisConfig {
        /// Worker threads for per-file analysis; default min(4, cores)
        unsigned int workers = default_workers();

        /// Follow only the first-parent history of the default branch
        bool default_branch_only = true;

        /// Optional git date expression passed as --since
        std::optional<std::string> since;

        /// Files above this size are skipped (0 disables the limit)
        std::size_t max_file_size_kb = 2048;

        FilterConfig filter;
        TimeoutConfig timeouts;
        HotspotConfig hotspots;
        LogLevel log_level = LogLevel::Info;

        static unsigned int default_workers() noexcept;

        /**
         * Checks ranges; a zero worker count or zero timeout is a ConfigError.
         */
        [[nodiscard]] Result<void> validate() const;
    };

    /**
     * Decides whether a repository path takes part in file statistics.
     *
     * - filtering disabled: everything passes
     * - dotfiles (basename starting with '.') never pass
     * - names without a '.' pass only when on the extension-less allow-list
     * - otherwise the lower-cased basename must end with an allowed suffix
     */
    [[nodiscard]] bool should_include_file(std::string_view path, const FilterConfig& filter);

    /**
     * Loads configuration from a TOML file, starting from the defaults.
     */
    [[nodiscard]] Result<AnalysisConfig> load_config_file(const fs::path& path);

    /**
     * Parses TOML text. Unknown keys are ignored; wrong types are a ConfigError.
     */
    [[nodiscard]] Result<AnalysisConfig> load_config_string(std::string_view content);

}  // namespace rha

#endif // RHA_CONFIG_HPP
