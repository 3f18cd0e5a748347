#ifndef RHA_REPOSITORY_DATA_HPP
#define RHA_REPOSITORY_DATA_HPP

/**
 * @file repository_data.hpp
 * @brief Aggregate result types returned by an analysis run.
 *
 * RepositoryData is the aggregate root: every keyed collection uses an
 * ordered map so two runs over the same snapshot produce identical output.
 * A ProjectReport bundles it with the derived ProjectHealthMetrics, the
 * ranked hotspots and the run's diagnostics; it is the only thing the
 * engine hands back.
 */

#include "rha/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rha {

    /**
     * Calendar day in the author's local time, formatted YYYY-MM-DD.
     */
    using DateKey = std::string;

    /**
     * Per-author accumulator, keyed by author display name.
     *
     * Counters only increase; first/last commit move via min/max.
     */
    struct AuthorStatistics {
        std::string name;
        std::string email;  // most recently seen address
        std::size_t total_commits = 0;
        std::size_t lines_added = 0;
        std::size_t lines_removed = 0;
        std::optional<Timestamp> first_commit;
        std::optional<Timestamp> last_commit;
        std::set<DateKey> active_days;
        std::set<std::string> modified_files;
        std::map<std::string, std::size_t> commits_by_month;  // "YYYY-MM"
        std::map<int, std::size_t> commits_by_year;

        bool operator==(const AuthorStatistics&) const = default;
    };

    /**
     * Per-path history and working-tree facts.
     */
    struct FileStatistics {
        std::string path;
        std::size_t revision_count = 0;
        std::size_t lines_added = 0;
        std::size_t lines_removed = 0;
        std::size_t current_size = 0;  // bytes in the working tree
        std::size_t max_size = 0;      // monotonic max of observed sizes
        std::size_t line_count = 0;
        std::string last_modified_by;
        std::optional<Timestamp> last_modified;

        bool operator==(const FileStatistics&) const = default;
    };

    struct BranchInfo {
        std::string name;
        std::size_t commit_count = 0;
        std::optional<Timestamp> last_commit_date;
        std::string last_commit_author;
        bool is_merged = false;

        bool operator==(const BranchInfo&) const = default;
    };

    /**
     * Commit activity rolled up per directory ("." is the repository root).
     */
    struct DirectoryStatistics {
        std::size_t commits = 0;
        std::size_t lines_added = 0;
        std::size_t lines_removed = 0;
        std::set<std::string> files;

        bool operator==(const DirectoryStatistics&) const = default;
    };

    /**
     * Coupling and abstractness of one module (file or package).
     */
    struct CouplingMetrics {
        Language language = Language::Other;
        std::size_t class_count = 0;
        std::size_t abstract_class_count = 0;
        std::size_t interface_count = 0;
        std::size_t efferent = 0;   // Ce
        std::size_t afferent = 0;   // Ca
        double instability = 0.0;   // I
        double abstractness = 0.0;  // A
        double distance = 0.0;      // D = |A + I - 1|
        DesignZone zone = DesignZone::NotApplicable;
        std::set<std::string> dependencies;
        std::set<std::string> dependents;

        bool operator==(const CouplingMetrics&) const = default;
    };

    /**
     * Project-wide commit histograms, all in author-local time.
     */
    struct ActivityHistogram {
        std::array<std::size_t, 24> by_hour{};
        std::array<std::size_t, 7> by_weekday{};  // 0 = Monday
        std::array<std::size_t, 12> by_month{};   // 0 = January
        std::map<std::string, std::size_t> by_year_month;
        std::map<int, std::size_t> by_year;
        std::map<std::string, std::size_t> by_email_domain;
        std::map<int, std::size_t> by_timezone;   // offset in minutes

        bool operator==(const ActivityHistogram&) const = default;
    };

    /**
     * Everything gathered by one analysis run.
     */
    struct RepositoryData {
        std::string project_name;
        std::string main_branch;

        std::map<std::string, AuthorStatistics> authors;
        std::map<std::string, FileStatistics> files;
        std::map<std::string, CodeMetrics> code_metrics;
        std::map<std::string, CouplingMetrics> coupling;
        std::map<std::string, CouplingMetrics> package_coupling;
        std::map<std::string, BranchInfo> branches;
        std::map<std::string, DirectoryStatistics> directories;
        std::map<std::string, std::size_t> extension_histogram;
        ActivityHistogram activity;

        std::size_t total_commits = 0;
        std::size_t total_authors = 0;
        std::size_t total_files = 0;
        std::size_t total_lines = 0;
        std::size_t total_program_lines = 0;
        std::size_t total_comment_lines = 0;
        std::size_t total_blank_lines = 0;
        std::size_t total_lines_added = 0;
        std::size_t total_lines_removed = 0;
        std::optional<Timestamp> first_commit;
        std::optional<Timestamp> last_commit;
        std::size_t age_days = 0;
        std::set<DateKey> active_days;

        /// Filtered paths of the most recent commits, newest first, each sorted
        std::vector<std::vector<std::string>> recent_change_sets;

        bool operator==(const RepositoryData&) const = default;
    };

    /**
     * A file that tends to change in the same commits as another.
     *
     * strength = shared commits / min(commits of either file).
     */
    struct ChangeCoupling {
        std::string path;
        double strength = 0.0;

        bool operator==(const ChangeCoupling&) const = default;
    };

    /**
     * Churn and complexity of one file folded into a risk score.
     */
    struct Hotspot {
        std::string path;
        double risk_score = 0.0;
        RiskLevel risk_level = RiskLevel::Low;
        double churn_score = 0.0;       // 0..100, relative to the busiest file
        double relative_churn = 0.0;    // share of all revisions, percent
        double complexity_score = 0.0;  // 0..100
        std::size_t revisions = 0;
        std::optional<double> maintainability_index;  // raw; absent when not analysed
        std::size_t cyclomatic_complexity = 0;
        std::vector<ChangeCoupling> coupled_files;

        bool operator==(const Hotspot&) const = default;
    };

    struct HotspotSummary {
        std::size_t files_analyzed = 0;
        std::size_t critical = 0;
        std::size_t high = 0;
        std::size_t medium = 0;
        std::size_t low = 0;
        std::size_t files_with_coupling = 0;

        bool operator==(const HotspotSummary&) const = default;
    };

    /**
     * Derived health indicators, computed once from RepositoryData.
     */
    struct ProjectHealthMetrics {
        double code_quality_score = 100.0;
        std::size_t bus_factor = 0;
        double average_complexity = 0.0;
        double average_maintainability_index = 0.0;
        std::size_t large_files_count = 0;
        std::size_t complex_files_count = 0;

        std::size_t good_files = 0;
        std::size_t moderate_files = 0;
        std::size_t difficult_files = 0;
        std::size_t critical_files = 0;

        double average_distance = 0.0;
        std::size_t main_sequence_files = 0;
        std::size_t zone_of_pain_files = 0;
        std::size_t zone_of_uselessness_files = 0;

        std::vector<std::string> recommendations;

        bool operator==(const ProjectHealthMetrics&) const = default;
    };

    /**
     * A file that was listed but not analysed.
     */
    struct SkippedFile {
        std::string path;
        std::string reason;

        bool operator==(const SkippedFile&) const = default;
    };

    /**
     * Post-run summary of recovered errors and phase timings.
     */
    struct AnalysisDiagnostics {
        std::size_t parse_errors = 0;
        std::vector<std::string> parse_error_samples;  // bounded
        std::vector<SkippedFile> skipped_files;
        std::vector<std::vector<std::string>> dependency_cycles;  // bounded sample
        std::vector<std::pair<std::string, Duration>> phase_durations;
    };

    /**
     * Complete, immutable output of Engine::analyze().
     */
    struct ProjectReport {
        RepositoryData data;
        ProjectHealthMetrics health;
        std::vector<Hotspot> hotspots;  // highest risk first, bounded
        HotspotSummary hotspot_summary;
        AnalysisDiagnostics diagnostics;
    };

}  // namespace rha

#endif // RHA_REPOSITORY_DATA_HPP
