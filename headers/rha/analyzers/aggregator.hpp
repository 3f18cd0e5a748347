#ifndef RHA_ANALYZERS_AGGREGATOR_HPP
#define RHA_ANALYZERS_AGGREGATOR_HPP

/**
 * @file aggregator.hpp
 * @brief Folds commits and per-file results into RepositoryData.
 *
 * Commits are added sequentially by the extraction phase. File analyses are
 * recorded concurrently by pool workers; every per-key map is a
 * KeyedAccumulator, and the project-wide counters sit behind one mutex.
 * snapshot() freezes everything into ordered maps and computes totals.
 */

#include "rha/analyzers/coupling_analyzer.hpp"
#include "rha/analyzers/file_analyzer.hpp"
#include "rha/config.hpp"
#include "rha/repository_data.hpp"
#include "rha/utils/keyed_accumulator.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rha::analyzers {

    /**
     * Calendar position of a commit in its author's time zone.
     */
    struct LocalTime {
        int year = 1970;
        unsigned month = 1;    // 1..12
        unsigned day = 1;      // 1..31
        unsigned hour = 0;     // 0..23
        unsigned weekday = 0;  // 0 = Monday
        DateKey date;          // "YYYY-MM-DD"
        std::string year_month;  // "YYYY-MM"
    };

    [[nodiscard]] LocalTime to_local_time(Timestamp timestamp, int offset_minutes);

    /**
     * Domain part of an e-mail address, lower-cased; "unknown" without '@'.
     */
    [[nodiscard]] std::string email_domain(std::string_view email);

    class Aggregator {
    public:
        /**
         * @param change_set_window Most recent commits whose filtered paths
         *        are kept for change coupling; 0 keeps none.
         */
        explicit Aggregator(FilterConfig filter, std::size_t change_set_window = 500);

        Aggregator(const Aggregator&) = delete;
        Aggregator& operator=(const Aggregator&) = delete;

        /**
         * Whether a path passes the extension filter.
         */
        [[nodiscard]] bool includes(const std::string& path) const;

        /**
         * Updates author, activity, file and directory statistics from one
         * commit. Called from a single thread.
         */
        void add_commit(const CommitRecord& commit);

        /**
         * Counts a tracked file in the extension histogram if it passes the
         * filter.
         *
         * @return true if the file is included.
         */
        bool add_tracked_file(const std::string& path);

        /**
         * Merges one file's analysis. Safe to call from any thread;
         * recording the same analysis twice leaves the result unchanged.
         */
        void record_file_analysis(const FileAnalysis& analysis);

        void set_coupling(CouplingReport report);
        void set_branches(const std::vector<BranchInfo>& branches);
        void set_identity(std::string project_name, std::string main_branch);

        [[nodiscard]] RepositoryData snapshot() const;

    private:
        void touch_file(const std::string& path, const CommitRecord& commit, const FileChange& change);
        void remember_change_set(Timestamp when, std::vector<std::string> paths);

        FilterConfig filter_;
        std::size_t change_set_window_;

        utils::KeyedAccumulator<std::string, AuthorStatistics> authors_;
        utils::KeyedAccumulator<std::string, FileStatistics> files_;
        utils::KeyedAccumulator<std::string, DirectoryStatistics> directories_;
        utils::KeyedAccumulator<std::string, CodeMetrics> code_metrics_;

        mutable std::mutex mutex_;
        std::string project_name_;
        std::string main_branch_;
        ActivityHistogram activity_;
        std::map<std::string, std::size_t> extension_histogram_;
        std::map<std::string, CouplingMetrics> coupling_;
        std::map<std::string, CouplingMetrics> package_coupling_;
        std::map<std::string, BranchInfo> branches_;
        std::set<DateKey> active_days_;
        std::optional<Timestamp> first_commit_;
        std::optional<Timestamp> last_commit_;
        std::size_t total_commits_ = 0;
        std::size_t lines_added_ = 0;
        std::size_t lines_removed_ = 0;
        std::size_t tracked_files_ = 0;
        std::vector<std::pair<Timestamp, std::vector<std::string>>> change_sets_;
    };

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_AGGREGATOR_HPP
