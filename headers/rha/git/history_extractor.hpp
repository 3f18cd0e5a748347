#ifndef RHA_GIT_HISTORY_EXTRACTOR_HPP
#define RHA_GIT_HISTORY_EXTRACTOR_HPP

/**
 * @file history_extractor.hpp
 * @brief Version-control queries that feed the analysis pipeline.
 *
 * Each logical query is one git invocation:
 * - log with a custom record format plus --numstat -> CommitStream
 * - rev-list --count -> revision count
 * - for-each-ref / branch --merged / rev-list -> BranchInfo list
 * - ls-files -z -> tracked paths
 *
 * A timeout or non-zero exit is an ExtractionError. A malformed log record
 * is a ParseError reported by CommitStream::next(); callers skip it and
 * keep reading.
 */

#include "rha/cancellation.hpp"
#include "rha/git/command_runner.hpp"
#include "rha/repository_data.hpp"
#include "rha/result.hpp"
#include "rha/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rha::git {

    enum class BranchScope {
        DefaultBranch,  ///< first-parent history of one branch
        AllBranches     ///< every ref (--all)
    };

    struct HistoryQuery {
        BranchScope scope = BranchScope::DefaultBranch;
        std::string branch;                // used with DefaultBranch
        std::optional<std::string> since;  // git date expression
    };

    /// Record separator emitted before every commit header (%x1e).
    inline constexpr char record_separator = '\x1e';

    /// --pretty argument producing "hash\tname\temail\tunix\tiso\tsubject".
    inline constexpr std::string_view log_format =
        "--pretty=format:%x1e%H%x09%aN%x09%aE%x09%at%x09%ai%x09%s";

    /**
     * Parses one record (the text between two separators).
     *
     * The first non-empty line is the header, the rest are numstat lines
     * "added\tremoved\tpath". Binary entries ("-\t-\tpath") count 0/0.
     */
    [[nodiscard]] Result<CommitRecord> parse_commit_record(std::string_view record);

    /**
     * Parses "+HHMM"/"-HHMM" into minutes east of UTC.
     */
    [[nodiscard]] std::optional<int> parse_timezone_offset(std::string_view text) noexcept;

    /**
     * Undoes git's C-style path quoting ("a\tb" -> a<TAB>b).
     */
    [[nodiscard]] std::string unquote_path(std::string_view path);

    /**
     * Lazy sequence of commits over captured log output.
     *
     * next() parses one record per call. reset() rewinds to the first record,
     * so a stream can be walked more than once without re-running git.
     */
    class CommitStream {
    public:
        CommitStream() = default;
        explicit CommitStream(std::string raw_log);

        /**
         * @return nullopt at the end, otherwise a parsed record or a ParseError
         *         for a malformed one (the stream has already moved past it).
         */
        std::optional<Result<CommitRecord>> next();

        void reset() noexcept {
            offset_ = first_record_offset();
        }

        [[nodiscard]] bool at_end() const noexcept {
            return offset_ >= raw_.size();
        }

    private:
        [[nodiscard]] std::size_t first_record_offset() const noexcept;

        std::string raw_;
        std::size_t offset_ = 0;
    };

    class HistoryExtractor {
    public:
        /**
         * @param runner Command collaborator; must outlive the extractor.
         * @param timeout Bound applied to every query.
         * @param cancel Optional token forwarded to the runner.
         */
        HistoryExtractor(ICommandRunner& runner,
                         std::chrono::seconds timeout,
                         const CancellationToken* cancel = nullptr);

        /**
         * Fails with ValidationError unless the working directory is inside a
         * git work tree.
         */
        [[nodiscard]] Result<void> validate_repository(std::chrono::seconds timeout);

        /**
         * Remote HEAD, then the checked-out branch, then main/master/develop/
         * development if present locally, finally "master".
         */
        [[nodiscard]] Result<std::string> resolve_default_branch();

        [[nodiscard]] Result<CommitStream> extract_commits(const HistoryQuery& query);

        [[nodiscard]] Result<std::size_t> count_revisions(const HistoryQuery& query);

        /**
         * Local branches with last-commit facts, merge status against
         * @p default_branch and per-branch commit counts.
         */
        [[nodiscard]] Result<std::vector<BranchInfo>> list_branches(const std::string& default_branch);

        [[nodiscard]] Result<std::vector<std::string>> list_tracked_files();

        [[nodiscard]] Result<std::string> git_version();

    private:
        /**
         * Runs a query and turns a non-zero exit into ExtractionError.
         */
        Result<std::string> run_checked(const std::vector<std::string>& args);

        static void append_scope(std::vector<std::string>& args, const HistoryQuery& query);

        ICommandRunner& runner_;
        std::chrono::seconds timeout_;
        const CancellationToken* cancel_;
    };

}  // namespace rha::git

#endif // RHA_GIT_HISTORY_EXTRACTOR_HPP
