#include "rha/analyzers/aggregator.hpp"

#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <ranges>
#include <set>
#include <sstream>

namespace rha::analyzers {

    namespace {

        /**
         * True if (candidate, who) is newer than the current holder. Equal
         * timestamps go to the lexicographically smaller name so the result
         * does not depend on processing order.
         */
        bool supersedes(const Timestamp candidate, const std::string& who,
                        const std::optional<Timestamp>& current, const std::string& current_who) {
            if (!current) {
                return true;
            }
            if (candidate != *current) {
                return candidate > *current;
            }
            return who < current_who;
        }

        void widen(std::optional<Timestamp>& first, std::optional<Timestamp>& last, const Timestamp timestamp) {
            if (!first || timestamp < *first) {
                first = timestamp;
            }
            if (!last || timestamp > *last) {
                last = timestamp;
            }
        }

    }  // namespace

    LocalTime to_local_time(const Timestamp timestamp, const int offset_minutes) {
        using namespace std::chrono;

        const auto local = timestamp + minutes(offset_minutes);
        const auto day = floor<days>(local);
        const year_month_day ymd{day};
        const weekday wd{day};

        LocalTime result;
        result.year = static_cast<int>(ymd.year());
        result.month = static_cast<unsigned>(ymd.month());
        result.day = static_cast<unsigned>(ymd.day());
        result.hour = static_cast<unsigned>(duration_cast<hours>(local - day).count());
        result.weekday = wd.iso_encoding() - 1;

        std::ostringstream month_key;
        month_key << std::setfill('0') << std::setw(4) << result.year << '-' << std::setw(2) << result.month;
        result.year_month = month_key.str();

        std::ostringstream date_key;
        date_key << result.year_month << '-' << std::setfill('0') << std::setw(2) << result.day;
        result.date = date_key.str();
        return result;
    }

    std::string email_domain(const std::string_view email) {
        const auto at = email.rfind('@');
        if (at == std::string_view::npos || at + 1 >= email.size()) {
            return "unknown";
        }
        return string_utils::to_lower(string_utils::trim(email.substr(at + 1)));
    }

    Aggregator::Aggregator(FilterConfig filter, const std::size_t change_set_window)
        : filter_(std::move(filter)), change_set_window_(change_set_window) {}

    bool Aggregator::includes(const std::string& path) const {
        return should_include_file(path, filter_);
    }

    void Aggregator::add_commit(const CommitRecord& commit) {
        const auto local = to_local_time(commit.timestamp, commit.timezone_offset_minutes);
        const auto added = commit.lines_added();
        const auto removed = commit.lines_removed();

        authors_.update(commit.author, [&](AuthorStatistics& author) {
            if (author.name.empty()) {
                author.name = commit.author;
            }
            if (supersedes(commit.timestamp, commit.author_email, author.last_commit, author.email)) {
                author.email = commit.author_email;
            }
            ++author.total_commits;
            author.lines_added += added;
            author.lines_removed += removed;
            widen(author.first_commit, author.last_commit, commit.timestamp);
            author.active_days.insert(local.date);
            for (const auto& change : commit.files_changed) {
                author.modified_files.insert(change.path);
            }
            ++author.commits_by_month[local.year_month];
            ++author.commits_by_year[local.year];
        });

        {
            std::lock_guard lock(mutex_);
            ++total_commits_;
            lines_added_ += added;
            lines_removed_ += removed;
            widen(first_commit_, last_commit_, commit.timestamp);
            active_days_.insert(local.date);

            ++activity_.by_hour[local.hour];
            ++activity_.by_weekday[local.weekday];
            ++activity_.by_month[local.month - 1];
            ++activity_.by_year_month[local.year_month];
            ++activity_.by_year[local.year];
            ++activity_.by_email_domain[email_domain(commit.author_email)];
            ++activity_.by_timezone[commit.timezone_offset_minutes];
        }

        std::set<std::string> touched_directories;
        std::vector<std::string> change_set;
        for (const auto& change : commit.files_changed) {
            if (!includes(change.path)) {
                continue;
            }
            touch_file(change.path, commit, change);
            change_set.push_back(change.path);

            const auto directory = package_of(change.path);
            directories_.update(directory, [&](DirectoryStatistics& stats) {
                stats.lines_added += change.lines_added;
                stats.lines_removed += change.lines_removed;
                stats.files.insert(change.path);
            });
            touched_directories.insert(directory);
        }
        for (const auto& directory : touched_directories) {
            directories_.update(directory, [](DirectoryStatistics& stats) { ++stats.commits; });
        }
        if (!change_set.empty()) {
            remember_change_set(commit.timestamp, std::move(change_set));
        }
    }

    void Aggregator::remember_change_set(const Timestamp when, std::vector<std::string> paths) {
        if (change_set_window_ == 0) {
            return;
        }
        std::ranges::sort(paths);
        const auto [first, last] = std::ranges::unique(paths);
        paths.erase(first, last);

        std::lock_guard lock(mutex_);
        change_sets_.emplace_back(when, std::move(paths));
        if (change_sets_.size() > 2 * change_set_window_) {
            std::ranges::stable_sort(change_sets_, std::greater<>{}, [](const auto& entry) { return entry.first; });
            change_sets_.resize(change_set_window_);
        }
    }

    void Aggregator::touch_file(const std::string& path, const CommitRecord& commit, const FileChange& change) {
        files_.update(path, [&](FileStatistics& file) {
            if (file.path.empty()) {
                file.path = path;
            }
            ++file.revision_count;
            file.lines_added += change.lines_added;
            file.lines_removed += change.lines_removed;
            if (supersedes(commit.timestamp, commit.author, file.last_modified, file.last_modified_by)) {
                file.last_modified = commit.timestamp;
                file.last_modified_by = commit.author;
            }
        });
    }

    bool Aggregator::add_tracked_file(const std::string& path) {
        if (!includes(path)) {
            return false;
        }
        auto extension = string_utils::extension_of(path);
        if (extension.empty()) {
            extension = std::string(string_utils::basename(path));
        }

        std::lock_guard lock(mutex_);
        ++extension_histogram_[extension];
        ++tracked_files_;
        return true;
    }

    void Aggregator::record_file_analysis(const FileAnalysis& analysis) {
        code_metrics_.update(analysis.path, [&](CodeMetrics& metrics) {
            metrics = analysis.metrics;
        });
        files_.update(analysis.path, [&](FileStatistics& file) {
            if (file.path.empty()) {
                file.path = analysis.path;
            }
            file.current_size = analysis.size_bytes;
            file.max_size = std::max(file.max_size, analysis.size_bytes);
            file.line_count = analysis.metrics.loc_physical;
        });
    }

    void Aggregator::set_coupling(CouplingReport report) {
        std::lock_guard lock(mutex_);
        coupling_ = std::move(report.files);
        package_coupling_ = std::move(report.packages);
    }

    void Aggregator::set_branches(const std::vector<BranchInfo>& branches) {
        std::lock_guard lock(mutex_);
        branches_.clear();
        for (const auto& branch : branches) {
            branches_[branch.name] = branch;
        }
    }

    void Aggregator::set_identity(std::string project_name, std::string main_branch) {
        std::lock_guard lock(mutex_);
        project_name_ = std::move(project_name);
        main_branch_ = std::move(main_branch);
    }

    RepositoryData Aggregator::snapshot() const {
        RepositoryData data;
        data.authors = authors_.snapshot();
        data.files = files_.snapshot();
        data.directories = directories_.snapshot();
        data.code_metrics = code_metrics_.snapshot();

        {
            std::lock_guard lock(mutex_);
            data.project_name = project_name_;
            data.main_branch = main_branch_;
            data.activity = activity_;
            data.extension_histogram = extension_histogram_;
            data.coupling = coupling_;
            data.package_coupling = package_coupling_;
            data.branches = branches_;
            data.active_days = active_days_;
            data.first_commit = first_commit_;
            data.last_commit = last_commit_;
            data.total_commits = total_commits_;
            data.total_lines_added = lines_added_;
            data.total_lines_removed = lines_removed_;
            data.total_files = tracked_files_;

            auto recent = change_sets_;
            std::ranges::stable_sort(recent, std::greater<>{}, [](const auto& entry) { return entry.first; });
            if (recent.size() > change_set_window_) {
                recent.resize(change_set_window_);
            }
            data.recent_change_sets.reserve(recent.size());
            for (auto& entry : recent) {
                data.recent_change_sets.push_back(std::move(entry.second));
            }
        }

        data.total_authors = data.authors.size();
        for (const auto& metrics : data.code_metrics | std::views::values) {
            if (!metrics.valid) {
                continue;
            }
            data.total_lines += metrics.loc_physical;
            data.total_program_lines += metrics.loc_program;
            data.total_comment_lines += metrics.loc_comment;
            data.total_blank_lines += metrics.loc_blank;
        }
        if (data.first_commit && data.last_commit) {
            data.age_days = static_cast<std::size_t>(
                std::chrono::floor<std::chrono::days>(*data.last_commit - *data.first_commit).count());
        }
        return data;
    }

}  // namespace rha::analyzers
