#include "rha/git/history_extractor.hpp"

#include "rha/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <utility>

namespace rha::git {

    namespace {

        namespace su = string_utils;

        constexpr std::array<std::string_view, 4> default_branch_candidates = {
            "main", "master", "develop", "development"
        };

        constexpr std::string_view remote_head_prefix = "refs/remotes/origin/";

        bool is_hex_hash(const std::string_view s) noexcept {
            if (s.size() < 7) {
                return false;
            }
            return std::ranges::all_of(s, [](const unsigned char c) {
                return std::isxdigit(c) != 0;
            });
        }

        /**
         * First line of command output, for error context.
         */
        std::string first_line(const std::string_view output) {
            const auto end = output.find('\n');
            return std::string(su::trim(output.substr(0, end)));
        }

        Result<FileChange> parse_numstat_line(const std::string_view line) {
            const auto parts = su::split(line, '\t');
            if (parts.size() < 3) {
                return Result<FileChange>::failure(
                    Error::parse_error("Malformed numstat line", std::string(line)));
            }

            FileChange change;
            // A path may itself contain tabs only when quoted, so rejoin defensively
            std::string path(parts[2]);
            for (std::size_t i = 3; i < parts.size(); ++i) {
                path += '\t';
                path += parts[i];
            }
            change.path = unquote_path(path);

            if (parts[0] == "-" && parts[1] == "-") {
                change.binary = true;
                return Result<FileChange>::success(std::move(change));
            }

            const auto added = su::parse_size(parts[0]);
            const auto removed = su::parse_size(parts[1]);
            if (!added || !removed || change.path.empty()) {
                return Result<FileChange>::failure(
                    Error::parse_error("Malformed numstat line", std::string(line)));
            }
            change.lines_added = *added;
            change.lines_removed = *removed;
            return Result<FileChange>::success(std::move(change));
        }

        std::set<std::string> parse_name_list(const std::string_view output) {
            std::set<std::string> names;
            for (const auto line : su::split_lines(output)) {
                if (auto name = su::trim(line); !name.empty()) {
                    names.emplace(name);
                }
            }
            return names;
        }

    }  // namespace

    std::optional<int> parse_timezone_offset(const std::string_view text) noexcept {
        if (text.size() != 5 || (text[0] != '+' && text[0] != '-')) {
            return std::nullopt;
        }
        const auto hours = su::parse_size(text.substr(1, 2));
        const auto minutes = su::parse_size(text.substr(3, 2));
        if (!hours || !minutes || *minutes >= 60) {
            return std::nullopt;
        }
        const int total = static_cast<int>(*hours * 60 + *minutes);
        return text[0] == '-' ? -total : total;
    }

    std::string unquote_path(const std::string_view path) {
        if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
            return std::string(path);
        }

        std::string result;
        const auto inner = path.substr(1, path.size() - 2);
        for (std::size_t i = 0; i < inner.size(); ++i) {
            const char c = inner[i];
            if (c != '\\' || i + 1 >= inner.size()) {
                result += c;
                continue;
            }
            const char esc = inner[++i];
            switch (esc) {
                case 'n':  result += '\n'; break;
                case 't':  result += '\t'; break;
                case '"':  result += '"';  break;
                case '\\': result += '\\'; break;
                default:
                    // Octal byte escape, e.g. \303\251
                    if (esc >= '0' && esc <= '7' && i + 2 < inner.size()) {
                        const int value = (esc - '0') * 64 + (inner[i + 1] - '0') * 8 + (inner[i + 2] - '0');
                        result += static_cast<char>(value);
                        i += 2;
                    } else {
                        result += esc;
                    }
                    break;
            }
        }
        return result;
    }

    Result<CommitRecord> parse_commit_record(const std::string_view record) {
        const auto lines = su::split_lines(record);

        auto it = std::ranges::find_if(lines, [](const std::string_view line) {
            return !su::trim(line).empty();
        });
        if (it == lines.end()) {
            return Result<CommitRecord>::failure(Error::parse_error("Empty commit record"));
        }

        const std::string_view header = *it;
        auto fields = su::split(header, '\t');
        if (fields.size() < 6) {
            return Result<CommitRecord>::failure(
                Error::parse_error("Commit header has " + std::to_string(fields.size()) + " fields, expected 6",
                                   std::string(header.substr(0, 80))));
        }

        CommitRecord commit;
        commit.hash = std::string(su::trim(fields[0]));
        if (!is_hex_hash(commit.hash)) {
            return Result<CommitRecord>::failure(
                Error::parse_error("Invalid commit hash", commit.hash));
        }

        commit.author = std::string(fields[1]);
        commit.author_email = std::string(fields[2]);

        const auto seconds = su::parse_int(fields[3]);
        if (!seconds) {
            return Result<CommitRecord>::failure(
                Error::parse_error("Invalid commit timestamp", std::string(fields[3])));
        }
        commit.timestamp = Timestamp(std::chrono::seconds(*seconds));

        // "%ai" is "YYYY-MM-DD HH:MM:SS +HHMM"; only the offset is needed
        const auto iso = su::trim(fields[4]);
        const auto space = iso.rfind(' ');
        const auto offset = parse_timezone_offset(space == std::string_view::npos ? iso : iso.substr(space + 1));
        if (!offset) {
            return Result<CommitRecord>::failure(
                Error::parse_error("Invalid author date", std::string(iso)));
        }
        commit.timezone_offset_minutes = *offset;

        // Subject may contain tabs; everything after the fifth separator belongs to it
        std::string subject(fields[5]);
        for (std::size_t i = 6; i < fields.size(); ++i) {
            subject += '\t';
            subject += fields[i];
        }
        commit.message = std::move(subject);

        for (++it; it != lines.end(); ++it) {
            const auto line = *it;
            if (su::trim(line).empty()) {
                continue;
            }
            auto change = parse_numstat_line(line);
            if (change.is_err()) {
                return Result<CommitRecord>::failure(change.error().with_context("commit " + commit.hash));
            }
            commit.files_changed.push_back(std::move(change.value()));
        }

        return Result<CommitRecord>::success(std::move(commit));
    }

    // =============================================================================
    // CommitStream
    // =============================================================================

    CommitStream::CommitStream(std::string raw_log)
        : raw_(std::move(raw_log)) {
        offset_ = first_record_offset();
    }

    std::size_t CommitStream::first_record_offset() const noexcept {
        const auto pos = raw_.find(record_separator);
        return pos == std::string::npos ? raw_.size() : pos;
    }

    std::optional<Result<CommitRecord>> CommitStream::next() {
        if (at_end()) {
            return std::nullopt;
        }

        const std::size_t begin = offset_ + 1;
        std::size_t end = raw_.find(record_separator, begin);
        if (end == std::string::npos) {
            end = raw_.size();
        }
        offset_ = end;

        return parse_commit_record(std::string_view(raw_).substr(begin, end - begin));
    }

    // =============================================================================
    // HistoryExtractor
    // =============================================================================

    HistoryExtractor::HistoryExtractor(ICommandRunner& runner,
                                       const std::chrono::seconds timeout,
                                       const CancellationToken* cancel)
        : runner_(runner)
        , timeout_(timeout)
        , cancel_(cancel) {}

    Result<std::string> HistoryExtractor::run_checked(const std::vector<std::string>& args) {
        auto result = runner_.run(args, timeout_, cancel_);
        if (result.is_err()) {
            return Result<std::string>::failure(result.error());
        }
        if (!result.value().success()) {
            return Result<std::string>::failure(Error::extraction_error(
                format_command(args) + " exited with code " + std::to_string(result.value().exit_code),
                first_line(result.value().output)));
        }
        return Result<std::string>::success(std::move(result.value().output));
    }

    void HistoryExtractor::append_scope(std::vector<std::string>& args, const HistoryQuery& query) {
        if (query.since) {
            args.push_back("--since=" + *query.since);
        }
        if (query.scope == BranchScope::AllBranches) {
            args.emplace_back("--all");
        } else {
            args.emplace_back("--first-parent");
            args.push_back(query.branch);
        }
        args.emplace_back("--");
    }

    Result<void> HistoryExtractor::validate_repository(const std::chrono::seconds timeout) {
        const fs::path& root = runner_.working_directory();
        auto result = runner_.run({"rev-parse", "--is-inside-work-tree"}, timeout, cancel_);
        if (result.is_err()) {
            if (result.error().code() == ErrorCode::Cancelled) {
                return Result<void>::failure(result.error());
            }
            return Result<void>::failure(
                Error::validation_error("Not a git repository: " + result.error().message(), root.string()));
        }
        if (!result.value().success() || su::trim(result.value().output) != "true") {
            return Result<void>::failure(
                Error::validation_error("Not a git repository", root.string()));
        }
        return Result<void>::success();
    }

    Result<std::string> HistoryExtractor::resolve_default_branch() {
        auto remote_head = runner_.run({"symbolic-ref", "refs/remotes/origin/HEAD"}, timeout_, cancel_);
        if (remote_head.is_err()) {
            return Result<std::string>::failure(remote_head.error());
        }
        if (remote_head.value().success()) {
            auto ref = su::trim(remote_head.value().output);
            if (ref.starts_with(remote_head_prefix)) {
                ref.remove_prefix(remote_head_prefix.size());
            }
            if (!ref.empty()) {
                spdlog::debug("Default branch from origin/HEAD: {}", ref);
                return Result<std::string>::success(std::string(ref));
            }
        }

        auto current = runner_.run({"rev-parse", "--abbrev-ref", "HEAD"}, timeout_, cancel_);
        if (current.is_err()) {
            return Result<std::string>::failure(current.error());
        }
        if (current.value().success()) {
            if (const auto name = su::trim(current.value().output); !name.empty() && name != "HEAD") {
                spdlog::debug("Default branch from checked-out HEAD: {}", name);
                return Result<std::string>::success(std::string(name));
            }
        }

        auto listing = runner_.run({"branch", "--format=%(refname:short)"}, timeout_, cancel_);
        if (listing.is_err()) {
            return Result<std::string>::failure(listing.error());
        }
        if (listing.value().success()) {
            const auto branches = parse_name_list(listing.value().output);
            for (const auto candidate : default_branch_candidates) {
                if (branches.contains(std::string(candidate))) {
                    spdlog::debug("Default branch from candidate list: {}", candidate);
                    return Result<std::string>::success(std::string(candidate));
                }
            }
        }

        spdlog::debug("Default branch could not be determined, assuming master");
        return Result<std::string>::success("master");
    }

    Result<CommitStream> HistoryExtractor::extract_commits(const HistoryQuery& query) {
        std::vector<std::string> args = {
            "-c", "core.quotePath=false",
            "log", "--numstat", "--no-renames", "--no-color", std::string(log_format)
        };
        append_scope(args, query);

        auto output = run_checked(args);
        if (output.is_err()) {
            return Result<CommitStream>::failure(output.error());
        }
        return Result<CommitStream>::success(CommitStream(std::move(output.value())));
    }

    Result<std::size_t> HistoryExtractor::count_revisions(const HistoryQuery& query) {
        std::vector<std::string> args = {"rev-list", "--count"};
        append_scope(args, query);

        auto output = run_checked(args);
        if (output.is_err()) {
            return Result<std::size_t>::failure(output.error());
        }
        const auto count = su::parse_size(output.value());
        if (!count) {
            return Result<std::size_t>::failure(
                Error::parse_error("Unexpected rev-list output", first_line(output.value())));
        }
        return Result<std::size_t>::success(*count);
    }

    Result<std::vector<BranchInfo>> HistoryExtractor::list_branches(const std::string& default_branch) {
        auto refs = run_checked({
            "for-each-ref",
            "--format=%(refname:short)%09%(committerdate:unix)%09%(authorname)",
            "refs/heads"
        });
        if (refs.is_err()) {
            return Result<std::vector<BranchInfo>>::failure(refs.error());
        }

        std::set<std::string> merged;
        if (auto merged_output = runner_.run({"branch", "--merged", default_branch, "--format=%(refname:short)"},
                                             timeout_, cancel_);
            merged_output.is_err()) {
            return Result<std::vector<BranchInfo>>::failure(merged_output.error());
        } else if (merged_output.value().success()) {
            merged = parse_name_list(merged_output.value().output);
        } else {
            spdlog::warn("Could not determine merged branches against '{}'", default_branch);
        }

        std::vector<BranchInfo> branches;
        for (const auto line : su::split_lines(refs.value())) {
            if (su::trim(line).empty()) {
                continue;
            }
            const auto fields = su::split(line, '\t');

            BranchInfo info;
            info.name = std::string(fields[0]);
            if (fields.size() > 1) {
                if (const auto seconds = su::parse_int(fields[1])) {
                    info.last_commit_date = Timestamp(std::chrono::seconds(*seconds));
                }
            }
            if (fields.size() > 2) {
                info.last_commit_author = std::string(fields[2]);
            }
            info.is_merged = info.name != default_branch && merged.contains(info.name);

            auto count = run_checked({"rev-list", "--count", info.name, "--"});
            if (count.is_err()) {
                return Result<std::vector<BranchInfo>>::failure(count.error());
            }
            info.commit_count = su::parse_size(count.value()).value_or(0);

            branches.push_back(std::move(info));
        }

        return Result<std::vector<BranchInfo>>::success(std::move(branches));
    }

    Result<std::vector<std::string>> HistoryExtractor::list_tracked_files() {
        auto output = run_checked({"ls-files", "-z"});
        if (output.is_err()) {
            return Result<std::vector<std::string>>::failure(output.error());
        }

        std::vector<std::string> files;
        for (const auto entry : su::split(output.value(), '\0')) {
            if (!entry.empty()) {
                files.emplace_back(entry);
            }
        }
        return Result<std::vector<std::string>>::success(std::move(files));
    }

    Result<std::string> HistoryExtractor::git_version() {
        auto output = run_checked({"--version"});
        if (output.is_err()) {
            return Result<std::string>::failure(output.error());
        }
        return Result<std::string>::success(std::string(su::trim(output.value())));
    }

}  // namespace rha::git
