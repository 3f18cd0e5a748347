#include "rha/cli/formatter.hpp"
#include "rha/cli/progress.hpp"
#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <ranges>
#include <sstream>

namespace rha::cli
{
    namespace {

        bool g_color = true;

        constexpr std::size_t label_width = 22;
        constexpr const char* weekday_names[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

        const char* escape_for(const Tone tone) noexcept {
            switch (tone) {
                case Tone::Plain:   return "";
                case Tone::Strong:  return "\033[1m";
                case Tone::Muted:   return "\033[2m";
                case Tone::Good:    return "\033[32m";
                case Tone::Info:    return "\033[36m";
                case Tone::Warning: return "\033[33m";
                case Tone::Bad:     return "\033[31m";
            }
            return "";
        }

        template<typename T, typename Less>
        std::vector<const T*> top_entries(const std::vector<const T*>& all, const std::size_t limit, Less less) {
            std::vector<const T*> ranked = all;
            const auto keep = std::min(limit, ranked.size());
            std::ranges::partial_sort(ranked, ranked.begin() + static_cast<std::ptrdiff_t>(keep), less);
            ranked.resize(keep);
            return ranked;
        }

    }  // namespace

    void set_color_enabled(const bool enabled) {
        g_color = enabled;
    }

    bool color_enabled() {
        return g_color && stdout_is_terminal();
    }

    std::string styled(const std::string& text, const Tone tone) {
        if (tone == Tone::Plain || !color_enabled()) {
            return text;
        }
        return escape_for(tone) + text + "\033[0m";
    }

    Tone tone_of(const MaintainabilityStatus status) noexcept {
        switch (status) {
            case MaintainabilityStatus::Good:      return Tone::Good;
            case MaintainabilityStatus::Moderate:  return Tone::Info;
            case MaintainabilityStatus::Difficult: return Tone::Warning;
            case MaintainabilityStatus::Critical:  return Tone::Bad;
        }
        return Tone::Plain;
    }

    Tone tone_of(const DesignZone zone) noexcept {
        switch (zone) {
            case DesignZone::MainSequence:        return Tone::Good;
            case DesignZone::Moderate:            return Tone::Info;
            case DesignZone::FarFromMainSequence: return Tone::Warning;
            case DesignZone::ZoneOfPain:
            case DesignZone::ZoneOfUselessness:   return Tone::Bad;
            case DesignZone::NotApplicable:       return Tone::Muted;
        }
        return Tone::Plain;
    }

    Tone tone_of(const RiskLevel level) noexcept {
        switch (level) {
            case RiskLevel::Low:      return Tone::Good;
            case RiskLevel::Medium:   return Tone::Info;
            case RiskLevel::High:     return Tone::Warning;
            case RiskLevel::Critical: return Tone::Bad;
        }
        return Tone::Plain;
    }

    Tone tone_of_score(const double score) noexcept {
        if (score >= 75.0) return Tone::Good;
        if (score >= 50.0) return Tone::Warning;
        return Tone::Bad;
    }

    // ============================================================================
    // Table
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(std::vector<std::string> cells) {
        cells.resize(columns_.size());
        for (std::size_t i = 0; i < cells.size(); ++i) {
            const auto limit = columns_[i].max_width;
            if (limit > 3 && cells[i].size() > limit) {
                cells[i] = cells[i].substr(0, limit - 3) + "...";
            }
        }
        rows_.push_back(std::move(cells));
    }

    void Table::print(std::ostream& out) const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t width = columns_[i].title.size();
            for (const auto& row : rows_) {
                width = std::max(width, row[i].size());
            }
            widths.push_back(width);
        }

        const auto emit = [&](const std::vector<std::string>& cells, const Tone tone) {
            for (std::size_t i = 0; i < cells.size(); ++i) {
                std::ostringstream cell;
                cell << (columns_[i].align == Align::Left ? std::left : std::right)
                     << std::setw(static_cast<int>(widths[i])) << cells[i];
                out << (i == 0 ? "" : "  ") << styled(cell.str(), tone);
            }
            out << "\n";
        };

        std::vector<std::string> titles;
        std::vector<std::string> rules;
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            titles.push_back(columns_[i].title);
            rules.emplace_back(widths[i], '-');
        }
        emit(titles, Tone::Strong);
        emit(rules, Tone::Plain);
        for (const auto& row : rows_) {
            emit(row, Tone::Plain);
        }
    }

    // ============================================================================
    // Value formatting
    // ============================================================================

    std::string format_fixed(const double value, const int precision) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        return ss.str();
    }

    std::string format_count(const std::size_t count) {
        const std::string digits = std::to_string(count);
        std::string grouped;
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i > 0 && (digits.size() - i) % 3 == 0) {
                grouped += ',';
            }
            grouped += digits[i];
        }
        return grouped;
    }

    std::string format_share(const std::size_t part, const std::size_t whole) {
        const double share = whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
        return format_fixed(share, 1) + "%";
    }

    std::string format_date(const Timestamp ts) {
        const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(ts)};
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.day());
        return ss.str();
    }

    std::string format_elapsed(const Duration elapsed) {
        using namespace std::chrono;
        const auto ms = std::max<long long>(0, duration_cast<milliseconds>(elapsed).count());
        if (ms >= 60'000) {
            return std::to_string(ms / 60'000) + "m " + std::to_string(ms / 1000 % 60) + "s";
        }
        if (ms >= 1000) {
            return format_fixed(static_cast<double>(ms) / 1000.0, 2) + "s";
        }
        return std::to_string(ms) + "ms";
    }

    std::string shorten_path(const std::string& path, const std::size_t max_width) {
        if (path.size() <= max_width || max_width <= 3) {
            return path;
        }
        return "..." + path.substr(path.size() - (max_width - 3));
    }

    std::string histogram_bar(const std::size_t value, const std::size_t peak, const std::size_t width) {
        const std::size_t filled = peak == 0 ? 0 : value * width / peak;
        if (!color_enabled()) {
            return std::string(filled, '#') + std::string(width - filled, '.');
        }
        std::string bar;
        for (std::size_t i = 0; i < filled; ++i) {
            bar += "█";
        }
        return styled(bar, Tone::Info) + std::string(width - filled, ' ');
    }

    // ============================================================================
    // SummaryPrinter
    // ============================================================================

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::section(const std::string& title) const {
        out_ << "\n" << styled(title, Tone::Strong) << "\n" << std::string(60, '-') << "\n";
    }

    void SummaryPrinter::field(const std::string& name, const std::string& value) const {
        out_ << std::left << std::setw(static_cast<int>(label_width)) << (name + ":") << value << "\n";
    }

    void SummaryPrinter::print_overview(const RepositoryData& data) const {
        out_ << "\n" << styled("Repository: " + data.project_name, Tone::Strong) << "\n"
             << std::string(60, '=') << "\n\n";

        field("Main Branch", data.main_branch);
        field("Commits", format_count(data.total_commits));
        field("Authors", format_count(data.total_authors));
        field("Branches", format_count(data.branches.size()));
        field("Files", format_count(data.total_files));
        field("Lines of Code", format_count(data.total_lines) + " (" + format_count(data.total_program_lines)
              + " program, " + format_count(data.total_comment_lines) + " comment, "
              + format_count(data.total_blank_lines) + " blank)");
        field("Lines Added/Removed",
              "+" + format_count(data.total_lines_added) + " / -" + format_count(data.total_lines_removed));
        if (data.first_commit && data.last_commit) {
            field("History", format_date(*data.first_commit) + " .. " + format_date(*data.last_commit) + " ("
                  + format_count(data.age_days) + " days, " + format_count(data.active_days.size()) + " active)");
        }
    }

    void SummaryPrinter::print_authors(const RepositoryData& data, const std::size_t limit) const {
        std::vector<const AuthorStatistics*> all;
        for (const auto& author : data.authors | std::views::values) {
            all.push_back(&author);
        }
        if (all.empty()) return;
        section("Top Contributors");

        const auto ranked = top_entries(all, limit, [](const AuthorStatistics* a, const AuthorStatistics* b) {
            if (a->total_commits != b->total_commits) {
                return a->total_commits > b->total_commits;
            }
            return a->name < b->name;
        });

        Table table({
            {"Author", Align::Left, 28},
            {"Commits"},
            {"Share"},
            {"+Lines"},
            {"-Lines"},
            {"Files"},
            {"Active Days"},
        });
        for (const auto* author : ranked) {
            table.add_row({
                author->name,
                format_count(author->total_commits),
                format_share(author->total_commits, data.total_commits),
                format_count(author->lines_added),
                format_count(author->lines_removed),
                format_count(author->modified_files.size()),
                format_count(author->active_days.size()),
            });
        }
        table.print(out_);
    }

    void SummaryPrinter::print_most_changed(const RepositoryData& data, const std::size_t limit) const {
        std::vector<const FileStatistics*> all;
        for (const auto& file : data.files | std::views::values) {
            if (file.revision_count > 0) {
                all.push_back(&file);
            }
        }
        if (all.empty()) return;
        section("Most Changed Files");

        const auto ranked = top_entries(all, limit, [](const FileStatistics* a, const FileStatistics* b) {
            if (a->revision_count != b->revision_count) {
                return a->revision_count > b->revision_count;
            }
            return a->path < b->path;
        });

        Table table({
            {"File", Align::Left},
            {"Revisions"},
            {"Lines"},
            {"Last Author", Align::Left, 24},
        });
        for (const auto* file : ranked) {
            table.add_row({
                shorten_path(file->path, 48),
                format_count(file->revision_count),
                format_count(file->line_count),
                file->last_modified_by,
            });
        }
        table.print(out_);
    }

    void SummaryPrinter::print_hotspots(const std::vector<Hotspot>& hotspots, const HotspotSummary& summary,
                                        const std::size_t limit) const {
        if (hotspots.empty()) return;
        section("Hotspots");

        const auto level = [](const RiskLevel l, const std::size_t n) {
            return styled(to_string(l), tone_of(l)) + " " + std::to_string(n);
        };
        field("Risk Levels", level(RiskLevel::Critical, summary.critical) + "  "
              + level(RiskLevel::High, summary.high) + "  "
              + level(RiskLevel::Medium, summary.medium) + "  "
              + level(RiskLevel::Low, summary.low));
        field("Change Coupled", format_count(summary.files_with_coupling) + " of "
              + format_count(summary.files_analyzed) + " files");
        out_ << "\n";

        Table table({
            {"File", Align::Left},
            {"Risk"},
            {"Level", Align::Left},
            {"Churn"},
            {"Complexity"},
            {"Revisions"},
            {"Coupled With", Align::Left, 32},
        });
        for (const auto& hotspot : hotspots | std::views::take(limit)) {
            std::string partners;
            for (const auto& partner : hotspot.coupled_files | std::views::take(2)) {
                if (!partners.empty()) {
                    partners += ", ";
                }
                partners += std::string(string_utils::basename(partner.path)) + " ("
                            + format_fixed(partner.strength * 100.0, 0) + "%)";
            }
            table.add_row({
                shorten_path(hotspot.path, 40),
                format_fixed(hotspot.risk_score, 1),
                to_string(hotspot.risk_level),
                format_fixed(hotspot.churn_score, 0),
                format_fixed(hotspot.complexity_score, 0),
                format_count(hotspot.revisions),
                partners,
            });
        }
        table.print(out_);
    }

    void SummaryPrinter::print_code_quality(const RepositoryData& data, const std::size_t limit) const {
        using Entry = std::pair<const std::string, CodeMetrics>;
        std::vector<const Entry*> all;
        for (const auto& entry : data.code_metrics) {
            if (entry.second.valid) {
                all.push_back(&entry);
            }
        }
        if (all.empty()) return;
        section("Least Maintainable Files");

        const auto ranked = top_entries(all, limit, [](const Entry* a, const Entry* b) {
            if (a->second.maintainability_index_raw != b->second.maintainability_index_raw) {
                return a->second.maintainability_index_raw < b->second.maintainability_index_raw;
            }
            return a->first < b->first;
        });

        Table table({
            {"File", Align::Left},
            {"Language", Align::Left},
            {"LOC"},
            {"CC"},
            {"Volume"},
            {"MI"},
            {"Status", Align::Left},
        });
        for (const auto* entry : ranked) {
            const auto& metrics = entry->second;
            table.add_row({
                shorten_path(entry->first, 40),
                to_string(metrics.language),
                format_count(metrics.loc_physical),
                format_count(metrics.cyclomatic_complexity),
                format_fixed(metrics.volume, 0),
                format_fixed(metrics.maintainability_index, 1),
                to_string(metrics.maintainability_status),
            });
        }
        table.print(out_);
    }

    void SummaryPrinter::print_coupling(const RepositoryData& data, const std::size_t limit) const {
        using Entry = std::pair<const std::string, CouplingMetrics>;
        std::vector<const Entry*> all;
        for (const auto& entry : data.package_coupling) {
            all.push_back(&entry);
        }
        if (all.empty()) return;
        section("Package Design Quality");

        const auto ranked = top_entries(all, limit, [](const Entry* a, const Entry* b) {
            if (a->second.distance != b->second.distance) {
                return a->second.distance > b->second.distance;
            }
            return a->first < b->first;
        });

        Table table({
            {"Package", Align::Left},
            {"Classes"},
            {"Ca"},
            {"Ce"},
            {"I"},
            {"A"},
            {"D"},
            {"Zone", Align::Left},
        });
        for (const auto* entry : ranked) {
            const auto& metrics = entry->second;
            table.add_row({
                shorten_path(entry->first, 32),
                format_count(metrics.class_count),
                format_count(metrics.afferent),
                format_count(metrics.efferent),
                format_fixed(metrics.instability, 2),
                format_fixed(metrics.abstractness, 2),
                format_fixed(metrics.distance, 2),
                to_string(metrics.zone),
            });
        }
        table.print(out_);
    }

    void SummaryPrinter::print_activity(const RepositoryData& data) const {
        if (data.total_commits == 0) return;
        section("Commits by Weekday");

        const auto& by_weekday = data.activity.by_weekday;
        const auto peak = *std::ranges::max_element(by_weekday);
        for (std::size_t day = 0; day < by_weekday.size(); ++day) {
            out_ << weekday_names[day] << "  " << histogram_bar(by_weekday[day], peak, 30)
                 << "  " << format_count(by_weekday[day]) << "\n";
        }

        if (!data.extension_histogram.empty()) {
            section("File Types");
            Table table({{"Extension", Align::Left}, {"Files"}});
            for (const auto& [extension, count] : data.extension_histogram) {
                table.add_row({extension, format_count(count)});
            }
            table.print(out_);
        }
    }

    void SummaryPrinter::print_health(const ProjectHealthMetrics& health) const {
        section("Project Health");

        field("Code Quality Score",
              styled(format_fixed(health.code_quality_score, 1), tone_of_score(health.code_quality_score)) + " / 100");
        field("Bus Factor", std::to_string(health.bus_factor));
        field("Average Complexity", format_fixed(health.average_complexity, 2));
        field("Average MI", format_fixed(health.average_maintainability_index, 1));
        field("Large Files", format_count(health.large_files_count));
        field("Complex Files", format_count(health.complex_files_count));

        const auto status = [](const MaintainabilityStatus s, const std::size_t n) {
            return styled(to_string(s), tone_of(s)) + " " + std::to_string(n);
        };
        const auto zone = [](const DesignZone z, const std::size_t n) {
            return styled(to_string(z), tone_of(z)) + " " + std::to_string(n);
        };
        out_ << "\n";
        field("Maintainability", status(MaintainabilityStatus::Good, health.good_files) + "  "
              + status(MaintainabilityStatus::Moderate, health.moderate_files) + "  "
              + status(MaintainabilityStatus::Difficult, health.difficult_files) + "  "
              + status(MaintainabilityStatus::Critical, health.critical_files));
        field("Design Zones", zone(DesignZone::MainSequence, health.main_sequence_files) + "  "
              + zone(DesignZone::ZoneOfPain, health.zone_of_pain_files) + "  "
              + zone(DesignZone::ZoneOfUselessness, health.zone_of_uselessness_files));
        field("Average Distance", format_fixed(health.average_distance, 2));

        if (!health.recommendations.empty()) {
            section("Recommendations");
            for (const auto& recommendation : health.recommendations) {
                out_ << "  " << styled("*", Tone::Warning) << " " << recommendation << "\n";
            }
        }
        out_ << "\n";
    }

    void SummaryPrinter::print_diagnostics(const AnalysisDiagnostics& diagnostics, const bool verbose) const {
        const bool has_problems = diagnostics.parse_errors > 0 || !diagnostics.skipped_files.empty()
                                  || !diagnostics.dependency_cycles.empty();
        if (!has_problems && !verbose) return;
        section("Diagnostics");

        field("Malformed Records", std::to_string(diagnostics.parse_errors));
        field("Skipped Files", std::to_string(diagnostics.skipped_files.size()));
        field("Dependency Cycles", std::to_string(diagnostics.dependency_cycles.size()));

        if (verbose) {
            for (const auto& sample : diagnostics.parse_error_samples) {
                out_ << "  malformed " << sample << "\n";
            }
            for (const auto& skipped : diagnostics.skipped_files) {
                out_ << "  skipped " << skipped.path << ": " << skipped.reason << "\n";
            }
            for (const auto& cycle : diagnostics.dependency_cycles) {
                out_ << "  cycle ";
                for (std::size_t i = 0; i < cycle.size(); ++i) {
                    out_ << (i == 0 ? "" : " -> ") << cycle[i];
                }
                out_ << "\n";
            }
            for (const auto& [phase, elapsed] : diagnostics.phase_durations) {
                out_ << "  " << std::left << std::setw(10) << phase << format_elapsed(elapsed) << "\n";
            }
        }
        out_ << "\n";
    }

}  // namespace rha::cli
