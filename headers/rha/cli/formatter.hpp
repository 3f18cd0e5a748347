#ifndef RHA_CLI_FORMATTER_HPP
#define RHA_CLI_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Plain-text rendering of a ProjectReport for the terminal.
 *
 * Color is applied only when enabled and stdout is a terminal, so piping
 * the report into a file gives clean text.
 */

#include "rha/repository_data.hpp"
#include "rha/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rha::cli
{
    enum class Tone {
        Plain,
        Strong,
        Muted,
        Good,
        Info,
        Warning,
        Bad
    };

    void set_color_enabled(bool enabled);
    [[nodiscard]] bool color_enabled();

    /**
     * Wraps @p text in the ANSI sequence for @p tone when color is on.
     */
    [[nodiscard]] std::string styled(const std::string& text, Tone tone);

    [[nodiscard]] Tone tone_of(MaintainabilityStatus status) noexcept;
    [[nodiscard]] Tone tone_of(DesignZone zone) noexcept;
    [[nodiscard]] Tone tone_of(RiskLevel level) noexcept;

    /// Green from 75, yellow from 50, red below.
    [[nodiscard]] Tone tone_of_score(double score) noexcept;

    enum class Align {
        Left,
        Right
    };

    struct Column {
        std::string title;
        Align align = Align::Right;
        std::size_t max_width = 0;  // 0 = unlimited
    };

    /**
     * Column-aligned table; widths fit the widest cell up to max_width.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(std::vector<std::string> cells);

        void print(std::ostream& out) const;

    private:
        std::vector<Column> columns_;
        std::vector<std::vector<std::string>> rows_;
    };

    [[nodiscard]] std::string format_fixed(double value, int precision = 1);

    /// 1234567 -> "1,234,567"
    [[nodiscard]] std::string format_count(std::size_t count);

    /// part / whole as "12.5%"; "0.0%" when whole is 0.
    [[nodiscard]] std::string format_share(std::size_t part, std::size_t whole);

    /// UTC calendar date, "YYYY-MM-DD".
    [[nodiscard]] std::string format_date(Timestamp ts);

    [[nodiscard]] std::string format_elapsed(Duration elapsed);

    /**
     * Keeps the tail of a path, prefixing "..." when it is cut.
     */
    [[nodiscard]] std::string shorten_path(const std::string& path, std::size_t max_width);

    [[nodiscard]] std::string histogram_bar(std::size_t value, std::size_t peak, std::size_t width);

    /**
     * Writes the report sections. Each section is skipped when it has
     * nothing to show.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        void print_overview(const RepositoryData& data) const;

        /// Top contributors by commit count.
        void print_authors(const RepositoryData& data, std::size_t limit) const;

        /// Files with the most revisions.
        void print_most_changed(const RepositoryData& data, std::size_t limit) const;

        /// Ranked churn-times-complexity risk, with change-coupled partners.
        void print_hotspots(const std::vector<Hotspot>& hotspots, const HotspotSummary& summary,
                            std::size_t limit) const;

        /// Files with the lowest raw maintainability index.
        void print_code_quality(const RepositoryData& data, std::size_t limit) const;

        /// Packages ordered by distance from the main sequence, worst first.
        void print_coupling(const RepositoryData& data, std::size_t limit) const;

        void print_activity(const RepositoryData& data) const;
        void print_health(const ProjectHealthMetrics& health) const;
        void print_diagnostics(const AnalysisDiagnostics& diagnostics, bool verbose) const;

    private:
        void section(const std::string& title) const;
        void field(const std::string& name, const std::string& value) const;

        std::ostream& out_;
    };

}  // namespace rha::cli

#endif // RHA_CLI_FORMATTER_HPP
