#ifndef RHA_ANALYZERS_HOTSPOT_ANALYZER_HPP
#define RHA_ANALYZERS_HOTSPOT_ANALYZER_HPP

/**
 * @file hotspot_analyzer.hpp
 * @brief Ranks files that are both frequently changed and hard to maintain.
 *
 * Candidates are the tracked files that passed the filter, i.e. the keys of
 * RepositoryData::code_metrics. Each gets
 *
 *     churn      = revisions / max revisions * 100
 *     complexity = 0.6 * (100 - MI_raw / 171 * 100) + 0.4 * min(2 CC, 100)
 *     risk       = churn * complexity / 100 + min(5 * coupled files, 25)
 *
 * Files whose metrics are not valid contribute churn and coupling only.
 */

#include "rha/repository_data.hpp"

#include <map>
#include <string>
#include <vector>

namespace rha::analyzers {

    /**
     * @class HotspotAnalyzer
     * Combines revision churn, code complexity and change coupling into a
     * per-file risk score.
     */
    class HotspotAnalyzer {
    public:
        struct Options {
            std::size_t top_n = 20;  ///< Hotspots returned by identify_hotspots(); 0 returns all
        };

        /**
         * Scores every candidate file and returns the riskiest, highest
         * score first (path breaks ties).
         */
        [[nodiscard]] static std::vector<Hotspot> identify_hotspots(
            const RepositoryData& data,
            const Options& options
        );

        /**
         * Every candidate file, ranked; identify_hotspots() truncates this.
         */
        [[nodiscard]] static std::vector<Hotspot> rank_all(const RepositoryData& data);

        [[nodiscard]] static HotspotSummary summarize(const std::vector<Hotspot>& hotspots);

        [[nodiscard]] static std::vector<Hotspot> filter_by_level(
            const std::vector<Hotspot>& hotspots,
            RiskLevel level
        );

        /**
         * Temporal coupling between files that appear in the same change
         * sets. Only pairs stronger than the reporting threshold are kept,
         * at most five per file, strongest first.
         *
         * @param change_sets Sorted, duplicate-free paths per commit.
         */
        [[nodiscard]] static std::map<std::string, std::vector<ChangeCoupling>> detect_change_coupling(
            const std::vector<std::vector<std::string>>& change_sets
        );

        /// 0..100 blend of inverted maintainability and cyclomatic complexity
        [[nodiscard]] static double complexity_score(const CodeMetrics& metrics) noexcept;

        [[nodiscard]] static RiskLevel classify_risk(double risk_score) noexcept;
    };

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_HOTSPOT_ANALYZER_HPP
