#ifndef RHA_ANALYZERS_HEALTH_SCORER_HPP
#define RHA_ANALYZERS_HEALTH_SCORER_HPP

/**
 * @file health_scorer.hpp
 * @brief Derives ProjectHealthMetrics from a finished RepositoryData.
 *
 * All functions are pure. Averages and counts only look at CodeMetrics
 * with valid == true; design-zone counts only look at files whose
 * language has a class or module concept.
 */

#include "rha/repository_data.hpp"

#include <map>
#include <string>
#include <vector>

namespace rha::analyzers {

    /**
     * Smallest number of authors, taken by descending commit count (name
     * breaks ties), whose commits reach total_commits / 2.
     *
     * @return 0 when there are no authors.
     */
    [[nodiscard]] std::size_t compute_bus_factor(
        const std::map<std::string, AuthorStatistics>& authors,
        std::size_t total_commits
    );

    /**
     * 100 minus the complexity, maintainability, large-file and bus-factor
     * penalties, clamped to [0, 100].
     */
    [[nodiscard]] double compute_quality_score(
        double average_complexity,
        double average_maintainability,
        std::size_t large_files,
        std::size_t total_files,
        std::size_t bus_factor
    ) noexcept;

    /**
     * Fixed-order list of advice strings, each quoting the value that
     * triggered it.
     */
    [[nodiscard]] std::vector<std::string> build_recommendations(const ProjectHealthMetrics& health);

    [[nodiscard]] ProjectHealthMetrics score_health(const RepositoryData& data);

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_HEALTH_SCORER_HPP
