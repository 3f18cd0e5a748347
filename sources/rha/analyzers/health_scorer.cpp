#include "rha/analyzers/health_scorer.hpp"

#include "rha/config.hpp"

#include <algorithm>
#include <iomanip>
#include <ranges>
#include <sstream>

namespace rha::analyzers {

    namespace {

        std::string format_fixed(const double value, const int precision) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }

        bool in_design_zone(const DesignZone zone) noexcept {
            return zone != DesignZone::NotApplicable;
        }

    }  // namespace

    std::size_t compute_bus_factor(
        const std::map<std::string, AuthorStatistics>& authors,
        const std::size_t total_commits
    ) {
        if (authors.empty()) {
            return 0;
        }

        std::vector<const AuthorStatistics*> ranked;
        ranked.reserve(authors.size());
        for (const auto& [name, stats] : authors) {
            ranked.push_back(&stats);
        }
        std::ranges::sort(ranked, [](const AuthorStatistics* a, const AuthorStatistics* b) {
            if (a->total_commits != b->total_commits) {
                return a->total_commits > b->total_commits;
            }
            return a->name < b->name;
        });

        const std::size_t target = total_commits / 2;
        std::size_t cumulative = 0;
        std::size_t bus_factor = 0;
        for (const auto* author : ranked) {
            cumulative += author->total_commits;
            ++bus_factor;
            if (cumulative >= target) {
                break;
            }
        }
        return bus_factor;
    }

    double compute_quality_score(
        const double average_complexity,
        const double average_maintainability,
        const std::size_t large_files,
        const std::size_t total_files,
        const std::size_t bus_factor
    ) noexcept {
        using namespace thresholds;

        double score = 100.0;

        if (average_complexity > complexity_penalty_start) {
            score -= std::min(complexity_penalty_cap,
                              (average_complexity - complexity_penalty_start) * complexity_penalty_factor);
        }

        if (average_maintainability < mi_penalty_start) {
            score -= std::min(mi_penalty_cap,
                              (mi_penalty_start - average_maintainability) * mi_penalty_factor);
        }

        if (total_files > 0) {
            const double ratio = static_cast<double>(large_files) / static_cast<double>(total_files);
            score -= std::min(large_file_penalty_cap, ratio * 100.0);
        }

        if (bus_factor <= critical_bus_factor) {
            score -= critical_bus_factor_penalty;
        } else if (bus_factor <= low_bus_factor) {
            score -= low_bus_factor_penalty;
        }

        return std::clamp(score, 0.0, 100.0);
    }

    std::vector<std::string> build_recommendations(const ProjectHealthMetrics& health) {
        std::vector<std::string> out;

        if (health.code_quality_score < thresholds::low_quality_score) {
            out.push_back("Code quality score is low (" + format_fixed(health.code_quality_score, 1)
                          + "/100). Consider significant refactoring.");
        }

        if (health.bus_factor <= thresholds::critical_bus_factor) {
            out.push_back("Bus factor is very low (" + std::to_string(health.bus_factor)
                          + "). Knowledge is concentrated in few contributors.");
        }

        if (health.complex_files_count > 0) {
            out.push_back(std::to_string(health.complex_files_count)
                          + " files have high cyclomatic complexity. Consider simplifying.");
        }

        if (health.critical_files > 0) {
            out.push_back(std::to_string(health.critical_files)
                          + " files have critical maintainability issues. Immediate attention needed.");
        }

        if (health.zone_of_pain_files > 0) {
            out.push_back(std::to_string(health.zone_of_pain_files)
                          + " files are in the Zone of Pain (concrete and heavily depended upon)."
                            " Consider introducing abstractions.");
        }

        if (health.zone_of_uselessness_files > 0) {
            out.push_back(std::to_string(health.zone_of_uselessness_files)
                          + " files are in the Zone of Uselessness (abstract with no dependents)."
                            " Consider removing unused abstractions.");
        }

        if (health.average_distance > thresholds::moderate_distance) {
            out.push_back("Average distance from the main sequence is high ("
                          + format_fixed(health.average_distance, 2)
                          + "). Balance abstractness against stability.");
        }

        return out;
    }

    ProjectHealthMetrics score_health(const RepositoryData& data) {
        ProjectHealthMetrics health;
        health.bus_factor = compute_bus_factor(data.authors, data.total_commits);

        std::size_t valid_files = 0;
        double total_complexity = 0.0;
        double total_maintainability = 0.0;

        for (const auto& metrics : data.code_metrics | std::views::values) {
            if (!metrics.valid) {
                continue;
            }
            ++valid_files;
            total_complexity += static_cast<double>(metrics.cyclomatic_complexity);
            total_maintainability += metrics.maintainability_index;

            switch (metrics.maintainability_status) {
                case MaintainabilityStatus::Good:      ++health.good_files; break;
                case MaintainabilityStatus::Moderate:  ++health.moderate_files; break;
                case MaintainabilityStatus::Difficult: ++health.difficult_files; break;
                case MaintainabilityStatus::Critical:  ++health.critical_files; break;
            }

            if (metrics.loc_physical > thresholds::large_file_loc) {
                ++health.large_files_count;
            }
            if (metrics.cyclomatic_complexity > thresholds::complex_file_cc) {
                ++health.complex_files_count;
            }
        }

        if (valid_files > 0) {
            health.average_complexity = total_complexity / static_cast<double>(valid_files);
            health.average_maintainability_index = total_maintainability / static_cast<double>(valid_files);
        }

        std::size_t zoned_files = 0;
        double total_distance = 0.0;
        for (const auto& coupling : data.coupling | std::views::values) {
            if (!in_design_zone(coupling.zone)) {
                continue;
            }
            ++zoned_files;
            total_distance += coupling.distance;
            switch (coupling.zone) {
                case DesignZone::MainSequence:      ++health.main_sequence_files; break;
                case DesignZone::ZoneOfPain:        ++health.zone_of_pain_files; break;
                case DesignZone::ZoneOfUselessness: ++health.zone_of_uselessness_files; break;
                default: break;
            }
        }
        if (zoned_files > 0) {
            health.average_distance = total_distance / static_cast<double>(zoned_files);
        }

        health.code_quality_score = compute_quality_score(health.average_complexity,
                                                          health.average_maintainability_index,
                                                          health.large_files_count,
                                                          data.total_files,
                                                          health.bus_factor);
        health.recommendations = build_recommendations(health);
        return health;
    }

}  // namespace rha::analyzers
