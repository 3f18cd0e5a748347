#ifndef RHA_ANALYZERS_COUPLING_ANALYZER_HPP
#define RHA_ANALYZERS_COUPLING_ANALYZER_HPP

/**
 * @file coupling_analyzer.hpp
 * @brief Afferent/efferent coupling, abstractness and distance from the
 *        main sequence, per file and per package (directory).
 *
 *     I = Ce / (Ce + Ca), 0 when both are 0
 *     A = abstract / max(1, classes)
 *     D = |A + I - 1|
 *
 * Files whose language has no class or module concept keep their counts but
 * get DesignZone::NotApplicable and take no part in package metrics.
 */

#include "rha/analyzers/structure_extractor.hpp"
#include "rha/repository_data.hpp"

#include <map>
#include <string>
#include <vector>

namespace rha::analyzers {

    struct CouplingReport {
        std::map<std::string, CouplingMetrics> files;
        std::map<std::string, CouplingMetrics> packages;
        std::vector<std::vector<std::string>> cycles;  // at most max_reported_cycles
    };

    inline constexpr std::size_t max_reported_cycles = 10;

    /**
     * D < 0.2 main sequence. Otherwise A and I both under 0.3 is the zone of
     * pain and both over 0.7 the zone of uselessness; anything else is
     * moderate up to D = 0.4 and far from the main sequence beyond it.
     */
    [[nodiscard]] DesignZone classify_zone(double abstractness, double instability, double distance) noexcept;

    /**
     * Fills instability, abstractness, distance and zone from the class
     * counts and Ce/Ca already set on @p metrics.
     */
    void derive_coupling(CouplingMetrics& metrics, bool eligible) noexcept;

    /**
     * Package key of a repository path: its directory, "." at the root.
     */
    [[nodiscard]] std::string package_of(const std::string& path);

    /**
     * Builds the repository-wide dependency graph from the extracted
     * structures and computes every file and package metric.
     *
     * @param structures Structure of every analyzed file, keyed by path.
     */
    [[nodiscard]] CouplingReport analyze_coupling(const std::map<std::string, FileStructure>& structures);

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_COUPLING_ANALYZER_HPP
