#ifndef RHA_METRICS_MAINTAINABILITY_HPP
#define RHA_METRICS_MAINTAINABILITY_HPP

/**
 * @file maintainability.hpp
 * @brief Maintainability Index from volume, complexity, size and comments.
 *
 *     raw = 171 - 5.2 ln(max(1, V)) - 0.23 CC - 16.2 ln(max(1, LOCpro))
 *           + 50 sin(sqrt(2.4 commentRatio))
 *     mi  = max(0, raw * 100 / 171)
 *
 * The status is decided on the raw value, so a file whose raw index is
 * negative is Critical even though its normalized index reads 0.
 */

#include "rha/types.hpp"

namespace rha::metrics {

    struct MaintainabilityScore {
        double raw = 0.0;
        double normalized = 0.0;
        MaintainabilityStatus status = MaintainabilityStatus::Difficult;
    };

    /**
     * Good >= 85 > Moderate >= 65 > Difficult >= 0 > Critical.
     */
    [[nodiscard]] MaintainabilityStatus classify_maintainability(double raw) noexcept;

    [[nodiscard]] MaintainabilityScore score_maintainability(
        double volume,
        std::size_t cyclomatic_complexity,
        std::size_t loc_program,
        double comment_ratio
    ) noexcept;

    [[nodiscard]] MaintainabilityScore score_maintainability(const CodeMetrics& metrics) noexcept;

}  // namespace rha::metrics

#endif // RHA_METRICS_MAINTAINABILITY_HPP
