#include "rha/metrics/maintainability.hpp"

#include "rha/config.hpp"

#include <algorithm>
#include <cmath>

namespace rha::metrics {

    MaintainabilityStatus classify_maintainability(const double raw) noexcept {
        if (raw >= thresholds::mi_good) {
            return MaintainabilityStatus::Good;
        }
        if (raw >= thresholds::mi_moderate) {
            return MaintainabilityStatus::Moderate;
        }
        if (raw >= thresholds::mi_difficult) {
            return MaintainabilityStatus::Difficult;
        }
        return MaintainabilityStatus::Critical;
    }

    MaintainabilityScore score_maintainability(
        const double volume,
        const std::size_t cyclomatic_complexity,
        const std::size_t loc_program,
        const double comment_ratio
    ) noexcept {
        const double v = std::max(1.0, volume);
        const double loc = std::max(1.0, static_cast<double>(loc_program));
        const double ratio = std::max(0.0, comment_ratio);

        MaintainabilityScore score;
        score.raw = 171.0
                    - 5.2 * std::log(v)
                    - 0.23 * static_cast<double>(cyclomatic_complexity)
                    - 16.2 * std::log(loc)
                    + 50.0 * std::sin(std::sqrt(2.4 * ratio));
        score.normalized = std::max(0.0, score.raw * 100.0 / 171.0);
        score.status = classify_maintainability(score.raw);
        return score;
    }

    MaintainabilityScore score_maintainability(const CodeMetrics& metrics) noexcept {
        return score_maintainability(metrics.volume,
                                     metrics.cyclomatic_complexity,
                                     metrics.loc_program,
                                     metrics.comment_ratio);
    }

}  // namespace rha::metrics
