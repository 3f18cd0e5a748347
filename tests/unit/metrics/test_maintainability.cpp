#include "rha/metrics/maintainability.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace rha::metrics
{
    TEST(MaintainabilityTest, ClassifyBoundaries) {
        EXPECT_EQ(classify_maintainability(100.0), MaintainabilityStatus::Good);
        EXPECT_EQ(classify_maintainability(85.0), MaintainabilityStatus::Good);
        EXPECT_EQ(classify_maintainability(84.99), MaintainabilityStatus::Moderate);
        EXPECT_EQ(classify_maintainability(65.0), MaintainabilityStatus::Moderate);
        EXPECT_EQ(classify_maintainability(64.99), MaintainabilityStatus::Difficult);
        EXPECT_EQ(classify_maintainability(0.0), MaintainabilityStatus::Difficult);
        EXPECT_EQ(classify_maintainability(-0.01), MaintainabilityStatus::Critical);
    }

    TEST(MaintainabilityTest, ZeroVolumeIsClampedToOne) {
        const auto score = score_maintainability(0.0, 1, 0, 0.0);

        EXPECT_NEAR(score.raw, 171.0 - 0.23, 1e-9);
        EXPECT_NEAR(score.normalized, (171.0 - 0.23) * 100.0 / 171.0, 1e-9);
        EXPECT_EQ(score.status, MaintainabilityStatus::Good);
    }

    TEST(MaintainabilityTest, KnownValue) {
        const auto score = score_maintainability(1000.0, 10, 100, 0.25);

        const double expected = 171.0
                                - 5.2 * std::log(1000.0)
                                - 0.23 * 10.0
                                - 16.2 * std::log(100.0)
                                + 50.0 * std::sin(std::sqrt(2.4 * 0.25));
        EXPECT_NEAR(score.raw, expected, 1e-9);
        EXPECT_NEAR(score.normalized, expected * 100.0 / 171.0, 1e-9);
    }

    TEST(MaintainabilityTest, NegativeRawIsCriticalAndNormalizedZero) {
        const auto score = score_maintainability(1.0e6, 100, 10000, 0.0);

        EXPECT_LT(score.raw, 0.0);
        EXPECT_DOUBLE_EQ(score.normalized, 0.0);
        EXPECT_EQ(score.status, MaintainabilityStatus::Critical);
    }

    TEST(MaintainabilityTest, CommentsRaiseTheIndex) {
        const auto bare = score_maintainability(500.0, 5, 50, 0.0);
        const auto commented = score_maintainability(500.0, 5, 50, 0.3);

        EXPECT_GT(commented.raw, bare.raw);
    }

    TEST(MaintainabilityTest, FromCodeMetrics) {
        CodeMetrics metrics;
        metrics.volume = 1000.0;
        metrics.cyclomatic_complexity = 10;
        metrics.loc_program = 100;
        metrics.comment_ratio = 0.25;

        const auto direct = score_maintainability(1000.0, 10, 100, 0.25);
        const auto via_metrics = score_maintainability(metrics);
        EXPECT_DOUBLE_EQ(via_metrics.raw, direct.raw);
        EXPECT_EQ(via_metrics.status, direct.status);
    }
}
