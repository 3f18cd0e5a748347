#include "rha/analysis/progress.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace rha::analysis
{
    namespace {
        class RecordingObserver : public IProgressObserver {
        public:
            void on_progress(const double fraction, const std::string& message) override {
                fractions.push_back(fraction);
                messages.push_back(message);
            }

            [[nodiscard]] bool cancel_requested() const override {
                return cancel;
            }

            std::vector<double> fractions;
            std::vector<std::string> messages;
            bool cancel = false;
        };
    }

    TEST(ProgressDispatcherTest, NullObserverIsNoOp) {
        ProgressDispatcher progress(nullptr);
        progress.report(0.5, "ignored");

        EXPECT_FALSE(progress.cancel_requested());
        EXPECT_DOUBLE_EQ(progress.last_fraction(), 0.0);
    }

    TEST(ProgressDispatcherTest, ClampsToUnitRange) {
        RecordingObserver observer;
        ProgressDispatcher progress(&observer);

        progress.report(-0.5, "below");
        progress.report(1.5, "above");

        ASSERT_EQ(observer.fractions.size(), 2u);
        EXPECT_DOUBLE_EQ(observer.fractions[0], 0.0);
        EXPECT_DOUBLE_EQ(observer.fractions[1], 1.0);
        EXPECT_EQ(observer.messages[1], "above");
    }

    TEST(ProgressDispatcherTest, NeverMovesBackwards) {
        RecordingObserver observer;
        ProgressDispatcher progress(&observer);

        progress.report(0.6, "ahead");
        progress.report(0.3, "late report");

        ASSERT_EQ(observer.fractions.size(), 2u);
        EXPECT_DOUBLE_EQ(observer.fractions[1], 0.6);
        EXPECT_DOUBLE_EQ(progress.last_fraction(), 0.6);
    }

    TEST(ProgressDispatcherTest, SliceInterpolates) {
        RecordingObserver observer;
        ProgressDispatcher progress(&observer);

        progress.report_slice(0.4, 0.7, 1, 2, "half");
        EXPECT_DOUBLE_EQ(observer.fractions.back(), 0.55);

        progress.report_slice(0.4, 0.7, 5, 2, "overshoot");
        EXPECT_DOUBLE_EQ(observer.fractions.back(), 0.7);
    }

    TEST(ProgressDispatcherTest, EmptySliceCompletes) {
        RecordingObserver observer;
        ProgressDispatcher progress(&observer);

        progress.report_slice(0.0, 0.4, 0, 0, "nothing to do");
        EXPECT_DOUBLE_EQ(observer.fractions.back(), 0.4);
    }

    TEST(ProgressDispatcherTest, ForwardsCancellation) {
        RecordingObserver observer;
        ProgressDispatcher progress(&observer);

        EXPECT_FALSE(progress.cancel_requested());
        observer.cancel = true;
        EXPECT_TRUE(progress.cancel_requested());
    }
}
