#include "rha/utils/keyed_accumulator.hpp"
#include "rha/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <string>

namespace rha::utils
{
    struct Counter {
        int hits = 0;
        long total = 0;
    };

    TEST(KeyedAccumulatorTest, CreatesOnFirstUpdate) {
        KeyedAccumulator<std::string, Counter> acc;
        EXPECT_FALSE(acc.contains("a"));

        acc.update("a", [](Counter& c) { ++c.hits; });
        acc.update("a", [](Counter& c) { ++c.hits; });
        acc.update("b", [](Counter& c) { c.total = 5; });

        EXPECT_TRUE(acc.contains("a"));
        EXPECT_EQ(acc.size(), 2u);

        const auto snapshot = acc.snapshot();
        EXPECT_EQ(snapshot.at("a").hits, 2);
        EXPECT_EQ(snapshot.at("b").hits, 0);
        EXPECT_EQ(snapshot.at("b").total, 5);
    }

    TEST(KeyedAccumulatorTest, SnapshotIsOrderedByKey) {
        KeyedAccumulator<std::string, Counter> acc;
        acc.update("zeta", [](Counter& c) { ++c.hits; });
        acc.update("alpha", [](Counter& c) { ++c.hits; });

        const auto snapshot = acc.snapshot();
        ASSERT_EQ(snapshot.size(), 2u);
        EXPECT_EQ(snapshot.begin()->first, "alpha");
    }

    TEST(KeyedAccumulatorTest, ConcurrentUpdatesAreNotLost) {
        KeyedAccumulator<int, Counter> acc;
        {
            parallel::ThreadPool pool(4);
            for (int i = 0; i < 400; ++i) {
                pool.submit([&acc, i] {
                    acc.update(i % 8, [i](Counter& c) {
                        ++c.hits;
                        c.total += i;
                    });
                });
            }
            pool.shutdown(std::chrono::seconds(30));
        }

        const auto snapshot = acc.snapshot();
        ASSERT_EQ(snapshot.size(), 8u);
        int hits = 0;
        long total = 0;
        for (const auto& [key, counter] : snapshot) {
            EXPECT_EQ(counter.hits, 50);
            hits += counter.hits;
            total += counter.total;
        }
        EXPECT_EQ(hits, 400);
        EXPECT_EQ(total, 399L * 400L / 2L);
    }
}
