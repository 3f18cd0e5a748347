#include "rha/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>

namespace rha::parallel
{
    TEST(ThreadPoolTest, RunsSubmittedTasks) {
        ThreadPool pool(2);

        auto lines = pool.submit([] { return 120; });
        auto files = pool.submit([] { return 7; });

        EXPECT_EQ(lines.get() + files.get(), 127);
        EXPECT_EQ(pool.size(), 2u);
    }

    TEST(ThreadPoolTest, ZeroWorkersMeansOnePerCore) {
        ThreadPool pool(0);
        EXPECT_EQ(pool.size(), hardware_concurrency());
    }

    TEST(ThreadPoolTest, ShutdownDrainsQueueWithinGrace) {
        std::atomic<int> analysed{0};
        ThreadPool pool(2);
        for (int i = 0; i < 200; ++i) {
            pool.submit([&analysed] { ++analysed; });
        }

        EXPECT_EQ(pool.shutdown(std::chrono::seconds(10)), 0u);
        EXPECT_EQ(analysed.load(), 200);
        EXPECT_EQ(pool.pending(), 0u);
    }

    TEST(ThreadPoolTest, ShutdownDiscardsTasksThatNeverStarted) {
        ThreadPool pool(1);
        std::promise<void> release;
        auto gate = release.get_future().share();
        std::promise<void> started;

        auto blocker = pool.submit([gate, &started] {
            started.set_value();
            gate.wait();
        });
        started.get_future().wait();
        auto starved = pool.submit([] { return 1; });

        std::thread releaser([&release] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            release.set_value();
        });
        const auto discarded = pool.shutdown(std::chrono::milliseconds(20));
        releaser.join();

        EXPECT_EQ(discarded, 1u);
        blocker.get();
        try {
            starved.get();
            FAIL() << "discarded task produced a value";
        } catch (const std::future_error& e) {
            EXPECT_EQ(e.code(), std::make_error_code(std::future_errc::broken_promise));
        }
    }

    TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
        ThreadPool pool(1);
        pool.shutdown(std::chrono::milliseconds::zero());

        EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);
    }

    TEST(ThreadPoolTest, SecondShutdownIsNoop) {
        ThreadPool pool(1);
        pool.shutdown(std::chrono::milliseconds(100));
        EXPECT_EQ(pool.shutdown(std::chrono::milliseconds(100)), 0u);
    }

    TEST(ThreadPoolTest, TaskExceptionReachesFuture) {
        ThreadPool pool(1);
        auto future = pool.submit([]() -> int { throw std::runtime_error("unreadable"); });

        EXPECT_THROW(future.get(), std::runtime_error);
    }
}
