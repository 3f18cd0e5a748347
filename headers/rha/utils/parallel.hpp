#ifndef RHA_PARALLEL_HPP
#define RHA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Bounded worker pool used for per-file analysis.
 *
 * One pool is owned by one analysis run. shutdown() stops intake, waits a
 * bounded grace period for queued work, then discards whatever never
 * started and joins the workers. Futures of discarded tasks report
 * std::future_errc::broken_promise.
 */

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace rha::parallel {

    /**
     * Hardware threads available, at least 1.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    class ThreadPool {
    public:
        /// @param workers Worker count; 0 means one per hardware thread.
        explicit ThreadPool(const unsigned int workers = 0) {
            const unsigned int count = workers == 0 ? hardware_concurrency() : workers;
            threads_.reserve(count);
            for (unsigned int i = 0; i < count; ++i) {
                threads_.emplace_back(&ThreadPool::run_worker, this);
            }
        }

        ~ThreadPool() {
            shutdown(std::chrono::milliseconds::zero());
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a nullary callable.
         *
         * @throws std::runtime_error once shutdown() has started.
         */
        template<typename Task>
        auto submit(Task&& task) -> std::future<std::invoke_result_t<Task>> {
            using Value = std::invoke_result_t<Task>;

            auto job = std::make_shared<std::packaged_task<Value()>>(std::forward<Task>(task));
            auto future = job->get_future();
            {
                std::lock_guard lock(mutex_);
                if (closed_) {
                    throw std::runtime_error("ThreadPool is shutting down");
                }
                queue_.emplace_back([job] { (*job)(); });
            }
            work_available_.notify_one();
            return future;
        }

        /**
         * Stops intake, waits up to @p grace for queued and running work,
         * then drops the tasks that never started and joins the workers.
         *
         * @return Number of tasks discarded without running.
         */
        std::size_t shutdown(const std::chrono::milliseconds grace) {
            std::deque<std::function<void()>> dropped;
            {
                std::unique_lock lock(mutex_);
                if (joined_) {
                    return 0;
                }
                closed_ = true;
                drained_.wait_for(lock, grace, [this] { return queue_.empty() && running_ == 0; });
                dropped.swap(queue_);
                joined_ = true;
            }
            work_available_.notify_all();
            for (auto& thread : threads_) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
            // Destroying the dropped packaged_tasks breaks their promises.
            return dropped.size();
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return threads_.size();
        }

        /// Queued tasks that have not started yet.
        [[nodiscard]] std::size_t pending() const {
            std::lock_guard lock(mutex_);
            return queue_.size();
        }

    private:
        void run_worker() {
            for (;;) {
                std::function<void()> job;
                {
                    std::unique_lock lock(mutex_);
                    work_available_.wait(lock, [this] { return joined_ || !queue_.empty(); });
                    if (joined_) {
                        return;
                    }
                    job = std::move(queue_.front());
                    queue_.pop_front();
                    ++running_;
                }

                job();

                {
                    std::lock_guard lock(mutex_);
                    --running_;
                }
                drained_.notify_all();
            }
        }

        std::vector<std::thread> threads_;
        std::deque<std::function<void()>> queue_;
        mutable std::mutex mutex_;
        std::condition_variable work_available_;
        std::condition_variable drained_;
        std::size_t running_ = 0;
        bool closed_ = false;
        bool joined_ = false;
    };

}  // namespace rha::parallel

#endif // RHA_PARALLEL_HPP
