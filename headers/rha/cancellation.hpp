#ifndef RHA_CANCELLATION_HPP
#define RHA_CANCELLATION_HPP

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between the engine, the
 * worker pool and the command runner.
 */

#include <atomic>
#include <functional>
#include <utility>

namespace rha {

    /**
     * Set once, never cleared. An optional probe lets an external source
     * (a progress observer, a signal handler) request cancellation without
     * holding a reference to the token; the probe must be thread-safe.
     */
    class CancellationToken {
    public:
        CancellationToken() = default;

        explicit CancellationToken(std::function<bool()> probe)
            : probe_(std::move(probe)) {}

        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator=(const CancellationToken&) = delete;

        void request() noexcept {
            requested_.store(true, std::memory_order_release);
        }

        [[nodiscard]] bool is_requested() const {
            if (requested_.load(std::memory_order_acquire)) {
                return true;
            }
            if (probe_ && probe_()) {
                requested_.store(true, std::memory_order_release);
                return true;
            }
            return false;
        }

    private:
        mutable std::atomic<bool> requested_{false};
        std::function<bool()> probe_;
    };

}  // namespace rha

#endif // RHA_CANCELLATION_HPP
