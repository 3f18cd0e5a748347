#ifndef RHA_ANALYSIS_PROGRESS_HPP
#define RHA_ANALYSIS_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Progress reporting and cancellation requests from an observer.
 */

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>

namespace rha::analysis {

    /**
     * Receives progress of an analysis run.
     *
     * on_progress() is never called concurrently when routed through a
     * ProgressDispatcher. cancel_requested() may be polled from any thread.
     */
    class IProgressObserver {
    public:
        virtual ~IProgressObserver() = default;

        /**
         * @param fraction Completed share of the run, in [0, 1].
         * @param message  Short description of the current phase.
         */
        virtual void on_progress(double fraction, const std::string& message) = 0;

        [[nodiscard]] virtual bool cancel_requested() const {
            return false;
        }
    };

    /**
     * Serializes progress calls and keeps the reported fraction monotonic
     * non-decreasing within [0, 1]. A null observer turns every call into
     * a no-op.
     */
    class ProgressDispatcher {
    public:
        explicit ProgressDispatcher(IProgressObserver* observer) noexcept
            : observer_(observer) {}

        ProgressDispatcher(const ProgressDispatcher&) = delete;
        ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

        void report(double fraction, const std::string& message) {
            if (!observer_) {
                return;
            }
            std::lock_guard lock(mutex_);
            fraction = std::clamp(fraction, 0.0, 1.0);
            last_ = std::max(last_, fraction);
            observer_->on_progress(last_, message);
        }

        /**
         * Reports position @p done of @p total inside the [begin, end] slice.
         */
        void report_slice(double begin, double end, std::size_t done, std::size_t total, const std::string& message) {
            const double share = total == 0 ? 1.0 : std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
            report(begin + (end - begin) * share, message);
        }

        [[nodiscard]] bool cancel_requested() const {
            return observer_ && observer_->cancel_requested();
        }

        [[nodiscard]] double last_fraction() const {
            std::lock_guard lock(mutex_);
            return last_;
        }

    private:
        IProgressObserver* observer_;
        mutable std::mutex mutex_;
        double last_ = 0.0;
    };

}  // namespace rha::analysis

#endif // RHA_ANALYSIS_PROGRESS_HPP
