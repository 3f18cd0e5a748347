#ifndef RHA_CLI_PROGRESS_HPP
#define RHA_CLI_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Status line fed by the analysis engine.
 */

#include "rha/analysis/progress.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

namespace rha::cli
{
    [[nodiscard]] bool stdout_is_terminal();

    /// Column count of the controlling terminal, 80 when unknown.
    [[nodiscard]] std::size_t terminal_columns();

    /**
     * Shows run progress on stdout and turns SIGINT into a cancellation
     * request.
     *
     * On a terminal one status line is redrawn in place with a percentage
     * and an ETA. Elsewhere each new phase message is printed once.
     */
    class TerminalObserver final : public analysis::IProgressObserver {
    public:
        /**
         * @param interrupted Flag set by the SIGINT handler.
         * @param visible     False in quiet mode; nothing is printed.
         */
        TerminalObserver(const std::atomic<bool>& interrupted, bool visible);

        void on_progress(double fraction, const std::string& message) override;

        [[nodiscard]] bool cancel_requested() const override;

        void finish();
        void fail(std::string_view reason);

    private:
        void redraw() const;
        [[nodiscard]] std::string remaining_time() const;

        const std::atomic<bool>& interrupted_;
        bool visible_;
        bool redraw_in_place_;
        bool started_ = false;
        bool closed_ = false;
        double fraction_ = 0.0;
        std::string phase_;
        std::chrono::steady_clock::time_point started_at_;
    };

}  // namespace rha::cli

#endif // RHA_CLI_PROGRESS_HPP
