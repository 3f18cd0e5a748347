#include "rha/cli/progress.hpp"
#include "rha/cli/formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

#include <sys/ioctl.h>
#include <unistd.h>

namespace rha::cli
{
    namespace {
        constexpr std::size_t bar_cells = 30;
    }

    bool stdout_is_terminal() {
        return isatty(fileno(stdout)) != 0;
    }

    std::size_t terminal_columns() {
        winsize size{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
            return size.ws_col;
        }
        return 80;
    }

    TerminalObserver::TerminalObserver(const std::atomic<bool>& interrupted, const bool visible)
        : interrupted_(interrupted)
        , visible_(visible)
        , redraw_in_place_(stdout_is_terminal())
        , started_at_(std::chrono::steady_clock::now())
    {}

    void TerminalObserver::on_progress(const double fraction, const std::string& message) {
        if (!visible_ || closed_) return;
        started_ = true;
        fraction_ = std::clamp(fraction, 0.0, 1.0);

        if (redraw_in_place_) {
            phase_ = message;
            redraw();
        } else if (message != phase_) {
            phase_ = message;
            std::cout << "[" << format_fixed(fraction_ * 100.0, 0) << "%] " << phase_ << "\n";
        }
    }

    bool TerminalObserver::cancel_requested() const {
        return interrupted_.load(std::memory_order_relaxed);
    }

    void TerminalObserver::finish() {
        if (!started_ || closed_) return;
        closed_ = true;
        if (redraw_in_place_) {
            fraction_ = 1.0;
            phase_ = "done in " + format_elapsed(std::chrono::steady_clock::now() - started_at_);
            redraw();
            std::cout << "\n" << std::flush;
        }
    }

    void TerminalObserver::fail(const std::string_view reason) {
        if (!started_ || closed_) return;
        closed_ = true;
        if (redraw_in_place_) {
            std::cout << "\r\033[K";
        }
        std::cout << styled("Stopped", Tone::Bad) << ": " << reason << "\n" << std::flush;
    }

    std::string TerminalObserver::remaining_time() const {
        if (fraction_ <= 0.0 || fraction_ >= 1.0) {
            return {};
        }
        const auto elapsed = std::chrono::steady_clock::now() - started_at_;
        const auto left = std::chrono::duration_cast<Duration>(elapsed * ((1.0 - fraction_) / fraction_));
        if (left < std::chrono::seconds(1)) {
            return {};
        }
        return " eta " + format_elapsed(left);
    }

    void TerminalObserver::redraw() const {
        const auto filled = static_cast<std::size_t>(fraction_ * static_cast<double>(bar_cells));
        std::string line = "[" + std::string(filled, '=') + std::string(bar_cells - filled, ' ') + "] "
                           + format_fixed(fraction_ * 100.0, 0) + "%" + remaining_time() + "  " + phase_;

        const auto width = terminal_columns();
        if (line.size() >= width) {
            line.resize(width - 1);
        }
        std::cout << "\r\033[K" << line << std::flush;
    }

}  // namespace rha::cli
