#pragma once

#include "../core/types.hpp"

namespace whoshome {
    namespace util {

        // ─── Periodic timer driven by elapsed time ───────────────────────────────────
        // Nothing here reads a clock: callers feed elapsed milliseconds through
        // update(), so simulated time and wall time drive it the same way.
        class Timer {
            u64 interval_ms_ = 0;
            u64 elapsed_ms_ = 0;
            bool running_ = false;

          public:
            Timer() = default;
            explicit Timer(u64 interval_ms) : interval_ms_(interval_ms) {}

            void set_interval(u64 ms) noexcept { interval_ms_ = ms; }
            u64 interval() const noexcept { return interval_ms_; }

            void start() noexcept {
                running_ = true;
                elapsed_ms_ = 0;
            }

            // Start with the first period already elapsed, so the next update fires
            void start_expired() noexcept {
                running_ = true;
                elapsed_ms_ = interval_ms_;
            }

            void stop() noexcept { running_ = false; }
            void reset() noexcept { elapsed_ms_ = 0; }
            bool running() const noexcept { return running_; }

            // Returns true if the timer expired during this update. A late update
            // fires once; the backlog of missed periods is dropped, not replayed.
            bool update(u64 delta_ms) noexcept {
                if (!running_ || interval_ms_ == 0)
                    return false;

                elapsed_ms_ += delta_ms;
                if (elapsed_ms_ >= interval_ms_) {
                    elapsed_ms_ %= interval_ms_;
                    return true;
                }
                return false;
            }

            u64 elapsed() const noexcept { return elapsed_ms_; }
            u64 remaining() const noexcept {
                if (!running_ || elapsed_ms_ >= interval_ms_)
                    return 0;
                return interval_ms_ - elapsed_ms_;
            }
        };

    } // namespace util
    using namespace util;
} // namespace whoshome
