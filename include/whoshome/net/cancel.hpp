#pragma once

#include "../core/types.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <sys/eventfd.h>
#include <thread>
#include <unistd.h>

namespace whoshome {
    namespace net {

        // ─── Shutdown signal shared by every blocking wait ──────────────────────────
        // Probes and the MQTT client poll fd() next to their own socket, so raising
        // the signal wakes all of them at once instead of waiting out their timeouts.
        // raise() only touches an atomic and write(2); it is safe in a signal handler.
        class CancelSignal {
            int fd_ = -1;
            std::atomic<bool> raised_{false};

          public:
            CancelSignal() : fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {}
            ~CancelSignal() {
                if (fd_ >= 0)
                    ::close(fd_);
            }

            CancelSignal(const CancelSignal &) = delete;
            CancelSignal &operator=(const CancelSignal &) = delete;

            void raise() noexcept {
                raised_.store(true);
                if (fd_ >= 0) {
                    u64 one = 1;
                    // raised_ is authoritative, the eventfd only wakes pollers
                    ssize_t n = ::write(fd_, &one, sizeof(one));
                    (void)n;
                }
            }

            bool raised() const noexcept { return raised_.load(); }

            // -1 when eventfd creation failed; waits then fall back to slicing
            int fd() const noexcept { return fd_; }

            // Sleeps until raised or timeout_ms passed; returns raised()
            bool wait(u32 timeout_ms) const {
                if (raised())
                    return true;
                if (fd_ < 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms < 100 ? timeout_ms : 100));
                    return raised();
                }
                pollfd pfd{fd_, POLLIN, 0};
                if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) < 0 && errno != EINTR) {
                    // poll itself failed, don't spin
                    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms < 100 ? timeout_ms : 100));
                }
                return raised();
            }
        };

    } // namespace net
    using namespace net;
} // namespace whoshome
