#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../net/cancel.hpp"
#include "../notify/dispatcher.hpp"
#include "../notify/publisher.hpp"
#include "../notify/topics.hpp"
#include "../presence/device_tracker.hpp"
#include "../presence/household.hpp"
#include "../presence/poll_scheduler.hpp"
#include "../presence/probe_executor.hpp"
#include "../probe/prober.hpp"
#include <chrono>
#include <echo/echo.hpp>

namespace whoshome {
    namespace app {

        inline constexpr u32 DAEMON_MAX_SLEEP_MS = 1000;

        // ─── Presence daemon ────────────────────────────────────────────────────────
        // Owns the tracker and everything wired to it. run() drives the scheduler with
        // wall-clock time until the cancel signal is raised, then closes the publisher.
        class Daemon {
            const Config &config_;
            Publisher &publisher_;
            CancelSignal &cancel_;

            DeviceTracker tracker_;
            ThreadedProbeExecutor executor_;
            PollScheduler scheduler_;
            HouseholdMonitor household_;
            NotificationDispatcher dispatcher_;

          public:
            Daemon(const Config &config, Prober &prober, Publisher &publisher, CancelSignal &cancel)
                : config_(config), publisher_(publisher), cancel_(cancel), tracker_(config.devices, config.thresholds),
                  executor_(prober, config.max_parallel_probes),
                  scheduler_(tracker_, executor_,
                             SchedulerConfig{}.interval(config.poll_interval_ms).timeout(config.probe_timeout_ms),
                             &cancel),
                  household_(tracker_), dispatcher_(publisher, TopicScheme(config.topics), config.refresh_interval_ms) {
                dispatcher_.attach(scheduler_);
                household_.attach(scheduler_);
                if (dispatcher_.topics().household_enabled()) {
                    dispatcher_.attach(household_);
                }
            }

            Daemon(const Daemon &) = delete;
            Daemon &operator=(const Daemon &) = delete;

            int run() {
                using clock = std::chrono::steady_clock;

                echo::category("whoshome.daemon")
                    .info("watching ", tracker_.size(), " devices every ", config_.poll_interval_ms, "ms (timeout ",
                          config_.probe_timeout_ms, "ms, hit ", tracker_.thresholds().hit, ", miss ",
                          tracker_.thresholds().miss, ")");

                scheduler_.start();
                auto last = clock::now();
                while (!cancel_.raised()) {
                    auto now = clock::now();
                    u64 elapsed = static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count());
                    // Carry the sub-millisecond remainder into the next tick
                    last += std::chrono::milliseconds(elapsed);

                    scheduler_.update(elapsed);
                    dispatcher_.update(elapsed);
                    publisher_.service();

                    u64 sleep = scheduler_.time_until_next_cycle();
                    if (sleep > DAEMON_MAX_SLEEP_MS)
                        sleep = DAEMON_MAX_SLEEP_MS;
                    cancel_.wait(static_cast<u32>(sleep));
                }

                echo::category("whoshome.daemon").info("shutting down after ", scheduler_.cycles(), " cycles");
                scheduler_.stop();
                publisher_.close();
                return 0;
            }

            // ─── Accessors ──────────────────────────────────────────────────────────
            const DeviceTracker &tracker() const noexcept { return tracker_; }
            PollScheduler &scheduler() noexcept { return scheduler_; }
            HouseholdMonitor &household() noexcept { return household_; }
            NotificationDispatcher &dispatcher() noexcept { return dispatcher_; }
        };

    } // namespace app
    using namespace app;
} // namespace whoshome
