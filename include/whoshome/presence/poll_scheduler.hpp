#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../net/cancel.hpp"
#include "../util/event.hpp"
#include "../util/timer.hpp"
#include "device_tracker.hpp"
#include "probe_executor.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace whoshome {
    namespace presence {

        // ─── Scheduler configuration ────────────────────────────────────────────────
        struct SchedulerConfig {
            u32 interval_ms = DEFAULT_POLL_INTERVAL_MS;
            u32 timeout_ms = DEFAULT_PROBE_TIMEOUT_MS;

            SchedulerConfig &interval(u32 ms) {
                interval_ms = ms;
                return *this;
            }
            SchedulerConfig &timeout(u32 ms) {
                timeout_ms = ms;
                return *this;
            }
        };

        // ─── Summary of one probe cycle ─────────────────────────────────────────────
        struct CycleReport {
            u64 cycle = 0;
            TimestampMs started_ms = 0;
            usize reachable = 0;
            usize unreachable = 0;
            usize cancelled = 0;
            usize skipped = 0;
            usize transitions = 0;
        };

        // ─── Periodic probe driver ──────────────────────────────────────────────────
        // Time only advances through update(elapsed_ms); the daemon feeds it wall
        // time, tests feed it whatever they like. Each cycle probes every device
        // through the executor, applies the joined results to the tracker on the
        // calling thread and emits the cycle's transitions before returning, so
        // they always precede the next cycle's probes.
        class PollScheduler {
            DeviceTracker &tracker_;
            ProbeExecutor &executor_;
            const CancelSignal *cancel_;
            SchedulerConfig config_;
            Timer timer_;
            TimestampMs now_ms_ = 0;
            u64 cycles_ = 0;

          public:
            PollScheduler(DeviceTracker &tracker, ProbeExecutor &executor, SchedulerConfig config = {},
                          const CancelSignal *cancel = nullptr)
                : tracker_(tracker), executor_(executor), cancel_(cancel), config_(config) {
                if (config_.interval_ms == 0) {
                    // A zero-period timer never fires
                    config_.interval_ms = DEFAULT_POLL_INTERVAL_MS;
                    echo::category("whoshome.scheduler")
                        .warn("poll interval 0 replaced by the default ", config_.interval_ms, "ms");
                }
                timer_.set_interval(config_.interval_ms);
                if (config_.timeout_ms >= config_.interval_ms) {
                    // Cycles must not stack: keep the timeout inside the period
                    config_.timeout_ms = config_.interval_ms > 1 ? config_.interval_ms - 1 : 1;
                    echo::category("whoshome.scheduler")
                        .warn("probe timeout clamped to ", config_.timeout_ms, "ms (interval ", config_.interval_ms,
                              "ms)");
                }
            }

            // First cycle runs on the next update()
            void start() noexcept { timer_.start_expired(); }
            void stop() noexcept { timer_.stop(); }
            bool running() const noexcept { return timer_.running(); }

            // Advances scheduler time; returns true if a cycle ran
            bool update(u64 elapsed_ms) {
                now_ms_ += elapsed_ms;
                if (!timer_.update(elapsed_ms))
                    return false;
                if (cancel_ && cancel_->raised())
                    return false;
                run_cycle(now_ms_);
                return true;
            }

            CycleReport run_cycle(TimestampMs now_ms) {
                CycleReport report;
                report.cycle = ++cycles_;
                report.started_ms = now_ms;

                auto devices = tracker_.devices();
                auto outcomes = executor_.run(devices, config_.timeout_ms, cancel_);
                if (outcomes.size() != devices.size()) {
                    echo::category("whoshome.scheduler")
                        .error("executor returned ", outcomes.size(), " outcomes for ", devices.size(),
                               " devices; cycle ", report.cycle, " discarded");
                    return report;
                }

                dp::Vector<TransitionEvent> events;
                for (usize i = 0; i < outcomes.size(); ++i) {
                    echo::category("whoshome.scheduler")
                        .trace("cycle ", report.cycle, ": ", devices[i]->name, " ", outcome_name(outcomes[i]));
                    switch (outcomes[i]) {
                    case ProbeOutcome::Cancelled:
                        report.cancelled++;
                        continue; // no outcome, no state change
                    case ProbeOutcome::Skipped:
                        report.skipped++;
                        continue;
                    case ProbeOutcome::Reachable:
                        report.reachable++;
                        break;
                    case ProbeOutcome::Unreachable:
                        report.unreachable++;
                        break;
                    }
                    auto event = tracker_.record_probe_at(i, outcomes[i] == ProbeOutcome::Reachable, now_ms);
                    if (event.has_value()) {
                        events.push_back(event.value());
                    }
                }

                if (report.skipped > 0) {
                    echo::category("whoshome.scheduler")
                        .warn("cycle ", report.cycle, ": ", report.skipped,
                              " devices not probed before the deadline; state kept");
                }

                report.transitions = events.size();
                for (const auto &ev : events) {
                    on_transition.emit(ev);
                }
                echo::category("whoshome.scheduler")
                    .debug("cycle ", report.cycle, ": ", report.reachable, " reachable, ", report.unreachable,
                           " unreachable, ", report.cancelled, " cancelled, ", report.skipped, " skipped, ",
                           report.transitions, " transitions");
                on_cycle.emit(report);
                return report;
            }

            // ─── Queries ────────────────────────────────────────────────────────────
            TimestampMs now() const noexcept { return now_ms_; }
            u64 cycles() const noexcept { return cycles_; }
            u64 time_until_next_cycle() const noexcept { return timer_.remaining(); }
            const SchedulerConfig &config() const noexcept { return config_; }

            // ─── Events ─────────────────────────────────────────────────────────────
            Event<TransitionEvent> on_transition;
            Event<CycleReport> on_cycle;
        };

    } // namespace presence
    using namespace presence;
} // namespace whoshome
