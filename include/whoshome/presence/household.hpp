#pragma once

#include "../core/types.hpp"
#include "../util/event.hpp"
#include "device_tracker.hpp"
#include "poll_scheduler.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace whoshome {
    namespace presence {

        // ─── "Anyone home" aggregate ───────────────────────────────────────────────
        struct HouseholdEvent {
            Status status = Status::Absent;
            usize present = 0;
            usize total = 0;
            TimestampMs timestamp_ms = 0;
        };

        // Present while at least one device is confirmed Present. Evaluated once per
        // cycle, so one member leaving while another arrives in the same cycle does
        // not flap the aggregate.
        //
        // The aggregate starts unconfirmed. The first Present confirms at once; an
        // empty house is confirmed Absent after empty_cycles consecutive evaluations
        // with nobody present (the tracker's miss threshold by default). Once
        // confirmed, a drop to zero is Absent immediately: per-device miss
        // thresholds already debounced it.
        class HouseholdMonitor {
            const DeviceTracker &tracker_;
            u32 empty_cycles_;
            dp::Optional<Status> status_;
            u32 empty_seen_ = 0;
            TimestampMs last_change_ms_ = 0;

          public:
            explicit HouseholdMonitor(const DeviceTracker &tracker)
                : HouseholdMonitor(tracker, tracker.thresholds().miss) {}

            HouseholdMonitor(const DeviceTracker &tracker, u32 empty_cycles)
                : tracker_(tracker), empty_cycles_(empty_cycles == 0 ? 1 : empty_cycles) {}

            void attach(PollScheduler &scheduler) {
                scheduler.on_cycle.subscribe([this](const CycleReport &report) { evaluate(report.started_ms); });
            }

            // Returns the event if the aggregate was confirmed or changed
            dp::Optional<HouseholdEvent> evaluate(TimestampMs now_ms) {
                HouseholdEvent ev;
                ev.present = tracker_.present_count();
                ev.total = tracker_.size();
                ev.status = ev.present > 0 ? Status::Present : Status::Absent;
                ev.timestamp_ms = now_ms;

                if (ev.status == Status::Present) {
                    empty_seen_ = 0;
                } else if (!status_.has_value()) {
                    if (++empty_seen_ < empty_cycles_)
                        return dp::nullopt;
                }

                if (status_.has_value() && status_.value() == ev.status)
                    return dp::nullopt;

                status_ = ev.status;
                last_change_ms_ = now_ms;
                if (ev.status == Status::Absent) {
                    echo::category("whoshome.household").info("everyone has left");
                } else {
                    echo::category("whoshome.household").info("someone is home (", ev.present, "/", ev.total, ")");
                }
                on_change.emit(ev);
                return ev;
            }

            // nullopt until the first confirmation
            const dp::Optional<Status> &status() const noexcept { return status_; }
            TimestampMs last_change() const noexcept { return last_change_ms_; }
            u32 empty_cycles() const noexcept { return empty_cycles_; }

            Event<HouseholdEvent> on_change;
        };

    } // namespace presence
    using namespace presence;
} // namespace whoshome
