#pragma once

#include "../core/types.hpp"
#include "../presence/device_tracker.hpp"
#include "../presence/household.hpp"
#include "../presence/poll_scheduler.hpp"
#include "../util/timer.hpp"
#include "publisher.hpp"
#include "topics.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace whoshome {
    namespace notify {

        struct DispatcherStats {
            u64 published = 0;
            u64 dropped = 0;
            u64 refreshes = 0;
        };

        // ─── Transition -> retained message ─────────────────────────────────────────
        // Every message is retained, so a subscriber that connects later sees the
        // last confirmed status at once. A failed publish is logged and dropped: the
        // tracker state is untouched and the next transition (or refresh) recovers.
        class NotificationDispatcher {
            Publisher &publisher_;
            TopicScheme topics_;
            DispatcherStats stats_;
            Timer refresh_timer_;

            // Last confirmed status per device, in order of first transition
            struct Known {
                dp::String device;
                Status status = Status::Absent;
            };
            dp::Vector<Known> known_;
            dp::Optional<Status> household_;

          public:
            NotificationDispatcher(Publisher &publisher, TopicScheme topics, u32 refresh_interval_ms = 0)
                : publisher_(publisher), topics_(std::move(topics)), refresh_timer_(refresh_interval_ms) {
                if (refresh_interval_ms > 0) {
                    refresh_timer_.start();
                }
            }

            void attach(PollScheduler &scheduler) {
                scheduler.on_transition.subscribe([this](const TransitionEvent &ev) { on_transition(ev); });
            }

            void attach(HouseholdMonitor &household) {
                household.on_change.subscribe([this](const HouseholdEvent &ev) { on_household(ev); });
            }

            void on_transition(const TransitionEvent &event) {
                remember(event.device, event.status);
                send(topics_.device_topic(event.device), topics_.payload(event.status));
            }

            void on_household(const HouseholdEvent &event) {
                household_ = event.status;
                if (!topics_.household_enabled())
                    return;
                send(topics_.household_topic(), topics_.payload(event.status));
            }

            // Republishes every confirmed status when the refresh period elapses
            void update(u64 elapsed_ms) {
                if (refresh_timer_.update(elapsed_ms)) {
                    refresh();
                }
            }

            void refresh() {
                stats_.refreshes++;
                for (const auto &k : known_) {
                    send(topics_.device_topic(k.device), topics_.payload(k.status));
                }
                if (household_.has_value() && topics_.household_enabled()) {
                    send(topics_.household_topic(), topics_.payload(household_.value()));
                }
            }

            const DispatcherStats &stats() const noexcept { return stats_; }
            const TopicScheme &topics() const noexcept { return topics_; }

          private:
            void remember(const dp::String &device, Status status) {
                for (auto &k : known_) {
                    if (k.device == device) {
                        k.status = status;
                        return;
                    }
                }
                known_.push_back({device, status});
            }

            void send(const dp::String &topic, const dp::String &payload) {
                auto result = publisher_.publish(topic, payload, true);
                if (result.is_ok()) {
                    stats_.published++;
                    echo::category("whoshome.dispatch").debug("published ", topic, " = ", payload);
                    return;
                }
                stats_.dropped++;
                echo::category("whoshome.dispatch")
                    .warn("dropped ", topic, " = ", payload, ": ", result.error().message);
            }
        };

    } // namespace notify
    using namespace notify;
} // namespace whoshome
