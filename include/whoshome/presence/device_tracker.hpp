#pragma once

#include "../core/config.hpp"
#include "../core/device.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace whoshome {
    namespace presence {

        // ─── Per-device debounce state ──────────────────────────────────────────────
        // Only one counter accumulates at a time: hits while Absent, misses while
        // Present. Both are zero right after a transition.
        struct DeviceState {
            Status status = Status::Absent;
            u32 consecutive_hits = 0;
            u32 consecutive_misses = 0;
            TimestampMs last_change_ms = 0; // 0 = never confirmed
            u64 probes_recorded = 0;
        };

        // ─── Confirmed status change ────────────────────────────────────────────────
        struct TransitionEvent {
            dp::String device;
            Status status = Status::Absent;
            TimestampMs timestamp_ms = 0;
        };

        // ─── Hysteresis state machine for every configured device ───────────────────
        //
        //          success x hit                    failure x miss
        //   Absent ─────────────────► Present ─────────────────────► Absent
        //
        // Devices are referenced, not owned: the Config they come from must outlive
        // the tracker. Entries keep configuration order.
        class DeviceTracker {
            struct Entry {
                const Device *device = nullptr;
                DeviceState state;
            };

            Thresholds thresholds_;
            dp::Vector<Entry> entries_;

          public:
            explicit DeviceTracker(const dp::Vector<Device> &devices, Thresholds thresholds = {})
                : thresholds_(thresholds) {
                if (thresholds_.hit == 0 || thresholds_.miss == 0) {
                    echo::category("whoshome.tracker").warn("threshold of 0 treated as 1");
                    thresholds_.hit = thresholds_.hit == 0 ? 1 : thresholds_.hit;
                    thresholds_.miss = thresholds_.miss == 0 ? 1 : thresholds_.miss;
                }
                for (const auto &d : devices) {
                    Entry e;
                    e.device = &d;
                    entries_.push_back(e);
                }
            }

            // ─── Probe results ──────────────────────────────────────────────────────
            dp::Optional<TransitionEvent> record_probe(const dp::String &device, bool reachable, TimestampMs now_ms) {
                auto index = index_of(device);
                if (!index.has_value()) {
                    echo::category("whoshome.tracker").error("probe result for unknown device '", device, "' dropped");
                    return dp::nullopt;
                }
                return record_probe_at(index.value(), reachable, now_ms);
            }

            dp::Optional<TransitionEvent> record_probe(const Device &device, bool reachable, TimestampMs now_ms) {
                return record_probe(device.name, reachable, now_ms);
            }

            dp::Optional<TransitionEvent> record_probe_at(usize index, bool reachable, TimestampMs now_ms) {
                if (index >= entries_.size()) {
                    echo::category("whoshome.tracker").error("probe result for device index ", index, " of ",
                                                             entries_.size(), " dropped");
                    return dp::nullopt;
                }
                Entry &entry = entries_[index];
                DeviceState &st = entry.state;
                st.probes_recorded++;

                dp::Optional<TransitionEvent> event;
                if (reachable) {
                    st.consecutive_misses = 0;
                    if (st.status == Status::Absent) {
                        st.consecutive_hits++;
                        if (st.consecutive_hits >= thresholds_.hit) {
                            event = confirm(entry, Status::Present, now_ms);
                        }
                    }
                } else {
                    st.consecutive_hits = 0;
                    if (st.status == Status::Present) {
                        st.consecutive_misses++;
                        if (st.consecutive_misses >= thresholds_.miss) {
                            event = confirm(entry, Status::Absent, now_ms);
                        }
                    }
                }

                check_invariants(entry);
                return event;
            }

            // ─── Queries ────────────────────────────────────────────────────────────
            dp::Optional<usize> index_of(const dp::String &device) const noexcept {
                for (usize i = 0; i < entries_.size(); ++i) {
                    if (entries_[i].device->name == device)
                        return i;
                }
                return dp::nullopt;
            }

            const DeviceState *state(const dp::String &device) const noexcept {
                auto index = index_of(device);
                return index.has_value() ? &entries_[index.value()].state : nullptr;
            }

            dp::Optional<Status> status(const dp::String &device) const noexcept {
                const DeviceState *st = state(device);
                if (!st)
                    return dp::nullopt;
                return st->status;
            }

            const DeviceState &state_at(usize index) const noexcept { return entries_[index].state; }
            const Device &device_at(usize index) const noexcept { return *entries_[index].device; }

            usize size() const noexcept { return entries_.size(); }

            usize present_count() const noexcept {
                usize n = 0;
                for (const auto &e : entries_) {
                    if (e.state.status == Status::Present)
                        n++;
                }
                return n;
            }

            dp::Vector<const Device *> devices() const {
                dp::Vector<const Device *> out;
                for (const auto &e : entries_) {
                    out.push_back(e.device);
                }
                return out;
            }

            const Thresholds &thresholds() const noexcept { return thresholds_; }

          private:
            TransitionEvent confirm(Entry &entry, Status next, TimestampMs now_ms) {
                DeviceState &st = entry.state;
                st.status = next;
                st.consecutive_hits = 0;
                st.consecutive_misses = 0;
                st.last_change_ms = now_ms;
                echo::category("whoshome.tracker")
                    .info(entry.device->name, " is ", status_name(next), " (", entry.device->address_text(), ")");
                return TransitionEvent{entry.device->name, next, now_ms};
            }

            // A violation is a bug; repair this device and keep tracking the others
            void check_invariants(Entry &entry) {
                DeviceState &st = entry.state;
                bool hits_misplaced = st.status == Status::Present && st.consecutive_hits != 0;
                bool misses_misplaced = st.status == Status::Absent && st.consecutive_misses != 0;
                if (hits_misplaced || misses_misplaced) {
                    echo::category("whoshome.tracker")
                        .error("state invariant violated for ", entry.device->name, ": status=",
                               status_name(st.status), " hits=", st.consecutive_hits,
                               " misses=", st.consecutive_misses, "; counters reset");
                    st.consecutive_hits = 0;
                    st.consecutive_misses = 0;
                }
            }
        };

    } // namespace presence
    using namespace presence;
} // namespace whoshome
