#pragma once

#include <datapod/datapod.hpp>

namespace whoshome {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    using dp::byte;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    // Milliseconds on the daemon's monotonic timeline (0 = process start)
    using TimestampMs = u64;

    // ─── Presence status ─────────────────────────────────────────────────────────
    enum class Status : u8 { Absent = 0, Present = 1 };

    inline constexpr const char *status_name(Status s) noexcept {
        return s == Status::Present ? "present" : "absent";
    }

    // ─── Probe outcome ───────────────────────────────────────────────────────────
    // Cancelled means shutdown interrupted the probe before it had an answer.
    // Skipped means the cycle's deadline passed before the device was probed.
    // Neither is evidence about the device.
    enum class ProbeOutcome : u8 { Unreachable = 0, Reachable = 1, Cancelled = 2, Skipped = 3 };

    inline constexpr const char *outcome_name(ProbeOutcome o) noexcept {
        switch (o) {
        case ProbeOutcome::Reachable:
            return "reachable";
        case ProbeOutcome::Unreachable:
            return "unreachable";
        case ProbeOutcome::Cancelled:
            return "cancelled";
        case ProbeOutcome::Skipped:
            return "skipped";
        }
        return "unknown";
    }

} // namespace whoshome
