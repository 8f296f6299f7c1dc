#pragma once

#include "types.hpp"

namespace whoshome {

    // ─── Polling defaults (ms) ───────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_POLL_INTERVAL_MS = 30000;
    inline constexpr u32 DEFAULT_PROBE_TIMEOUT_MS = 2000;
    inline constexpr u32 DEFAULT_REFRESH_INTERVAL_MS = 0; // 0 = publish on change only

    // ─── Hysteresis defaults ─────────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_HIT_THRESHOLD = 1;
    inline constexpr u32 DEFAULT_MISS_THRESHOLD = 5;

    // ─── Probe limits ────────────────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_MAX_PARALLEL_PROBES = 16;

    // ─── MQTT defaults ───────────────────────────────────────────────────────────
    inline constexpr u16 MQTT_DEFAULT_PORT = 1883;
    inline constexpr u16 MQTT_DEFAULT_KEEPALIVE_S = 60;
    inline constexpr u32 MQTT_DEFAULT_PUBLISH_ATTEMPTS = 3;
    inline constexpr u32 MQTT_CONNECT_TIMEOUT_MS = 3000;

    // ─── Topic defaults ──────────────────────────────────────────────────────────
    inline constexpr const char *DEFAULT_TOPIC_BASE = "whoshome";
    inline constexpr const char *DEFAULT_HOUSEHOLD_TOPIC = "household";
    inline constexpr const char *DEFAULT_PRESENT_PAYLOAD = "home";
    inline constexpr const char *DEFAULT_ABSENT_PAYLOAD = "away";
    inline constexpr const char *STATUS_TOPIC_LEAF = "status";
    inline constexpr const char *ONLINE_PAYLOAD = "online";
    inline constexpr const char *OFFLINE_PAYLOAD = "offline";
    inline constexpr const char *DEFAULT_CLIENT_ID = "whoshome";

} // namespace whoshome
