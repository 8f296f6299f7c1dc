#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "whoshome/core/config.hpp"
#include "whoshome/core/constants.hpp"
#include "whoshome/core/device.hpp"
#include "whoshome/core/error.hpp"
#include "whoshome/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "whoshome/util/event.hpp"
#include "whoshome/util/timer.hpp"

// ─── Sockets ─────────────────────────────────────────────────────────────────
#include "whoshome/net/cancel.hpp"
#include "whoshome/net/socket.hpp"

// ─── Probes ──────────────────────────────────────────────────────────────────
#include "whoshome/probe/address_prober.hpp"
#include "whoshome/probe/icmp.hpp"
#include "whoshome/probe/neighbour.hpp"
#include "whoshome/probe/prober.hpp"
#include "whoshome/probe/tcp.hpp"

// ─── Presence ────────────────────────────────────────────────────────────────
#include "whoshome/presence/device_tracker.hpp"
#include "whoshome/presence/household.hpp"
#include "whoshome/presence/poll_scheduler.hpp"
#include "whoshome/presence/probe_executor.hpp"

// ─── Notification ────────────────────────────────────────────────────────────
#include "whoshome/notify/dispatcher.hpp"
#include "whoshome/notify/publisher.hpp"
#include "whoshome/notify/topics.hpp"

// ─── MQTT 3.1.1 ──────────────────────────────────────────────────────────────
#include "whoshome/mqtt/client.hpp"

// ─── Configuration and daemon ────────────────────────────────────────────────
#include "whoshome/app/daemon.hpp"
#include "whoshome/config/environment.hpp"
