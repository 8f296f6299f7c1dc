#pragma once

#include "../core/error.hpp"
#include <datapod/datapod.hpp>

namespace whoshome {
    namespace notify {

        // ─── Outbound messaging capability ─────────────────────────────────────────
        // Connection lifecycle (connect, reconnect, auth) stays behind this
        // interface. publish() must give up within a bounded time.
        class Publisher {
          public:
            virtual ~Publisher() = default;

            virtual Result<void> publish(const dp::String &topic, const dp::String &payload, bool retained) = 0;

            // Housekeeping from the daemon loop (keep-alive, reading acks)
            virtual void service() {}

            // Graceful close on shutdown
            virtual void close() {}
        };

    } // namespace notify
    using namespace notify;
} // namespace whoshome
