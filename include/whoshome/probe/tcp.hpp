#pragma once

#include "../net/socket.hpp"
#include "prober.hpp"
#include <echo/echo.hpp>

namespace whoshome {
    namespace probe {

        // ─── TCP connect prober ─────────────────────────────────────────────────────
        // For devices configured as IP:PORT. A refused connection still proves the
        // host answered, so only timeouts and unreachable-network errors count as
        // absent.
        class TcpProber : public Prober {
          public:
            dp::String name() const override { return "tcp"; }

            ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *cancel) override {
                auto result = tcp_connect(device.address.ipv4, device.address.port, timeout_ms, cancel);
                if (result.is_ok()) {
                    return ProbeOutcome::Reachable;
                }
                switch (result.error().code) {
                case ErrorCode::Refused:
                    return ProbeOutcome::Reachable;
                case ErrorCode::Cancelled:
                    return ProbeOutcome::Cancelled;
                default:
                    echo::category("whoshome.probe.tcp")
                        .trace(device.name, " (", device.address_text(), "): ", result.error().message);
                    return ProbeOutcome::Unreachable;
                }
            }
        };

    } // namespace probe
    using namespace probe;
} // namespace whoshome
