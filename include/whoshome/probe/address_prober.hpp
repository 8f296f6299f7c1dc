#pragma once

#include "icmp.hpp"
#include "neighbour.hpp"
#include "prober.hpp"
#include "tcp.hpp"

namespace whoshome {
    namespace probe {

        // ─── Prober chosen by address kind ──────────────────────────────────────────
        //   Ipv4      -> ICMP echo
        //   Ipv4Port  -> TCP connect
        //   Mac       -> neighbour table lookup, then ICMP echo
        class AddressProber : public Prober {
            IcmpProber icmp_;
            TcpProber tcp_;
            NeighbourProber neighbour_;

          public:
            explicit AddressProber(dp::String iface = "") : neighbour_(icmp_, std::move(iface)) {}

            dp::String name() const override { return "address"; }

            Prober &select(const Device &device) noexcept {
                switch (device.address.kind) {
                case AddressKind::Ipv4Port:
                    return tcp_;
                case AddressKind::Mac:
                    return neighbour_;
                case AddressKind::Ipv4:
                    break;
                }
                return icmp_;
            }

            ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *cancel) override {
                return select(device).probe(device, timeout_ms, cancel);
            }
        };

    } // namespace probe
    using namespace probe;
} // namespace whoshome
