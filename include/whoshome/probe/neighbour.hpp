#pragma once

#include "../core/device.hpp"
#include "icmp.hpp"
#include "prober.hpp"
#include <cstdio>
#include <echo/echo.hpp>
#include <sstream>
#include <string>

namespace whoshome {
    namespace probe {

        // ─── Kernel neighbour (ARP) table ───────────────────────────────────────────
        inline constexpr u32 ATF_COMPLETE = 0x2;

        struct NeighbourEntry {
            u32 ipv4 = 0;
            MacAddr mac = {};
            u32 flags = 0;
            dp::String interface_name;

            bool complete() const noexcept { return (flags & ATF_COMPLETE) != 0; }
        };

        // Parses the text of /proc/net/arp:
        //   IP address       HW type     Flags       HW address            Mask     Device
        //   192.168.1.23     0x1         0x2         aa:bb:cc:dd:ee:ff     *        wlan0
        // Malformed lines are skipped.
        inline dp::Vector<NeighbourEntry> parse_arp_table(const std::string &text) {
            dp::Vector<NeighbourEntry> entries;
            std::istringstream in(text);
            std::string line;
            bool header = true;
            while (std::getline(in, line)) {
                if (header) {
                    header = false;
                    continue;
                }
                std::istringstream fields(line);
                std::string ip, hw_type, flags, hw_addr, mask, dev;
                if (!(fields >> ip >> hw_type >> flags >> hw_addr >> mask >> dev))
                    continue;

                auto ip_parsed = parse_ipv4(ip);
                auto mac_parsed = parse_mac(hw_addr);
                if (!ip_parsed.has_value() || !mac_parsed.has_value())
                    continue;

                NeighbourEntry entry;
                entry.ipv4 = ip_parsed.value();
                entry.mac = mac_parsed.value();
                entry.flags = static_cast<u32>(std::strtoul(flags.c_str(), nullptr, 16));
                entry.interface_name = dp::String(dev);
                entries.push_back(std::move(entry));
            }
            return entries;
        }

        inline Result<std::string> read_text_file(const dp::String &path) {
            FILE *f = std::fopen(path.c_str(), "r");
            if (!f) {
                return Result<std::string>::err(Error::io_error("failed to open " + path));
            }
            std::string text;
            char buf[4096];
            usize n = 0;
            while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
                text.append(buf, n);
            }
            bool failed = std::ferror(f) != 0;
            std::fclose(f);
            if (failed) {
                return Result<std::string>::err(Error::io_error("failed to read " + path));
            }
            return Result<std::string>::ok(std::move(text));
        }

        // Complete entry for mac, restricted to one interface when iface is set
        inline dp::Optional<NeighbourEntry> find_neighbour(const dp::Vector<NeighbourEntry> &table, const MacAddr &mac,
                                                           const dp::String &iface) {
            for (const auto &entry : table) {
                if (!same_mac(entry.mac, mac) || !entry.complete())
                    continue;
                if (!iface.empty() && entry.interface_name != iface)
                    continue;
                return entry;
            }
            return dp::nullopt;
        }

        // ─── MAC address prober ─────────────────────────────────────────────────────
        // Finds the device's current IPv4 in the neighbour table and confirms it with
        // an ICMP echo. The kernel keeps stale entries for minutes after a phone has
        // left, so a table hit alone never counts as present. A MAC missing from the
        // table is absent: the table only learns hosts this machine has talked to,
        // which on a router or DHCP server is every client.
        class NeighbourProber : public Prober {
            IcmpProber &icmp_;
            dp::String table_path_;
            dp::String interface_;

          public:
            NeighbourProber(IcmpProber &icmp, dp::String iface = "", dp::String table_path = "/proc/net/arp")
                : icmp_(icmp), table_path_(std::move(table_path)), interface_(std::move(iface)) {}

            dp::String name() const override { return "neighbour"; }

            dp::Optional<u32> lookup(const MacAddr &mac) const {
                auto text = read_text_file(table_path_);
                if (!text.is_ok()) {
                    echo::category("whoshome.probe.neighbour").warn(text.error().message);
                    return dp::nullopt;
                }
                auto entry = find_neighbour(parse_arp_table(text.value()), mac, interface_);
                if (!entry.has_value())
                    return dp::nullopt;
                return entry.value().ipv4;
            }

            ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *cancel) override {
                if (cancel && cancel->raised())
                    return ProbeOutcome::Cancelled;

                auto ip = lookup(device.address.mac);
                if (!ip.has_value()) {
                    echo::category("whoshome.probe.neighbour").trace(device.name, ": no neighbour entry");
                    return ProbeOutcome::Unreachable;
                }
                return icmp_.ping(ip.value(), timeout_ms, cancel);
            }
        };

    } // namespace probe
    using namespace probe;
} // namespace whoshome
