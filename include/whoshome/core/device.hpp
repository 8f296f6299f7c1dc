#pragma once

#include "error.hpp"
#include "types.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <string>

namespace whoshome {

    // ─── Device address ──────────────────────────────────────────────────────────
    // A device is identified on the LAN either by IPv4 (optionally with a TCP port
    // the phone keeps open) or by its MAC address as seen in the neighbour table.
    enum class AddressKind : u8 { Ipv4, Ipv4Port, Mac };

    using MacAddr = dp::Array<u8, 6>;

    struct DeviceAddress {
        AddressKind kind = AddressKind::Ipv4;
        u32 ipv4 = 0; // host byte order
        u16 port = 0;
        MacAddr mac = {};

        bool is_mac() const noexcept { return kind == AddressKind::Mac; }
        bool has_port() const noexcept { return kind == AddressKind::Ipv4Port; }
    };

    inline bool same_mac(const MacAddr &a, const MacAddr &b) noexcept {
        for (usize i = 0; i < 6; ++i) {
            if (a[i] != b[i])
                return false;
        }
        return true;
    }

    // ─── Address text conversion ─────────────────────────────────────────────────
    inline dp::String ipv4_to_string(u32 ip) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", (ip >> 24) & 0xFF, (ip >> 16) & 0xFF, (ip >> 8) & 0xFF,
                      ip & 0xFF);
        return dp::String(buf);
    }

    inline dp::String mac_to_string(const MacAddr &mac) {
        char buf[18];
        std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", mac[0], mac[1], mac[2], mac[3], mac[4],
                      mac[5]);
        return dp::String(buf);
    }

    inline dp::String address_to_string(const DeviceAddress &addr) {
        switch (addr.kind) {
        case AddressKind::Mac:
            return mac_to_string(addr.mac);
        case AddressKind::Ipv4Port:
            return ipv4_to_string(addr.ipv4) + ":" + dp::String(std::to_string(addr.port));
        case AddressKind::Ipv4:
            break;
        }
        return ipv4_to_string(addr.ipv4);
    }

    inline dp::Optional<u32> parse_ipv4(const std::string &text) {
        in_addr parsed{};
        if (text.empty() || inet_pton(AF_INET, text.c_str(), &parsed) != 1) {
            return dp::nullopt;
        }
        return static_cast<u32>(ntohl(parsed.s_addr));
    }

    inline i32 hex_digit(char c) noexcept {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    // Accepts aa:bb:cc:dd:ee:ff and aa-bb-cc-dd-ee-ff, any case
    inline dp::Optional<MacAddr> parse_mac(const std::string &text) {
        if (text.size() != 17) {
            return dp::nullopt;
        }
        const char sep = text[2];
        if (sep != ':' && sep != '-') {
            return dp::nullopt;
        }
        MacAddr mac = {};
        for (usize i = 0; i < 6; ++i) {
            usize pos = i * 3;
            if (i > 0 && text[pos - 1] != sep) {
                return dp::nullopt;
            }
            i32 hi = hex_digit(text[pos]);
            i32 lo = hex_digit(text[pos + 1]);
            if (hi < 0 || lo < 0) {
                return dp::nullopt;
            }
            mac[i] = static_cast<u8>((hi << 4) | lo);
        }
        return mac;
    }

    inline Result<DeviceAddress> parse_address(const dp::String &text) {
        std::string s(text.c_str());
        DeviceAddress addr;

        if (auto mac = parse_mac(s); mac.has_value()) {
            addr.kind = AddressKind::Mac;
            addr.mac = mac.value();
            return Result<DeviceAddress>::ok(addr);
        }

        auto colon = s.find(':');
        if (colon != std::string::npos) {
            std::string port_text = s.substr(colon + 1);
            char *end = nullptr;
            unsigned long port = std::strtoul(port_text.c_str(), &end, 10);
            if (port_text.empty() || *end != '\0' || port == 0 || port > 65535) {
                return Result<DeviceAddress>::err(Error::invalid_address(text));
            }
            auto ip = parse_ipv4(s.substr(0, colon));
            if (!ip.has_value()) {
                return Result<DeviceAddress>::err(Error::invalid_address(text));
            }
            addr.kind = AddressKind::Ipv4Port;
            addr.ipv4 = ip.value();
            addr.port = static_cast<u16>(port);
            return Result<DeviceAddress>::ok(addr);
        }

        auto ip = parse_ipv4(s);
        if (!ip.has_value()) {
            return Result<DeviceAddress>::err(Error::invalid_address(text));
        }
        addr.kind = AddressKind::Ipv4;
        addr.ipv4 = ip.value();
        return Result<DeviceAddress>::ok(addr);
    }

    // ─── Device ──────────────────────────────────────────────────────────────────
    // Immutable after configuration load. The name is the device's identity.
    struct Device {
        dp::String name;
        DeviceAddress address;

        dp::String address_text() const { return address_to_string(address); }
    };

    // Lower-case, [a-z0-9_-]; everything else becomes '_'
    inline dp::String slugify(const dp::String &name) {
        dp::String out;
        for (usize i = 0; i < name.size(); ++i) {
            char c = name[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
            out += keep ? c : '_';
        }
        return out;
    }

    // Names end up in MQTT topics and in the NAME=ADDR list syntax
    inline bool valid_device_name(const dp::String &name) noexcept {
        if (name.empty()) {
            return false;
        }
        for (usize i = 0; i < name.size(); ++i) {
            char c = name[i];
            if (c == '=' || c == ',' || c == '/' || c == '+' || c == '#' || c == ' ' || c == '\t') {
                return false;
            }
        }
        return true;
    }

} // namespace whoshome
