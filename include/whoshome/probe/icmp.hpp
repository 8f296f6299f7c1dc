#pragma once

#include "../net/socket.hpp"
#include "prober.hpp"
#include <atomic>
#include <chrono>
#include <echo/echo.hpp>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>

namespace whoshome {
    namespace probe {

        inline u16 icmp_checksum(const u8 *data, usize len) noexcept {
            u32 sum = 0;
            for (usize i = 0; i + 1 < len; i += 2) {
                sum += static_cast<u32>((data[i] << 8) | data[i + 1]);
            }
            if (len & 1) {
                sum += static_cast<u32>(data[len - 1] << 8);
            }
            while (sum >> 16) {
                sum = (sum & 0xFFFF) + (sum >> 16);
            }
            return static_cast<u16>(~sum);
        }

        // ─── ICMP echo prober ────────────────────────────────────────────────────────
        // Uses the unprivileged ICMP datagram socket (net.ipv4.ping_group_range) and
        // falls back to a raw socket, which needs CAP_NET_RAW. Phones in deep sleep
        // often skip a single echo, so the hysteresis above absorbs isolated misses.
        class IcmpProber : public Prober {
            static constexpr usize PAYLOAD_LEN = 16;
            std::atomic<u16> next_seq_{1};
            const u16 ident_ = static_cast<u16>(::getpid() & 0xFFFF);

            struct IcmpSocket {
                Fd fd;
                bool raw = false;
            };

            static Result<IcmpSocket> open_socket() {
                IcmpSocket s;
                s.fd = Fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
                if (!s.fd.valid()) {
                    s.fd = Fd(::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP));
                    s.raw = true;
                }
                if (!s.fd.valid()) {
                    return Result<IcmpSocket>::err(Error::socket_error(errno_string("icmp socket")));
                }
                if (!set_nonblocking(s.fd.get())) {
                    return Result<IcmpSocket>::err(Error::socket_error(errno_string("fcntl")));
                }
                return Result<IcmpSocket>::ok(std::move(s));
            }

          public:
            IcmpProber() = default;

            dp::String name() const override { return "icmp"; }

            ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *cancel) override {
                return ping(device.address.ipv4, timeout_ms, cancel);
            }

            ProbeOutcome ping(u32 ip, u32 timeout_ms, const CancelSignal *cancel) {
                auto sock_result = open_socket();
                if (!sock_result.is_ok()) {
                    echo::category("whoshome.probe.icmp").warn(sock_result.error().message);
                    return ProbeOutcome::Unreachable;
                }
                auto &sock = sock_result.value();
                const u16 seq = next_seq_.fetch_add(1);

                u8 packet[sizeof(icmphdr) + PAYLOAD_LEN] = {};
                packet[0] = ICMP_ECHO;
                packet[1] = 0;
                packet[4] = static_cast<u8>(ident_ >> 8);
                packet[5] = static_cast<u8>(ident_ & 0xFF);
                packet[6] = static_cast<u8>(seq >> 8);
                packet[7] = static_cast<u8>(seq & 0xFF);
                for (usize i = 0; i < PAYLOAD_LEN; ++i) {
                    packet[sizeof(icmphdr) + i] = static_cast<u8>('w' + i);
                }
                u16 csum = icmp_checksum(packet, sizeof(packet));
                packet[2] = static_cast<u8>(csum >> 8);
                packet[3] = static_cast<u8>(csum & 0xFF);

                sockaddr_in dst = make_sockaddr(ip, 0);
                ssize_t n = ::sendto(sock.fd.get(), packet, sizeof(packet), 0, reinterpret_cast<sockaddr *>(&dst),
                                     sizeof(dst));
                if (n < 0) {
                    echo::category("whoshome.probe.icmp").trace("sendto ", ipv4_to_string(ip), ": ", std::strerror(errno));
                    return ProbeOutcome::Unreachable;
                }

                using clock = std::chrono::steady_clock;
                const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
                u8 buf[1500];

                while (true) {
                    auto now = clock::now();
                    if (now >= deadline)
                        return ProbeOutcome::Unreachable;
                    auto left = static_cast<u32>(
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

                    switch (wait_for(sock.fd.get(), POLLIN, left, cancel)) {
                    case WaitResult::Ready:
                        break;
                    case WaitResult::Cancelled:
                        return ProbeOutcome::Cancelled;
                    case WaitResult::Timeout:
                    case WaitResult::Error:
                        return ProbeOutcome::Unreachable;
                    }

                    sockaddr_in from{};
                    socklen_t from_len = sizeof(from);
                    ssize_t got = ::recvfrom(sock.fd.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&from),
                                             &from_len);
                    if (got <= 0)
                        continue;
                    if (ntohl(from.sin_addr.s_addr) != ip)
                        continue;

                    usize offset = 0;
                    if (sock.raw) {
                        offset = static_cast<usize>(buf[0] & 0x0F) * 4; // raw sockets deliver the IP header
                    }
                    if (static_cast<usize>(got) < offset + sizeof(icmphdr))
                        continue;

                    const u8 *icmp = buf + offset;
                    if (icmp[0] != ICMP_ECHOREPLY)
                        continue;
                    u16 reply_seq = static_cast<u16>((icmp[6] << 8) | icmp[7]);
                    if (reply_seq != seq)
                        continue;
                    // Datagram sockets rewrite the identifier, so only raw replies are checked
                    if (sock.raw) {
                        u16 reply_id = static_cast<u16>((icmp[4] << 8) | icmp[5]);
                        if (reply_id != ident_)
                            continue;
                    }
                    return ProbeOutcome::Reachable;
                }
            }
        };

    } // namespace probe
    using namespace probe;
} // namespace whoshome
