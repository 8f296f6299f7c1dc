#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "cancel.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace whoshome {
    namespace net {

        // ─── Owned file descriptor ───────────────────────────────────────────────────
        class Fd {
            int fd_ = -1;

          public:
            Fd() = default;
            explicit Fd(int fd) : fd_(fd) {}
            ~Fd() { reset(); }

            Fd(const Fd &) = delete;
            Fd &operator=(const Fd &) = delete;
            Fd(Fd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
            Fd &operator=(Fd &&other) noexcept {
                if (this != &other) {
                    reset();
                    fd_ = other.fd_;
                    other.fd_ = -1;
                }
                return *this;
            }

            int get() const noexcept { return fd_; }
            bool valid() const noexcept { return fd_ >= 0; }

            void reset() noexcept {
                if (fd_ >= 0) {
                    ::close(fd_);
                    fd_ = -1;
                }
            }
        };

        inline dp::String errno_string(const char *what) {
            return dp::String(what) + ": " + dp::String(std::strerror(errno));
        }

        inline bool set_nonblocking(int fd) noexcept {
            int flags = ::fcntl(fd, F_GETFL, 0);
            return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
        }

        inline sockaddr_in make_sockaddr(u32 ip, u16 port) noexcept {
            sockaddr_in sa{};
            sa.sin_family = AF_INET;
            sa.sin_addr.s_addr = htonl(ip);
            sa.sin_port = htons(port);
            return sa;
        }

        // ─── Bounded, cancellable readiness wait ────────────────────────────────────
        enum class WaitResult : u8 { Ready, Timeout, Cancelled, Error };

        inline WaitResult wait_for(int fd, short events, u32 timeout_ms, const CancelSignal *cancel) {
            using clock = std::chrono::steady_clock;
            const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

            while (true) {
                if (cancel && cancel->raised())
                    return WaitResult::Cancelled;

                auto now = clock::now();
                if (now >= deadline)
                    return WaitResult::Timeout;
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

                pollfd fds[2];
                nfds_t n = 0;
                fds[n++] = pollfd{fd, events, 0};
                const bool watch_cancel = cancel && cancel->fd() >= 0;
                if (watch_cancel) {
                    fds[n++] = pollfd{cancel->fd(), POLLIN, 0};
                } else if (cancel && left > 100) {
                    left = 100; // no eventfd: re-check the flag periodically
                }

                int rc = ::poll(fds, n, static_cast<int>(left) + 1);
                if (rc < 0) {
                    if (errno == EINTR)
                        continue;
                    return WaitResult::Error;
                }
                if (watch_cancel && (fds[1].revents & POLLIN))
                    return WaitResult::Cancelled;
                if (fds[0].revents & POLLNVAL)
                    return WaitResult::Error;
                if (fds[0].revents & (events | POLLERR | POLLHUP))
                    return WaitResult::Ready;
            }
        }

        // ─── TCP connect with deadline ───────────────────────────────────────────────
        // Refused connections come back as ErrorCode::Refused: the peer is up.
        inline Result<Fd> tcp_connect(u32 ip, u16 port, u32 timeout_ms, const CancelSignal *cancel) {
            if (cancel && cancel->raised()) {
                return Result<Fd>::err(Error::cancelled());
            }
            Fd sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
            if (!sock.valid()) {
                return Result<Fd>::err(Error::socket_error(errno_string("socket")));
            }
            if (!set_nonblocking(sock.get())) {
                return Result<Fd>::err(Error::socket_error(errno_string("fcntl")));
            }

            sockaddr_in sa = make_sockaddr(ip, port);
            int rc = ::connect(sock.get(), reinterpret_cast<sockaddr *>(&sa), sizeof(sa));
            if (rc == 0) {
                return Result<Fd>::ok(std::move(sock));
            }
            if (errno == ECONNREFUSED) {
                return Result<Fd>::err(Error::refused("connection refused"));
            }
            if (errno != EINPROGRESS) {
                return Result<Fd>::err(Error::socket_error(errno_string("connect")));
            }

            switch (wait_for(sock.get(), POLLOUT, timeout_ms, cancel)) {
            case WaitResult::Ready:
                break;
            case WaitResult::Timeout:
                return Result<Fd>::err(Error::timeout("connect timed out"));
            case WaitResult::Cancelled:
                return Result<Fd>::err(Error::cancelled());
            case WaitResult::Error:
                return Result<Fd>::err(Error::socket_error(errno_string("poll")));
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                return Result<Fd>::err(Error::socket_error(errno_string("getsockopt")));
            }
            if (so_error == ECONNREFUSED) {
                return Result<Fd>::err(Error::refused("connection refused"));
            }
            if (so_error != 0) {
                return Result<Fd>::err(Error::socket_error("connect: " + dp::String(std::strerror(so_error))));
            }
            return Result<Fd>::ok(std::move(sock));
        }

    } // namespace net
    using namespace net;
} // namespace whoshome
