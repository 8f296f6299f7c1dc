#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace whoshome {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        Timeout,
        InvalidConfig,
        InvalidAddress,
        InvalidState,
        InvalidData,
        NotConnected,
        SocketError,
        Refused,
        Cancelled,
        IoError,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error invalid_config(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidConfig, std::move(msg));
        }
        static Error invalid_address(const dp::String &addr) noexcept {
            return Error(ErrorCode::InvalidAddress, "invalid address: " + addr);
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error invalid_data(dp::String msg = "") noexcept { return Error(ErrorCode::InvalidData, std::move(msg)); }
        static Error not_connected(dp::String msg = "not connected") noexcept {
            return Error(ErrorCode::NotConnected, std::move(msg));
        }
        static Error socket_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::SocketError, std::move(msg));
        }
        static Error refused(dp::String msg = "") noexcept { return Error(ErrorCode::Refused, std::move(msg)); }
        static Error cancelled() noexcept { return Error(ErrorCode::Cancelled, "cancelled"); }
        static Error io_error(dp::String msg = "") noexcept { return Error(ErrorCode::IoError, std::move(msg)); }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace whoshome
