#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "umadb/error.hpp"

namespace umadb::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level failure classification, abstracted away from library
specific codes (gRPC status codes, socket errors).

Transports report these internally; they never cross the public API. The
session maps them onto the public umadb::ErrorCode taxonomy with to_error().
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state (e.g. not connected)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Deadline exceeded while connecting or waiting for a response
    ConnectionFailed, // Connection attempt failed (DNS, refused, unreachable)
    HandshakeFailed   // TLS negotiation failed (TCP connectivity exists)
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    default:                       return "Unknown";
    }
}

// Maps a transport failure onto the public taxonomy. An invalid URL is
// caller input; everything else is a failure to talk to the store.
[[nodiscard]]
inline umadb::Error to_error(Error err, std::string detail) {
    if (err == Error::None) {
        return umadb::Error{};
    }
    const auto code = (err == Error::InvalidUrl) ? ErrorCode::Validation : ErrorCode::Transport;
    std::string message{to_string(err)};
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return umadb::Error{code, std::move(message)};
}

} // namespace transport
} // namespace umadb::core
