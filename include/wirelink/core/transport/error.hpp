#pragma once

#include <ostream>
#include <string_view>

namespace wirelink::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Beast, Asio, OpenSSL, ...).

Transport handles report these values; the session layer decides whether a
failure is retried (connect path) or surfaced to the caller (everything else).
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current handle state (e.g. already closed)
    Cancelled,        // Operation aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout
    ConnectionFailed, // DNS, TCP connect or routing failure
    HandshakeFailed,  // TLS or WebSocket upgrade failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified read/write failure
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error err) {
    return os << to_string(err);
}

} // namespace transport
} // namespace wirelink::core
