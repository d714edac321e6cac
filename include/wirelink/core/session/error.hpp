#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "wirelink/core/transport/error.hpp"
#include "wirelink/core/codec/error.hpp"


namespace wirelink::core::session {

enum class ErrorCode : uint8_t {
    None = 0,
    ConnectFailed,        // transport refused the connection (no retry budget)
    SendFailed,           // not connected, or the frame write failed
    ReceiveFailed,        // not connected, or the frame read failed
    ConnectionClosed,     // peer sent a close frame
    EncodeFailure,        // codec could not encode the value
    DecodeFailure,        // codec could not decode the payload
    ReconnectExhausted,   // retry budget consumed; session is Terminated
    InvalidState,         // operation not allowed in the current state
    InvalidConfig,        // configuration rejected or feature disabled
    Cancelled             // disconnect() interrupted the operation
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:               return "None";
        case ErrorCode::ConnectFailed:      return "ConnectFailed";
        case ErrorCode::SendFailed:         return "SendFailed";
        case ErrorCode::ReceiveFailed:      return "ReceiveFailed";
        case ErrorCode::ConnectionClosed:   return "ConnectionClosed";
        case ErrorCode::EncodeFailure:      return "EncodeFailure";
        case ErrorCode::DecodeFailure:      return "DecodeFailure";
        case ErrorCode::ReconnectExhausted: return "ReconnectExhausted";
        case ErrorCode::InvalidState:       return "InvalidState";
        case ErrorCode::InvalidConfig:      return "InvalidConfig";
        case ErrorCode::Cancelled:          return "Cancelled";
        default:                            return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << to_string(code);
}

// -----------------------------------------------------------------------------
// Session-level outcome
//
// `cause` is the transport error behind the failure (None when the failure is
// not transport related), `attempts` the number of connection attempts made by
// the operation. Converts to true on failure:
//
//     if (auto err = session.send(msg)) { ... }
// -----------------------------------------------------------------------------
struct Error {
    ErrorCode code{ErrorCode::None};
    transport::Error cause{transport::Error::None};
    std::uint32_t attempts{0};
    std::string message;

    [[nodiscard]]
    bool ok() const noexcept { return code == ErrorCode::None; }

    [[nodiscard]]
    explicit operator bool() const noexcept { return !ok(); }

    static Error none() { return {}; }

    static Error make(ErrorCode code, std::string message = {}) {
        return Error{code, transport::Error::None, 0, std::move(message)};
    }

    static Error from_transport(ErrorCode code, transport::Error cause, std::uint32_t attempts = 0) {
        return Error{code, cause, attempts, std::string(transport::to_string(cause))};
    }

    static Error from_codec(const codec::Error& err) {
        const ErrorCode code = (err.code == codec::ErrorCode::EncodeFailure)
                             ? ErrorCode::EncodeFailure
                             : ErrorCode::DecodeFailure;
        return Error{code, transport::Error::None, 0, err.message};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& err) {
    os << err.code;
    if (err.cause != transport::Error::None) {
        os << " (cause=" << err.cause << ")";
    }
    if (err.attempts != 0) {
        os << " after " << err.attempts << " attempt(s)";
    }
    if (!err.message.empty() && err.message != transport::to_string(err.cause)) {
        os << ": " << err.message;
    }
    return os;
}

} // namespace wirelink::core::session
