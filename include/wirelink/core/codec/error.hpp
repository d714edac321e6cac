#pragma once

#include <string>
#include <string_view>
#include <utility>


namespace wirelink::core::codec {

enum class ErrorCode {
    None = 0,
    EncodeFailure,   // Value cannot be represented in the requested format
    DecodeFailure    // Bytes are not a valid encoding, or do not match the target type
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:          return "None";
        case ErrorCode::EncodeFailure: return "EncodeFailure";
        case ErrorCode::DecodeFailure: return "DecodeFailure";
        default:                       return "Unknown";
    }
}

// Per-call codec outcome. `message` carries the underlying parser or
// serializer diagnostic and is empty on success.
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;

    [[nodiscard]]
    bool ok() const noexcept { return code == ErrorCode::None; }

    static Error none() { return {}; }

    static Error encode_failure(std::string msg) {
        return Error{ErrorCode::EncodeFailure, std::move(msg)};
    }

    static Error decode_failure(std::string msg) {
        return Error{ErrorCode::DecodeFailure, std::move(msg)};
    }
};

} // namespace wirelink::core::codec
