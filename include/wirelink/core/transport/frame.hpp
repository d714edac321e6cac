#pragma once

/*
===============================================================================
 wirelink::core::transport::Frame
===============================================================================

One discrete unit of transport-level data exchanged with a Handle.

Data frames (Binary, Text) carry application payload. Control frames (Ping,
Pong, Close) carry at most a short opaque payload that the session layer never
interprets.

Frames are plain values: the session layer builds them on the write path and
the handle fills them in on the read path. A Frame read from a handle owns its
bytes and stays valid after the handle is closed.
===============================================================================
*/

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>


namespace wirelink::core::transport {

using Bytes = std::vector<std::uint8_t>;

enum class FrameType : std::uint8_t {
    Binary,
    Text,
    Ping,
    Pong,
    Close
};

[[nodiscard]]
inline constexpr std::string_view to_string(FrameType t) noexcept {
    switch (t) {
        case FrameType::Binary: return "Binary";
        case FrameType::Text:   return "Text";
        case FrameType::Ping:   return "Ping";
        case FrameType::Pong:   return "Pong";
        case FrameType::Close:  return "Close";
        default:                return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, FrameType t) {
    return os << to_string(t);
}

[[nodiscard]]
inline constexpr bool is_control(FrameType t) noexcept {
    return t == FrameType::Ping || t == FrameType::Pong || t == FrameType::Close;
}

struct Frame {
    FrameType type{FrameType::Binary};
    Bytes payload;

    static Frame binary(Bytes data) {
        return Frame{FrameType::Binary, std::move(data)};
    }

    static Frame text(std::string_view data) {
        return Frame{FrameType::Text, Bytes(data.begin(), data.end())};
    }

    static Frame ping() {
        return Frame{FrameType::Ping, {}};
    }

    static Frame pong(Bytes data = {}) {
        return Frame{FrameType::Pong, std::move(data)};
    }

    static Frame close() {
        return Frame{FrameType::Close, {}};
    }
};

} // namespace wirelink::core::transport
