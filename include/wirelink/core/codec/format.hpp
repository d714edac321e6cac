#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace wirelink::core::codec {

// Closed set of wire formats. The format is an out-of-band agreement between
// peers: payload bytes never carry a format marker.
enum class Format : std::uint8_t {
    Json,
    Cbor
};

[[nodiscard]]
inline constexpr std::string_view to_string(Format f) noexcept {
    switch (f) {
        case Format::Json: return "JSON";
        case Format::Cbor: return "CBOR";
        default:           return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Format f) {
    return os << to_string(f);
}

} // namespace wirelink::core::codec
