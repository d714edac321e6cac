#pragma once

/*
===============================================================================
 wirelink::core::codec
===============================================================================

Stateless serialize / deserialize dispatch over a closed set of wire formats
(JSON, CBOR).

Two layers:

  • Value layer  - encode()/decode() between bytes and codec::Value
                   (nlohmann::json). Implemented out of line.
  • Typed layer  - serialize<T>()/deserialize<T>() for any T that nlohmann can
                   convert through ADL to_json / from_json.

Guarantees:

  • No side effects, no shared state; safe to call from any thread.
  • Deterministic output. Identical input and format always produce
    identical bytes. JSON members are emitted in lexicographic key order.
    CBOR maps follow RFC 8949 deterministic key order (shorter keys first,
    then bytewise) with shortest-form integers and lengths.
  • CBOR and JSON input nested deeper than config::MAX_JSON_DEPTH is
    rejected before it can exhaust the stack.
  • Malformed input never throws out of this API; it is reported as
    ErrorCode::DecodeFailure with the parser's diagnostic.

JSON text is parsed with simdjson and materialized into the value model.
CBOR is read and written by nlohmann::json.
===============================================================================
*/

#include <cstdint>
#include <span>
#include <string>
#include <concepts>

#include <nlohmann/json.hpp>

#include "wirelink/core/codec/error.hpp"
#include "wirelink/core/codec/format.hpp"
#include "wirelink/core/codec/message.hpp"


namespace wirelink::core::codec {

using Value = nlohmann::json;

// -----------------------------------------------------------------------------
// Value layer
// -----------------------------------------------------------------------------

[[nodiscard]]
Error encode(const Value& value, Format format, Bytes& out);

[[nodiscard]]
Error decode(std::span<const std::uint8_t> in, Format format, Value& out);

// -----------------------------------------------------------------------------
// Payload capabilities
// -----------------------------------------------------------------------------

template <typename T>
concept Serializable = requires(const T& value) {
    { Value(value) } -> std::same_as<Value>;
};

template <typename T>
concept Deserializable = std::default_initializable<T> && requires(const Value& v) {
    v.template get<T>();
};

// -----------------------------------------------------------------------------
// Typed layer
// -----------------------------------------------------------------------------

template <Serializable T>
[[nodiscard]]
inline Error serialize(const T& value, Format format, Bytes& out) {
    Value tree;
    try {
        tree = Value(value);
    } catch (const nlohmann::json::exception& e) {
        return Error::encode_failure(e.what());
    }
    return encode(tree, format, out);
}

template <Serializable T>
[[nodiscard]]
inline Error serialize(const T& value, Format format, Message& out) {
    out.format = format;
    return serialize(value, format, out.payload);
}

template <Deserializable T>
[[nodiscard]]
inline Error deserialize(std::span<const std::uint8_t> in, Format format, T& out) {
    Value tree;
    Error err = decode(in, format, tree);
    if (!err.ok()) {
        return err;
    }
    try {
        out = tree.template get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Error::decode_failure(e.what());
    }
    return Error::none();
}

template <Deserializable T>
[[nodiscard]]
inline Error deserialize(const Message& in, T& out) {
    return deserialize(std::span<const std::uint8_t>(in.payload), in.format, out);
}

} // namespace wirelink::core::codec
