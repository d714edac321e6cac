#pragma once

#include <utility>

#include "wirelink/core/codec/format.hpp"
#include "wirelink/core/transport/frame.hpp"


namespace wirelink::core::codec {

using Bytes = transport::Bytes;

// An encoded application payload together with the format it was (or is
// expected to be) encoded with.
struct Message {
    Format format{Format::Json};
    Bytes payload;

    Message() = default;
    Message(Format f, Bytes bytes)
        : format(f)
        , payload(std::move(bytes))
    {}
};

} // namespace wirelink::core::codec
