#pragma once

#include <memory>
#include <string>
#include <concepts>

#include "wirelink/core/transport/error.hpp"
#include "wirelink/core/transport/frame.hpp"

namespace wirelink::core::transport {

// -----------------------------------------------------------------------------
// HandleConcept
// -----------------------------------------------------------------------------
//
// A Handle is one live, bidirectional frame stream produced by a Transport.
//
//   • write() sends exactly one frame. The session layer guarantees that at
//     most one write() is in progress at any time.
//   • read() blocks until one frame is available. Peer closure is reported
//     as a Close frame (Error::None) the first time, then as RemoteClosed.
//   • close() is idempotent and may be called from another thread while a
//     read() is blocked; the blocked read() must then return an error.
//
// No callbacks and no hidden retries: a Handle never reconnects itself.
// -----------------------------------------------------------------------------

template<class H>
concept HandleConcept =
    requires(H h, const Frame& in, Frame& out)
{
    { h.write(in) } -> std::same_as<Error>;
    { h.read(out) } -> std::same_as<Error>;
    { h.close() } -> std::same_as<Error>;
};

// -----------------------------------------------------------------------------
// TransportConcept
// -----------------------------------------------------------------------------
//
// Capability to open handles towards an address: open(address) -> handle|Error.
// A Transport holds no per-connection state; every successful open() returns
// a fresh, exclusively owned Handle.
// -----------------------------------------------------------------------------

template<class T>
concept TransportConcept =
    HandleConcept<typename T::handle_type> &&
    requires(T t, const std::string& address, std::unique_ptr<typename T::handle_type>& out)
{
    { t.open(address, out) } -> std::same_as<Error>;
};

} // namespace wirelink::core::transport
