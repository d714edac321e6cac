#pragma once

/*
================================================================================
Wirelink Core - WebSocket Session Lifecycle
================================================================================

This file defines the primary entry point for Wirelink:

    wirelink::core::session::SessionT

It is a thin, explicit composition of:
  - the session Controller (state machine, retry, liveness)
  - the message codec (JSON / CBOR)
  - a concrete WebSocket backend (Boost.Beast)

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

    [1] Application Thread (user-owned)
        connect / send / receive / reconnect / disconnect

    [2] Maintenance Thread (owned by the Controller, started by maintain())
        liveness probes -> on failure: close handle, retry with backoff

Writes from both threads are ordered by one mutex owned by the Controller.
The maintenance thread never invokes user code.

Without maintain() there is no background thread and no implicit progress:
connection loss is observed by the application through send() / receive()
errors and repaired with reconnect().
================================================================================
*/

#include "wirelink/core/transport/concepts.hpp"
#include "wirelink/core/transport/beast/websocket.hpp"
#include "wirelink/core/codec/codec.hpp"
#include "wirelink/core/policy/reconnect.hpp"
#include "wirelink/core/liveness/scheduler.hpp"
#include "wirelink/core/session/controller.hpp"


namespace wirelink::core {

namespace transport {
    using TransportT = beast::Transport;
} // namespace transport

namespace session {
    using SessionT = Controller<transport::TransportT>;
} // namespace session

} // namespace wirelink::core
