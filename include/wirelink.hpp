#pragma once

/*
===============================================================================
Wirelink - Public API Entry Point
===============================================================================

Client-side WebSocket session lifecycle manager: connect, bounded reconnect
with exponential backoff, background liveness probing, and JSON / CBOR
payload encoding.

Symbols in wirelink::core are part of the public API contract. lcr:: holds
supporting utilities (logging, metrics, cancellation).
===============================================================================
*/

#include <wirelink/core.hpp>
