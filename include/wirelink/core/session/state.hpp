#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace wirelink::core::session {

// ===============================================================
// SESSION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Terminated
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Reconnecting:  return "Reconnecting";
        case State::Terminated:    return "Terminated";
        default:                   return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, State s) {
    return os << to_string(s);
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    ConnectRequested,
    ReconnectRequested,
    DisconnectRequested,
    ResetRequested,

    // --- Transport lifecycle ---
    TransportOpened,        // open() succeeded
    TransportOpenFailed,    // initial open() failed
    RetryStarted,           // policy is about to make attempt k
    RetryExhausted,         // policy gave up

    // --- Liveness ---
    LivenessFailed
};

// ===============================================================
// Event → string
// ===============================================================
[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:     return "ConnectRequested";
        case Event::ReconnectRequested:   return "ReconnectRequested";
        case Event::DisconnectRequested:  return "DisconnectRequested";
        case Event::ResetRequested:       return "ResetRequested";
        case Event::TransportOpened:      return "TransportOpened";
        case Event::TransportOpenFailed:  return "TransportOpenFailed";
        case Event::RetryStarted:         return "RetryStarted";
        case Event::RetryExhausted:       return "RetryExhausted";
        case Event::LivenessFailed:       return "LivenessFailed";
        default:                          return "UnknownEvent";
    }
}

inline std::ostream& operator<<(std::ostream& os, Event e) {
    return os << to_string(e);
}


// ===============================================================
// STATUS SNAPSHOT
// ===============================================================
//
// `attempt` carries the retry ordinal while state == Reconnecting and is 0
// in every other state.
struct Status {
    State state{State::Disconnected};
    std::uint32_t attempt{0};

    [[nodiscard]]
    bool is(State s) const noexcept { return state == s; }

    friend bool operator==(const Status&, const Status&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Status& s) {
    os << s.state;
    if (s.state == State::Reconnecting) {
        os << '(' << s.attempt << ')';
    }
    return os;
}

} // namespace wirelink::core::session
