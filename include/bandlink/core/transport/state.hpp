#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::transport {

/*
===============================================================================
 Bridge connection state machine vocabulary
===============================================================================

                 open()                      backend Open
  Disconnected ---------> Connecting ----------------------> Connected
       ^                    |    ^                               |
       |      connect failed|    | retry timer                   | close / error /
       |                    v    |                               | health timeout
       +--- exhausted --- WaitingReconnect <---------------------+

  close() from any state passes through Disconnecting and ends in
  Disconnected with DisconnectReason::LocalClose.
===============================================================================
*/

enum class State : std::uint8_t {
    Disconnected,
    Connecting,         // exactly one backend connect() outstanding
    Connected,
    WaitingReconnect,   // backoff timer armed
    Disconnecting       // socket being released
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:     return "disconnected";
        case State::Connecting:       return "connecting";
        case State::Connected:        return "connected";
        case State::WaitingReconnect: return "waiting-reconnect";
        case State::Disconnecting:    return "disconnecting";
    }
    return "?";
}


// Inputs to the state machine
enum class Event : std::uint8_t {
    OpenRequested,
    CloseRequested,
    TransportConnected,
    TransportConnectFailed,
    TransportClosed,
    HealthTimeout,
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:          return "open-requested";
        case Event::CloseRequested:         return "close-requested";
        case Event::TransportConnected:     return "transport-connected";
        case Event::TransportConnectFailed: return "transport-connect-failed";
        case Event::TransportClosed:        return "transport-closed";
        case Event::HealthTimeout:          return "health-timeout";
        case Event::RetryTimerExpired:      return "retry-timer-expired";
    }
    return "?";
}


// Why the last Connected period ended (or why the connection gave up)
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,
    TransportError,     // remote close, socket error, backpressure
    HealthTimeout,      // bridge stopped answering health checks
    RetryExhausted
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "none";
        case DisconnectReason::LocalClose:     return "local close";
        case DisconnectReason::TransportError: return "transport error";
        case DisconnectReason::HealthTimeout:  return "health timeout";
        case DisconnectReason::RetryExhausted: return "retry exhausted";
    }
    return "?";
}

} // namespace bandlink::core::transport
