/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven

The Supervisor drains them once per poll() and turns them into probe
arming/disarming, the resync command and monitor inputs.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  A WebSocket connection to the bridge has been established.
  Emitted once per transport lifetime; increments the transport epoch.

Disconnected
  An established connection became unusable (remote close, I/O error,
  health timeout or local close).

RetryScheduled
  A reconnect attempt has been scheduled according to the backoff policy.

RetryExhausted
  The reconnect policy reached its max-attempts bound. The Connection stays
  Disconnected until the next explicit open().

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Connected,
    Disconnected,
    RetryScheduled,
    RetryExhausted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:            return "None";
        case Signal::Connected:       return "Connected";
        case Signal::Disconnected:    return "Disconnected";
        case Signal::RetryScheduled:  return "RetryScheduled";
        case Signal::RetryExhausted:  return "RetryExhausted";
        default:                      return "Unknown";
    }
}

} // namespace bandlink::core::transport::connection
