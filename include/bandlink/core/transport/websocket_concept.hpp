/*
===============================================================================
WebSocketConcept
===============================================================================

Minimal backend contract required by transport::Connection.

The backend:

  • Is constructed with a reference to its telemetry block
  • Starts an asynchronous connect attempt in connect(); an immediate failure
    (bad host, resolver refusal) may be returned synchronously
  • Reports completion and termination as websocket::Event (Open / Close /
    Error) through poll_event()
  • Hands complete text frames to the reactor through poll_message()
  • Never blocks in send(); a send on a socket that is not open returns false
  • Is destroyed by Connection after close(); one instance per attempt

No callbacks cross threads. No dynamic dispatch.
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "bandlink/core/transport/error.hpp"
#include "bandlink/core/transport/websocket/events.hpp"
#include "bandlink/core/transport/telemetry/websocket.hpp"


namespace bandlink::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view msg,
        websocket::Event& ev,
        std::string& text
    )
{
    // Lifecycle
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Data plane
    { ws.send(msg) } noexcept -> std::same_as<bool>;
    { ws.poll_message(text) } noexcept -> std::same_as<bool>;

    // Control plane
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace bandlink::core::transport
