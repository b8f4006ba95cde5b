#pragma once

/*
===============================================================================
 bandlink::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket backend and delivered to the owning
Connection through a lock-free SPSC ring (see lcr::lockfree::spsc_ring).

    • Open   → asynchronous connect() completed, socket usable
    • Close  → socket closed (remote CLOSE frame, EOF); terminal
    • Error  → transport failure; terminal, followed by nothing

A backend emits exactly one terminal event (Close or Error) per connect()
attempt and nothing after it. Text frames travel on a separate ring.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "bandlink/core/transport/error.hpp"

namespace bandlink::core::transport::websocket {

enum class EventType : std::uint8_t {
    Open  = 0,
    Close = 1,
    Error = 2
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None};   // meaningful for Close / Error

    static constexpr Event make_open() noexcept {
        return Event{EventType::Open, transport::Error::None};
    }

    static constexpr Event make_close(transport::Error reason = transport::Error::RemoteClosed) noexcept {
        return Event{EventType::Close, reason};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace bandlink::core::transport::websocket
