#pragma once

#include <cstdint>
#include <string_view>

namespace bandlink::core::transport {

// Backend-neutral transport failure. The Beast backend maps
// boost::system::error_code onto it, the WinHTTP backend maps DWORD results.
enum class Error : std::uint8_t {
    None = 0,

    // Caller mistakes, never retried
    InvalidUrl,         // not ws://host[:port][/path]
    InvalidState,       // e.g. connect() on a socket that is already open

    // Orderly endings
    LocalShutdown,
    RemoteClosed,       // close frame or EOF from the bridge

    // The bridge may come back
    Timeout,
    ConnectionFailed,   // resolve or TCP connect refused
    HandshakeFailed,    // upgrade rejected
    TransportFailure,   // anything else the backend could not classify
    Backpressure,       // receive ring full, reactor fell behind

    ProtocolError       // websocket framing violation
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:             return "none";
        case Error::InvalidUrl:       return "invalid url";
        case Error::InvalidState:     return "invalid state";
        case Error::LocalShutdown:    return "local shutdown";
        case Error::RemoteClosed:     return "remote closed";
        case Error::Timeout:          return "timeout";
        case Error::ConnectionFailed: return "connection failed";
        case Error::HandshakeFailed:  return "handshake failed";
        case Error::TransportFailure: return "transport failure";
        case Error::Backpressure:     return "backpressure";
        case Error::ProtocolError:    return "protocol error";
    }
    return "?";
}

[[nodiscard]]
inline constexpr bool is_retryable(Error err) noexcept {
    switch (err) {
        case Error::RemoteClosed:
        case Error::Timeout:
        case Error::ConnectionFailed:
        case Error::HandshakeFailed:
        case Error::TransportFailure:
        case Error::Backpressure:
            return true;
        case Error::None:
        case Error::InvalidUrl:
        case Error::InvalidState:
        case Error::LocalShutdown:
        case Error::ProtocolError:
            return false;
    }
    return false;
}

} // namespace bandlink::core::transport
