#pragma once

#include <concepts>
#include <string_view>

#include <windows.h>
#include <winhttp.h>


namespace bandlink::core::transport::winhttp {

// The three WinHTTP WebSocket calls the backend makes once the upgrade is
// done. WebSocketImpl takes them as a policy so its receive loop can be driven
// by a scripted implementation in tests.
template<class T>
concept ApiConcept = requires(T api, HINTERNET ws, void* buffer, DWORD size, DWORD* bytes,
                              WINHTTP_WEB_SOCKET_BUFFER_TYPE* type, std::string_view text) {
    { api.websocket_receive(ws, buffer, size, bytes, type) } -> std::same_as<DWORD>;
    { api.websocket_send_text(ws, text) } -> std::same_as<DWORD>;
    { api.websocket_close(ws) } -> std::same_as<void>;
};

struct RealApi {
    DWORD websocket_receive(HINTERNET ws, void* buffer, DWORD size, DWORD* bytes, WINHTTP_WEB_SOCKET_BUFFER_TYPE* type) noexcept {
        return WinHttpWebSocketReceive(ws, buffer, size, bytes, type);
    }

    // Bridge commands always fit one UTF-8 message frame
    DWORD websocket_send_text(HINTERNET ws, std::string_view text) noexcept {
        return WinHttpWebSocketSend(ws, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE,
                                    const_cast<char*>(text.data()), static_cast<DWORD>(text.size()));
    }

    void websocket_close(HINTERNET ws) noexcept {
        WinHttpWebSocketClose(ws, WINHTTP_WEB_SOCKET_SUCCESS_CLOSE_STATUS, nullptr, 0);
    }
};
static_assert(ApiConcept<RealApi>);

} // namespace bandlink::core::transport::winhttp
