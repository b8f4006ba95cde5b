#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "bandlink/core/transport/error.hpp"


namespace bandlink::core::transport {

struct ParsedUrl {
    bool secure{false};     // wss:// (recognized so callers can refuse it)
    std::string host;
    std::string port;       // decimal, 1..65535
    std::string path;       // always starts with '/'
};

// Splits "ws[s]://host[:port][/path]". The bridge is a loopback service, so
// userinfo and IPv6 literals are not supported; a query string stays in path.
//
//   ws://127.0.0.1:18765      -> host 127.0.0.1, port 18765, path /
//   ws://localhost/bridge     -> host localhost, port 80,    path /bridge
[[nodiscard]]
inline Error parse_url(std::string_view url, ParsedUrl& out) {
    out = ParsedUrl{};

    const std::size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Error::InvalidUrl;
    }
    const std::string_view scheme = url.substr(0, scheme_end);
    if (scheme == "wss") {
        out.secure = true;
    }
    else if (scheme != "ws") {
        return Error::InvalidUrl;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    std::string_view authority = rest;
    out.path = "/";
    if (const std::size_t slash = rest.find('/'); slash != std::string_view::npos) {
        authority = rest.substr(0, slash);
        out.path = std::string(rest.substr(slash));
    }

    std::string_view host = authority;
    std::string_view port = out.secure ? "443" : "80";
    if (const std::size_t colon = authority.find(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty() || port.empty()) {
        return Error::InvalidUrl;
    }

    std::uint32_t number = 0;
    const char* first = port.data();
    const char* last = port.data() + port.size();
    const auto [end, ec] = std::from_chars(first, last, number);
    if (ec != std::errc{} || end != last || number == 0 || number > 65535) {
        return Error::InvalidUrl;
    }

    out.host = std::string(host);
    out.port = std::string(port);
    return Error::None;
}

} // namespace bandlink::core::transport
