#pragma once

#include <cstdio>
#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Writes `s` into `out` as the body of a JSON string literal
inline void append_escaped(std::string& out, std::string_view s) {
    for (const char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        }
        else if (c == '\n') { out += "\\n"; }
        else if (c == '\r') { out += "\\r"; }
        else if (c == '\t') { out += "\\t"; }
        else if (u < 0x20) {
            char esc[8];
            std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(u));
            out += esc;
        }
        else {
            out += c;
        }
    }
}

// "key":"value", value escaped; the key is trusted
inline void append_string_field(std::string& out, std::string_view key, std::string_view value) {
    out += '"';
    out += key;
    out += "\":\"";
    append_escaped(out, value);
    out += '"';
}

} // namespace json
} // namespace lcr
