#pragma once

#include <cstdint>
#include <string_view>

#include "bandlink/core/protocol/bridge/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Bridge JSON field extraction
================================================================================

Typed accessors over simdjson DOM elements, shared by the message parsers and
the config loader.

Rules:
  - a missing required field, or any field of the wrong JSON type, yields
    InvalidSchema
  - a missing optional field is not an error; the output is left empty
  - values are never interpreted here (range and enum checks belong to the
    per-message parsers), nothing is logged and nothing throws
================================================================================
*/


namespace bandlink::core::protocol::bridge::parser::helper {

namespace detail {

inline bool is_object(const simdjson::dom::element& e) noexcept {
    return e.type() == simdjson::dom::element_type::OBJECT;
}

// Looks `key` up in `obj`; false when the key is absent
template<typename T>
inline bool lookup(const simdjson::dom::element& obj, const char* key, T& out, bool& type_ok) noexcept {
    auto field = obj[key];
    if (field.error()) {
        type_ok = true;
        return false;
    }
    type_ok = !field.get(out);
    return true;
}

template<typename T>
[[nodiscard]] inline Result required_field(const simdjson::dom::element& obj, const char* key, T& out) noexcept {
    bool type_ok = false;
    if (!lookup(obj, key, out, type_ok) || !type_ok) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

template<typename T>
[[nodiscard]] inline Result optional_field(const simdjson::dom::element& obj, const char* key, lcr::optional<T>& out) noexcept {
    out.reset();
    T value{};
    bool type_ok = false;
    if (!lookup(obj, key, value, type_ok)) {
        return Result::Parsed;
    }
    if (!type_ok) {
        return Result::InvalidSchema;
    }
    out = value;
    return Result::Parsed;
}

} // namespace detail


[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return detail::is_object(root) ? Result::Parsed : Result::InvalidSchema;
}

// Nested objects and arrays hand out DOM views, so presence is reported separately

[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (!detail::is_object(parent)) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Parsed;
    }
    out = field.value_unsafe();
    if (!detail::is_object(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (!detail::is_object(parent)) {
        return Result::InvalidSchema;
    }
    return detail::required_field(parent, key, out);
}

[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (!detail::is_object(parent)) {
        return Result::InvalidSchema;
    }
    bool type_ok = false;
    if (!detail::lookup(parent, key, out, type_ok)) {
        return Result::Parsed;
    }
    if (!type_ok) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// Strings are views into the parser's buffer: valid until the next parse

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    return detail::required_field(obj, key, out);
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    bool type_ok = false;
    present = detail::lookup(obj, key, out, type_ok);
    if (!type_ok) {
        present = false;
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    return detail::required_field(obj, key, out);
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    return detail::optional_field(obj, key, out);
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    return detail::optional_field(obj, key, out);
}

// simdjson widens JSON integers to double on request
[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    return detail::required_field(obj, key, out);
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    return detail::optional_field(obj, key, out);
}

} // namespace bandlink::core::protocol::bridge::parser::helper
