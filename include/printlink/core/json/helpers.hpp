#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "printlink/core/error.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON field helpers (simdjson DOM)
================================================================================

Schema-agnostic primitives shared by the configuration loader and the
connection history reader.

  • A missing optional key is not an error: the output is left reset
  • A present key of the wrong type is Error::InvalidArgument
  • Helpers never log, never throw and never validate semantics
================================================================================
*/

namespace printlink::core::json {

[[nodiscard]]
inline Error require_object(const simdjson::dom::element& e) noexcept {
    return (e.type() == simdjson::dom::element_type::OBJECT) ? Error::None : Error::InvalidArgument;
}

// ------------------------------------------------------------
// OPTIONAL OBJECT / ARRAY
// ------------------------------------------------------------
[[nodiscard]]
inline Error parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = parent[key];
    if (field.error()) {
        return Error::None;
    }
    out = field.value_unsafe();
    if (require_object(out) != Error::None) {
        return Error::InvalidArgument;
    }
    present = true;
    return Error::None;
}

[[nodiscard]]
inline Error parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = parent[key];
    if (field.error()) {
        return Error::None;
    }
    if (field.get(out)) {
        return Error::InvalidArgument;
    }
    present = true;
    return Error::None;
}

// ------------------------------------------------------------
// OPTIONAL SCALARS
// ------------------------------------------------------------
[[nodiscard]]
inline Error parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    out.reset();
    if (require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = obj[key];
    if (field.error()) {
        return Error::None;
    }
    bool tmp{};
    if (field.get(tmp)) {
        return Error::InvalidArgument;
    }
    out = tmp;
    return Error::None;
}

[[nodiscard]]
inline Error parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = obj[key];
    if (field.error()) {
        return Error::None;
    }
    std::uint64_t tmp{};
    if (field.get(tmp)) {
        return Error::InvalidArgument;
    }
    out = tmp;
    return Error::None;
}

[[nodiscard]]
inline Error parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = obj[key];
    if (field.error()) {
        return Error::None;
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return Error::InvalidArgument;
    }
    out = tmp;
    return Error::None;
}

// Integers are accepted where a double is expected ("threshold": 1)
[[nodiscard]]
inline Error parse_double_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    out.reset();
    if (require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = obj[key];
    if (field.error()) {
        return Error::None;
    }
    const simdjson::dom::element e = field.value_unsafe();
    double tmp{};
    if (e.is_int64()) {
        tmp = static_cast<double>(e.get_int64().value_unsafe());
    }
    else if (e.is_uint64()) {
        tmp = static_cast<double>(e.get_uint64().value_unsafe());
    }
    else if (e.get(tmp)) {
        return Error::InvalidArgument;
    }
    out = tmp;
    return Error::None;
}

[[nodiscard]]
inline Error parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) {
    out.reset();
    if (require_object(obj) != Error::None) {
        return Error::InvalidArgument;
    }
    auto field = obj[key];
    if (field.error()) {
        return Error::None;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Error::InvalidArgument;
    }
    out = std::string(sv);
    return Error::None;
}

} // namespace printlink::core::json
