#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Helpers extracting primitive values from simdjson DOM elements.

  • Enforce basic JSON structure (object presence, type correctness)
  • Strict optional-field semantics: absent is fine, wrong type is not
  • Return boolean success/failure, never log, never throw

Semantic validation (e.g. uuid syntax) belongs to the parsers built on top.
================================================================================
*/


namespace umadb::core::codec::json::helper {

[[nodiscard]]
inline bool require_object(const simdjson::dom::element& root) noexcept {
    return root.type() == simdjson::dom::element_type::OBJECT;
}

// ------------------------------------------------------------
// REQUIRED STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (!require_object(obj)) {
        return false;
    }
    return !obj[key].get(out);
}

// ------------------------------------------------------------
// OPTIONAL STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    if (!require_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true; // not present
    }
    if (field.get(out)) {
        return false; // wrong type
    }
    present = true;
    return true;
}

// ------------------------------------------------------------
// OPTIONAL ARRAY OF STRINGS
// ------------------------------------------------------------
// NOTE: allocates, the strings are copied out of the parser buffer.
[[nodiscard]]
inline bool parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out) {
    out.clear();
    if (!require_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true; // not present
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return false; // wrong type
    }
    for (auto item : arr) {
        std::string_view sv;
        if (item.get(sv)) {
            return false;
        }
        out.emplace_back(sv);
    }
    return true;
}

} // namespace umadb::core::codec::json::helper
