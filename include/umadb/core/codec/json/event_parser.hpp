#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "umadb/core/codec/json/helpers.hpp"
#include "umadb/core/codec/json/result.hpp"
#include "umadb/dcb/event.hpp"
#include "umadb/dcb/uuid.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Event Parser
================================================================================

Builds a dcb::Event from a JSON object:

  {"type": "OrderPlaced", "data": "...", "tags": ["order:1"], "uuid": "..."}

  type   string, required
  data   string, required (stored as the raw UTF-8 bytes)
  tags   array of strings, optional
  uuid   string, optional; any accepted Uuid text form

Unknown fields are ignored. `out` is only written on Result::Parsed.
================================================================================
*/


namespace umadb::core::codec::json {

struct event_parser {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, dcb::Event& out) {
        // Root must be an object
        if (!helper::require_object(root)) {
            UMADB_DEBUG("[JSON] Root not an object -> reject event.");
            return Result::InvalidSchema;
        }

        // type (required)
        std::string_view type;
        if (!helper::parse_string_required(root, "type", type)) {
            UMADB_DEBUG("[JSON] Field 'type' missing or invalid -> reject event.");
            return Result::InvalidSchema;
        }

        // data (required)
        std::string_view data;
        if (!helper::parse_string_required(root, "data", data)) {
            UMADB_DEBUG("[JSON] Field 'data' missing or invalid -> reject event.");
            return Result::InvalidSchema;
        }

        // tags (optional, strict)
        std::vector<std::string> tags;
        if (!helper::parse_string_list_optional(root, "tags", tags)) {
            UMADB_DEBUG("[JSON] Field 'tags' invalid -> reject event.");
            return Result::InvalidSchema;
        }

        // uuid (optional)
        std::string_view uuid_text;
        bool has_uuid = false;
        if (!helper::parse_string_optional(root, "uuid", uuid_text, has_uuid)) {
            UMADB_DEBUG("[JSON] Field 'uuid' invalid -> reject event.");
            return Result::InvalidSchema;
        }
        std::optional<dcb::Uuid> uuid;
        if (has_uuid) {
            dcb::Uuid parsed;
            if (!dcb::Uuid::parse(uuid_text, parsed)) {
                UMADB_DEBUG("[JSON] Field 'uuid' is not a valid uuid: '" << uuid_text << "' -> reject event.");
                return Result::InvalidValue;
            }
            uuid = parsed;
        }

        out = dcb::Event{std::string(type), data, std::move(tags), uuid};
        return Result::Parsed;
    }

    // Parses one line of a JSON Lines document. Blank lines are Ignored.
    [[nodiscard]]
    static inline Result parse_line(simdjson::dom::parser& parser, std::string_view line, dcb::Event& out) {
        if (line.find_first_not_of(" \t\r\n") == std::string_view::npos) {
            return Result::Ignored;
        }
        simdjson::dom::element root;
        if (parser.parse(line.data(), line.size()).get(root)) {
            UMADB_DEBUG("[JSON] Malformed JSON line -> reject event.");
            return Result::InvalidJson;
        }
        return parse(root, out);
    }
};

} // namespace umadb::core::codec::json
