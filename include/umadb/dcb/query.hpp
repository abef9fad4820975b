// NOTE: This header defines a public domain type.
// Users should include <umadb.hpp> instead of this file directly.

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "umadb/dcb/event.hpp"
#include "umadb/dcb/sequenced_event.hpp"


namespace umadb::dcb {

/*
===============================================================================
Query model
===============================================================================

A Query is a flat OR of ANDs:

  matches(event, item)  = (item.types is empty OR event.type in item.types)
                          AND (every tag of item.tags is a tag of event)

  matches(event, query) = query.items is empty
                          OR some item of query.items matches event

No nesting, no negation. String comparison is byte-exact. Duplicate types
or tags are harmless: only presence is tested. An event without tags only
matches items without tags.

Matching is pure and is evaluated identically by the store, so a client can
predict the outcome of an append condition with the same functions.
===============================================================================
*/

struct QueryItem {
    std::vector<std::string> types; // empty = any type
    std::vector<std::string> tags;  // all must be present; empty = no constraint

    friend bool operator==(const QueryItem&, const QueryItem&) = default;
};

struct Query {
    std::vector<QueryItem> items;   // OR semantics; empty = everything

    // The universal query
    [[nodiscard]] static Query all() { return Query{}; }

    [[nodiscard]] bool is_universal() const noexcept { return items.empty(); }

    friend bool operator==(const Query&, const Query&) = default;
};

[[nodiscard]] bool matches(const Event& event, const QueryItem& item) noexcept;
[[nodiscard]] bool matches(const Event& event, const Query& query) noexcept;

[[nodiscard]] inline bool matches(const SequencedEvent& e, const Query& query) noexcept {
    return matches(e.event, query);
}

std::ostream& operator<<(std::ostream&, const QueryItem&);
std::ostream& operator<<(std::ostream&, const Query&);

} // namespace umadb::dcb
