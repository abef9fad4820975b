// NOTE: This header defines a public domain type.
// Users should include <umadb.hpp> instead of this file directly.

#pragma once

#include <iosfwd>
#include <optional>

#include "umadb/dcb/query.hpp"
#include "umadb/dcb/sequenced_event.hpp"
#include "umadb/dcb/types.hpp"


namespace umadb::dcb {

// -----------------------------------------------------------------------------
// AppendCondition
// -----------------------------------------------------------------------------
//
// Optimistic-concurrency predicate evaluated by the store atomically with an
// append: the append is rejected as a whole if any stored event at a
// position strictly greater than `after` matches `fail_if_events_match`.
// With `after` absent every stored event is considered.
//
// The boundary is exclusive: an event stored exactly at `after` never
// violates the condition.
//
// Typical use: read the decision model up to position P, then append with
// { query used for the decision, after = P }.
// -----------------------------------------------------------------------------
struct AppendCondition {
    Query                   fail_if_events_match;
    std::optional<Position> after;

    friend bool operator==(const AppendCondition&, const AppendCondition&) = default;
};

// True when the stored event `e` makes `condition` fail
[[nodiscard]]
inline bool is_violated_by(const AppendCondition& condition, const SequencedEvent& e) noexcept {
    if (condition.after && e.position <= *condition.after) {
        return false;
    }
    return matches(e.event, condition.fail_if_events_match);
}

std::ostream& operator<<(std::ostream&, const AppendCondition&);

} // namespace umadb::dcb
