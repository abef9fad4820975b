// NOTE: This header defines a public domain type.
// Users should include <umadb.hpp> instead of this file directly.

#pragma once

#include <iosfwd>

#include "umadb/dcb/event.hpp"
#include "umadb/dcb/types.hpp"


namespace umadb::dcb {

// -----------------------------
// Event annotated with its durable position, as read back from the store
// -----------------------------
struct SequencedEvent {
    Event    event;
    Position position = 0;

    friend bool operator==(const SequencedEvent&, const SequencedEvent&) = default;
};

std::ostream& operator<<(std::ostream&, const SequencedEvent&);

} // namespace umadb::dcb
