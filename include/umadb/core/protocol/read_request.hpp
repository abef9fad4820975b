#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include "umadb/dcb/query.hpp"
#include "umadb/dcb/types.hpp"


namespace umadb::core::protocol {

// -----------------------------------------------------------------------------
// Read request (wire-neutral)
// -----------------------------------------------------------------------------
//
//   query      absent = universal query
//   start      forward: first position considered (inclusive)
//              backward: last position considered (inclusive)
//              absent = beginning of log (forward) / head (backward)
//   backwards  strictly decreasing positions when true
//   limit      maximum number of events delivered, in every mode
//   subscribe  keep the stream open after the historical events
//
// subscribe and backwards are mutually exclusive; the session rejects the
// combination before opening a call.
// -----------------------------------------------------------------------------
struct ReadRequest {
    std::optional<dcb::Query>    query;
    std::optional<dcb::Position> start;
    bool                         backwards = false;
    std::optional<std::uint32_t> limit;
    bool                         subscribe = false;
};

inline std::ostream& operator<<(std::ostream& os, const ReadRequest& r) {
    os << "ReadRequest{query=";
    if (r.query) os << *r.query; else os << "none";
    os << ", start=";
    if (r.start) os << *r.start; else os << "none";
    os << ", backwards=" << (r.backwards ? "true" : "false") << ", limit=";
    if (r.limit) os << *r.limit; else os << "none";
    os << ", subscribe=" << (r.subscribe ? "true" : "false") << "}";
    return os;
}

} // namespace umadb::core::protocol
