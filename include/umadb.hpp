#pragma once

/*
===============================================================================
UmaDB - Public API Entry Point
===============================================================================

This is the primary public entry point of the UmaDB client.

It exposes the DCB domain types (events, queries, append conditions), the
error model and the blocking gRPC Client. The value types and matching
functions live in umadb::dcb and are re-exported into umadb for
convenience.

Only symbols reachable from this header are part of the public API
contract; umadb::core is an implementation layer.
===============================================================================
*/

#include <umadb/version.hpp>
#include <umadb/error.hpp>
#include <umadb/dcb/types.hpp>
#include <umadb/dcb/uuid.hpp>
#include <umadb/dcb/event.hpp>
#include <umadb/dcb/sequenced_event.hpp>
#include <umadb/dcb/query.hpp>
#include <umadb/dcb/append_condition.hpp>
#include <umadb/dcb/json.hpp>
#include <umadb/client.hpp>

namespace umadb {

using dcb::Position;
using dcb::Bytes;
using dcb::Uuid;
using dcb::Event;
using dcb::SequencedEvent;
using dcb::QueryItem;
using dcb::Query;
using dcb::AppendCondition;

using dcb::make_event;
using dcb::matches;
using dcb::is_violated_by;
using dcb::to_json;

} // namespace umadb
