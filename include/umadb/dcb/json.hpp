#pragma once

#include <string>

#include "umadb/dcb/event.hpp"
#include "umadb/dcb/sequenced_event.hpp"


namespace umadb::dcb {

// -----------------------------------------------------------------------------
// Deterministic single-line JSON rendering, for tools and diagnostics.
//
//   {"type":"Created","data":"x","tags":["order:1"],"uuid":"..."}
//   {"position":1,"event":{...}}
//
// A payload made of printable ASCII (plus \t \r \n) is emitted as a string
// under "data"; anything else is emitted as lowercase hex under "data_hex".
// "uuid" is omitted when absent.
// -----------------------------------------------------------------------------
[[nodiscard]] std::string to_json(const Event& e);
[[nodiscard]] std::string to_json(const SequencedEvent& e);

} // namespace umadb::dcb
