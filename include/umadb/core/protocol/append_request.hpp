#pragma once

#include <optional>
#include <vector>

#include "umadb/dcb/append_condition.hpp"
#include "umadb/dcb/event.hpp"


namespace umadb::core::protocol {

// Events are appended contiguously and atomically; the condition, when
// present, is evaluated by the store in the same transaction.
struct AppendRequest {
    std::vector<dcb::Event>             events;
    std::optional<dcb::AppendCondition> condition;
};

} // namespace umadb::core::protocol
