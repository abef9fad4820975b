#pragma once

#include <optional>
#include <vector>

#include "umadb/dcb/sequenced_event.hpp"
#include "umadb/dcb/types.hpp"


namespace umadb::core::protocol {

// One round trip worth of read results, in delivery order.
// `head` is the store head observed by the server when producing the batch,
// when the server reports it.
struct ReadBatch {
    std::vector<dcb::SequencedEvent> events;
    std::optional<dcb::Position>     head;

    void clear() noexcept {
        events.clear();
        head.reset();
    }
};

} // namespace umadb::core::protocol
