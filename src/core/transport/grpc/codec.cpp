#include "umadb/core/transport/grpc/codec.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "umadb/dcb/uuid.hpp"


namespace umadb::core::transport::grpc::codec {

void encode(const dcb::Event& in, ::umadb::v1::Event& out) {
    out.set_event_type(in.event_type());
    out.set_data(in.data().data(), in.data().size());
    for (const auto& tag : in.tags()) {
        out.add_tags(tag);
    }
    if (in.uuid()) {
        out.set_uuid(in.uuid()->to_string());
    }
}

void encode(const dcb::Query& in, ::umadb::v1::Query& out) {
    for (const auto& item : in.items) {
        auto* wire = out.add_items();
        for (const auto& type : item.types) {
            wire->add_types(type);
        }
        for (const auto& tag : item.tags) {
            wire->add_tags(tag);
        }
    }
}

void encode(const protocol::AppendRequest& in, ::umadb::v1::AppendRequest& out) {
    out.mutable_events()->Reserve(static_cast<int>(in.events.size()));
    for (const auto& event : in.events) {
        encode(event, *out.add_events());
    }
    if (in.condition) {
        auto* condition = out.mutable_condition();
        encode(in.condition->fail_if_events_match, *condition->mutable_fail_if_events_match());
        if (in.condition->after) {
            condition->set_after(*in.condition->after);
        }
    }
}

void encode(const protocol::ReadRequest& in, std::uint32_t batch_size, ::umadb::v1::ReadRequest& out) {
    if (in.query) {
        encode(*in.query, *out.mutable_query());
    }
    if (in.start) {
        out.set_start(*in.start);
    }
    out.set_backwards(in.backwards);
    if (in.limit) {
        out.set_limit(*in.limit);
    }
    out.set_subscribe(in.subscribe);
    out.set_batch_size(batch_size);
}

umadb::Error decode(const ::umadb::v1::Event& in, dcb::Event& out) {
    std::optional<dcb::Uuid> uuid;
    if (!in.uuid().empty()) {
        dcb::Uuid parsed;
        if (!dcb::Uuid::parse(in.uuid(), parsed)) {
            return umadb::Error{ErrorCode::Corruption, "store returned an invalid uuid '" + in.uuid() + "'"};
        }
        uuid = parsed;
    }
    const std::string& raw = in.data();
    dcb::Bytes data(raw.begin(), raw.end());
    std::vector<std::string> tags(in.tags().begin(), in.tags().end());
    out = dcb::Event{in.event_type(), std::move(data), std::move(tags), uuid};
    return umadb::Error{};
}

umadb::Error decode(const ::umadb::v1::SequencedEvent& in, dcb::SequencedEvent& out) {
    if (!in.has_event()) {
        return umadb::Error{ErrorCode::Corruption,
                            "store returned position " + std::to_string(in.position()) + " without an event"};
    }
    if (auto err = decode(in.event(), out.event); !err.ok()) {
        return err;
    }
    out.position = in.position();
    return umadb::Error{};
}

umadb::Error decode(const ::umadb::v1::ReadResponse& in, protocol::ReadBatch& out) {
    out.events.reserve(out.events.size() + static_cast<std::size_t>(in.events_size()));
    for (const auto& wire : in.events()) {
        dcb::SequencedEvent event;
        if (auto err = decode(wire, event); !err.ok()) {
            return err;
        }
        out.events.push_back(std::move(event));
    }
    if (in.has_head()) {
        out.head = in.head();
    }
    return umadb::Error{};
}

} // namespace umadb::core::transport::grpc::codec
