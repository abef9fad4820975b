#include "umadb/dcb/event.hpp"

#include <algorithm>
#include <ostream>
#include <utility>


namespace umadb::dcb {

Event::Event(std::string event_type, Bytes data, std::vector<std::string> tags, std::optional<Uuid> uuid)
    : event_type_(std::move(event_type))
    , data_(std::move(data))
    , tags_(std::move(tags))
    , uuid_(uuid)
{}

Event::Event(std::string event_type, std::string_view data, std::vector<std::string> tags, std::optional<Uuid> uuid)
    : event_type_(std::move(event_type))
    , data_(data.begin(), data.end())
    , tags_(std::move(tags))
    , uuid_(uuid)
{}

std::string Event::data_as_string() const {
    return std::string(data_.begin(), data_.end());
}

bool Event::has_tag(std::string_view tag) const noexcept {
    return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

Error make_event(std::string event_type,
                 std::string_view data,
                 std::vector<std::string> tags,
                 const std::optional<std::string>& uuid,
                 Event& out)
{
    std::optional<Uuid> parsed;
    if (uuid) {
        Uuid u;
        if (!Uuid::parse(*uuid, u)) {
            return Error{ErrorCode::Validation, "invalid uuid '" + *uuid + "'"};
        }
        parsed = u;
    }
    out = Event{std::move(event_type), data, std::move(tags), parsed};
    return Error{};
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Event& e) {
    os << "Event(type=" << e.event_type() << ", tags=[";
    for (std::size_t i = 0; i < e.tags().size(); ++i) {
        if (i > 0) os << ", ";
        os << e.tags()[i];
    }
    os << "], uuid=";
    if (e.uuid()) {
        os << *e.uuid();
    } else {
        os << "none";
    }
    os << ", bytes=" << e.data().size() << ")";
    return os;
}

} // namespace umadb::dcb
