// NOTE: This header defines a public domain type.
// Users should include <umadb.hpp> instead of this file directly.

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "umadb/dcb/types.hpp"
#include "umadb/dcb/uuid.hpp"
#include "umadb/error.hpp"


namespace umadb::dcb {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
//
// One domain event: a type name, an opaque payload, the tags used by
// queries and an optional uuid used by the store for idempotency.
//
// Immutable once constructed. Tags keep their insertion order so that an
// event read back from the store compares equal to the one appended; for
// matching purposes they behave as a set.
// -----------------------------------------------------------------------------
class Event {
public:
    Event() = default;

    Event(std::string event_type,
          Bytes data,
          std::vector<std::string> tags = {},
          std::optional<Uuid> uuid = std::nullopt);

    Event(std::string event_type,
          std::string_view data,
          std::vector<std::string> tags = {},
          std::optional<Uuid> uuid = std::nullopt);

    [[nodiscard]] const std::string& event_type() const noexcept { return event_type_; }
    [[nodiscard]] const Bytes& data() const noexcept { return data_; }
    [[nodiscard]] const std::vector<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] const std::optional<Uuid>& uuid() const noexcept { return uuid_; }

    // Payload reinterpreted as a byte string (no encoding implied)
    [[nodiscard]] std::string data_as_string() const;

    [[nodiscard]] bool has_tag(std::string_view tag) const noexcept;

    friend bool operator==(const Event&, const Event&) = default;

private:
    std::string event_type_;
    Bytes data_;
    std::vector<std::string> tags_;
    std::optional<Uuid> uuid_;
};

// -----------------------------------------------------------------------------
// Validating factory for caller-supplied text input.
//
// Fails with ErrorCode::Validation when `uuid` is present but not a valid
// UUID; `out` is left untouched in that case.
// -----------------------------------------------------------------------------
[[nodiscard]]
Error make_event(std::string event_type,
                 std::string_view data,
                 std::vector<std::string> tags,
                 const std::optional<std::string>& uuid,
                 Event& out);

std::ostream& operator<<(std::ostream&, const Event&);

} // namespace umadb::dcb
