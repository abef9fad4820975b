#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace umadb {

/*
===============================================================================
UmaDB Error Model
===============================================================================

Every fallible operation of the client returns an `Error`. The taxonomy is
closed: transport-specific shapes (gRPC status codes, socket failures) are
classified before they reach the caller.

[integrity] an append condition matched an event stored after its `after`
position, or the store rejected the batch on one of its own invariants
(e.g. a reused event uuid). Deterministic: the caller should re-read and
re-decide, not resend the same append.

[transport] the store could not be reached or the conversation with it
failed (connection refused, timeout, stream reset, unclassified server
failure). May be transient. The client never retries on its own.

[corruption] the store or a wire payload is structurally invalid (malformed
envelope, unparsable uuid, events out of order or outside the requested
query). Not retryable.

[io] a local input/output failure independent of the store, such as an
unreadable CA certificate file.

[validation] malformed caller input detected before any network call
(invalid uuid, invalid URL or configuration, empty append batch).
===============================================================================
*/

enum class ErrorCode : std::uint8_t {
    None = 0,
    Integrity,
    Transport,
    Corruption,
    Io,
    Validation
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:       return "none";
        case ErrorCode::Integrity:  return "integrity";
        case ErrorCode::Transport:  return "transport";
        case ErrorCode::Corruption: return "corruption";
        case ErrorCode::Io:         return "io";
        case ErrorCode::Validation: return "validation";
        default:                    return "unknown";
    }
}

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message; // Human-readable explanation

    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::None; }
};

std::ostream& operator<<(std::ostream&, const Error&);

} // namespace umadb
