#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "umadb/core/config/client.hpp"
#include "umadb/core/protocol/append_request.hpp"
#include "umadb/core/protocol/read_batch.hpp"
#include "umadb/core/protocol/read_request.hpp"
#include "umadb/core/transport/parse_url.hpp"
#include "umadb/dcb/types.hpp"
#include "umadb/error.hpp"

namespace umadb::core::transport {

// Everything a transport needs to establish its channel
struct ConnectOptions {
    ParsedUrl                  url;
    std::optional<std::string> ca_pem;   // PEM trust roots; enables TLS when present
    std::chrono::milliseconds  timeout = config::DEFAULT_CONNECT_TIMEOUT;
    std::chrono::milliseconds  request_timeout = config::DEFAULT_REQUEST_TIMEOUT;   // per unary call; zero disables

    [[nodiscard]] bool tls() const noexcept { return url.secure || ca_pem.has_value(); }
};

// -----------------------------------------------------------------------------
// ReadCallConcept
// -----------------------------------------------------------------------------
//
// One server-streaming read call. Pull-based:
//
//   • next_batch() blocks until the next batch arrives, the stream ends, or
//     the call fails; returns false in the last two cases
//   • finish() reports the final outcome once next_batch() returned false
//   • cancel() may be called from any thread and unblocks next_batch()
//
// At most one next_batch() is outstanding at any time.
// -----------------------------------------------------------------------------
template<class C>
concept ReadCallConcept =
    requires(C call, protocol::ReadBatch& batch)
{
    { call.next_batch(batch) } -> std::same_as<bool>;
    { call.finish() } -> std::same_as<umadb::Error>;
    { call.cancel() } noexcept -> std::same_as<void>;
};

// -----------------------------------------------------------------------------
// StoreTransportConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by core::Session.
//
// A transport:
//
//   • Owns the channel to a single store process
//   • Classifies every failure into umadb::Error before returning it
//   • Is safe to share between threads for head() / append() / open_read()
//
// -----------------------------------------------------------------------------
template<class T>
concept StoreTransportConcept =
    requires(
        T t,
        const ConnectOptions& options,
        std::optional<dcb::Position>& head,
        const protocol::AppendRequest& append,
        dcb::Position& position,
        const protocol::ReadRequest& read,
        std::uint32_t batch_size
    )
{
    typename T::read_call_type;
    requires ReadCallConcept<typename T::read_call_type>;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { t.connect(options) } -> std::same_as<umadb::Error>;

    // ---------------------------------------------------------------------
    // Unary calls
    // ---------------------------------------------------------------------

    { t.head(head) } -> std::same_as<umadb::Error>;
    { t.append(append, position) } -> std::same_as<umadb::Error>;

    // ---------------------------------------------------------------------
    // Streaming reads
    // ---------------------------------------------------------------------

    { t.open_read(read, batch_size) } -> std::same_as<std::unique_ptr<typename T::read_call_type>>;
};

} // namespace umadb::core::transport
