/*
===============================================================================
UmaDB core Session
===============================================================================

The session implements the DCB client operations (head, append, read) on top
of a pluggable store transport.

Architecture:
  - transport::*        → Store transport (gRPC channel, mockable)
                           • channel lifecycle
                           • wire encoding / decoding
                           • failure classification
  - core::Session       → Client-side contract enforcement
                           • argument validation
                           • result sanity checks
                           • telemetry & logging
  - core::ReadStream    → Lazy, batched, cancellable event sequences

The session:
  - Owns its transport via composition
  - Validates every request before it reaches the wire
  - Checks every response against the request that produced it
  - Reports all failures as umadb::Error, never throws

Threading:
  - connect() must complete before any other call
  - head(), append() and read() may then be called concurrently
  - each ReadStream has a single consumer (cancel() is thread-safe)
===============================================================================
*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "umadb/core/config/client.hpp"
#include "umadb/core/protocol/append_request.hpp"
#include "umadb/core/protocol/read_request.hpp"
#include "umadb/core/read_stream.hpp"
#include "umadb/core/telemetry.hpp"
#include "umadb/core/telemetry/session.hpp"
#include "umadb/core/transport/ca_file.hpp"
#include "umadb/core/transport/concepts.hpp"
#include "umadb/core/transport/parse_url.hpp"
#include "umadb/dcb/append_condition.hpp"
#include "umadb/dcb/event.hpp"
#include "umadb/dcb/query.hpp"
#include "umadb/error.hpp"
#include "lcr/log/logger.hpp"


namespace umadb::core {

// Connection parameters of a session
struct SessionOptions {
    std::string                url = std::string(config::DEFAULT_URL);
    std::optional<std::string> ca_path;
    std::uint32_t              batch_size = config::DEFAULT_BATCH_SIZE;
    std::chrono::milliseconds  connect_timeout = config::DEFAULT_CONNECT_TIMEOUT;
    std::chrono::milliseconds  request_timeout = config::DEFAULT_REQUEST_TIMEOUT;
};

enum class ConnectionState : std::uint8_t {
    Disconnected,
    Connecting,
    Connected
};

template<transport::StoreTransportConcept Transport>
class Session {

public:
    using stream_type = ReadStream<Transport>;

    template<class... Args>
    explicit Session(Args&&... args)
        : transport_(std::forward<Args>(args)...)
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -----------------------------------------------------------------------------
    // Connection
    // -----------------------------------------------------------------------------
    //
    // Validates the options, loads the CA bundle and establishes the channel.
    // A session connects at most once. The first caller claims the session;
    // a concurrent or later call fails without touching the transport. A
    // failed attempt releases the claim.
    //
    // Failures:
    //   • Validation   malformed URL, zero batch size, negative request
    //                  timeout, empty CA file, reconnect
    //   • Io           CA file cannot be read
    //   • Transport    store unreachable within connect_timeout
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error connect(const SessionOptions& options) {
        ConnectionState expected = ConnectionState::Disconnected;
        if (!state_.compare_exchange_strong(expected, ConnectionState::Connecting,
                                            std::memory_order_acq_rel, std::memory_order_acquire)) {
            return Error{ErrorCode::Validation, expected == ConnectionState::Connected
                ? "session is already connected"
                : "session is already connecting"};
        }
        Error err = connect_(options);
        if (!err.ok()) {
            state_.store(ConnectionState::Disconnected, std::memory_order_release);
            return err;
        }
        batch_size_ = options.batch_size;
        state_.store(ConnectionState::Connected, std::memory_order_release);
        UMADB_INFO("[SESSION] Connected (batch size " << batch_size_ << ")");
        return Error{};
    }

    [[nodiscard]]
    bool is_connected() const noexcept {
        return state_.load(std::memory_order_acquire) == ConnectionState::Connected;
    }

    [[nodiscard]]
    std::uint32_t batch_size() const noexcept {
        return batch_size_;
    }

    // -----------------------------------------------------------------------------
    // Head
    // -----------------------------------------------------------------------------
    //
    // Position of the last recorded event; empty when the store has none.
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error head(std::optional<dcb::Position>& out) {
        if (Error err = require_connected_("head"); !err.ok()) {
            return err;
        }
        UMADB_TL1( telemetry_.head_calls_total.inc() );
        std::optional<dcb::Position> position;
        Error err = transport_.head(position);
        if (!err.ok()) {
            UMADB_WARN("[SESSION] head() failed: " << err);
            return err;
        }
        UMADB_TRACE("[SESSION] head() -> " << (position ? std::to_string(*position) : std::string("none")));
        out = position;
        return Error{};
    }

    // -----------------------------------------------------------------------------
    // Append
    // -----------------------------------------------------------------------------
    //
    // Records the whole batch atomically, or nothing. On success `out` holds
    // the position assigned to the last event of the batch.
    //
    // When `condition` is set, the store rejects the batch with an Integrity
    // error if any recorded event after `condition->after` (all events when
    // absent) matches `condition->fail_if_events_match`.
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error append(std::vector<dcb::Event> events,
                 std::optional<dcb::AppendCondition> condition,
                 dcb::Position& out) {
        if (Error err = require_connected_("append"); !err.ok()) {
            return err;
        }
        if (events.empty()) {
            UMADB_TL1( telemetry_.appends_failed_total.inc() );
            return Error{ErrorCode::Validation, "cannot append an empty batch of events"};
        }
        const std::size_t count = events.size();
        protocol::AppendRequest request{std::move(events), std::move(condition)};
        if (request.condition) {
            UMADB_DEBUG("[SESSION] Appending " << count << " event(s) with " << *request.condition);
        } else {
            UMADB_DEBUG("[SESSION] Appending " << count << " event(s) unconditionally");
        }
        dcb::Position position = 0;
        Error err = transport_.append(request, position);
        if (!err.ok()) {
            if (err.code == ErrorCode::Integrity) {
                UMADB_TL1( telemetry_.appends_rejected_total.inc() );
                UMADB_INFO("[SESSION] Append rejected: " << err.message);
            } else {
                UMADB_TL1( telemetry_.appends_failed_total.inc() );
                UMADB_WARN("[SESSION] Append failed: " << err);
            }
            return err;
        }
        // Positions start at 1, so the last of n events sits at n or later
        if (position < count) {
            UMADB_TL1( telemetry_.appends_failed_total.inc() );
            UMADB_ERROR("[SESSION] Store returned position " << position << " for a batch of " << count);
            return Error{ErrorCode::Corruption,
                         "store returned position " + std::to_string(position) +
                         " for a batch of " + std::to_string(count) + " event(s)"};
        }
        UMADB_TL1( telemetry_.appends_committed_total.inc() );
        UMADB_TL1( telemetry_.events_appended_total.inc(count) );
        UMADB_DEBUG("[SESSION] Appended " << count << " event(s), last position " << position);
        out = position;
        return Error{};
    }

    // -----------------------------------------------------------------------------
    // Read
    // -----------------------------------------------------------------------------
    //
    // Opens a lazy stream of the recorded events matching `request.query`
    // (all events when absent), in ascending position order or descending
    // when `backwards` is set.
    //
    //   • start      first position to consider, inclusive
    //   • limit      maximum number of events; 0 yields an empty stream
    //   • subscribe  keep the stream open and deliver future events
    //
    // Nothing is fetched until the stream is pulled.
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error read(protocol::ReadRequest request, stream_type& out) {
        if (Error err = require_connected_("read"); !err.ok()) {
            return err;
        }
        if (request.subscribe && request.backwards) {
            return Error{ErrorCode::Validation, "a subscription cannot read backwards"};
        }
        if (request.limit && *request.limit == 0) {
            UMADB_DEBUG("[SESSION] Read with limit 0 -> empty stream");
            out = stream_type{};
            return Error{};
        }
        UMADB_DEBUG("[SESSION] Opening " << request);
        auto call = transport_.open_read(request, batch_size_);
        if (!call) {
            UMADB_TL1( telemetry_.reads_failed_total.inc() );
            UMADB_WARN("[SESSION] Failed to open read call");
            return Error{ErrorCode::Transport, "failed to open read call"};
        }
        UMADB_TL1( telemetry_.reads_opened_total.inc() );
        out = stream_type{std::move(call), std::move(request), telemetry_};
        return Error{};
    }

    // Drains a finite read into `out`. Events delivered before a failure are
    // kept in `out` alongside the returned error.
    [[nodiscard]]
    Error read_all(protocol::ReadRequest request, std::vector<dcb::SequencedEvent>& out) {
        if (request.subscribe) {
            return Error{ErrorCode::Validation, "read_all() cannot drain a subscription"};
        }
        stream_type stream;
        if (Error err = read(std::move(request), stream); !err.ok()) {
            return err;
        }
        dcb::SequencedEvent event;
        while (stream.next(event)) {
            out.push_back(std::move(event));
        }
        return stream.error();
    }

    // -----------------------------------------------------------------------------
    // Accessors
    // -----------------------------------------------------------------------------

    [[nodiscard]]
    Transport& transport() noexcept {
        return transport_;
    }

    [[nodiscard]]
    const telemetry::Session& telemetry() const noexcept {
        return telemetry_;
    }

private:
    [[nodiscard]]
    Error connect_(const SessionOptions& options) {
        if (options.batch_size == 0) {
            return Error{ErrorCode::Validation, "batch size must be greater than zero"};
        }
        if (options.request_timeout.count() < 0) {
            return Error{ErrorCode::Validation, "request timeout must not be negative"};
        }
        transport::ConnectOptions connect_options;
        connect_options.timeout = options.connect_timeout;
        connect_options.request_timeout = options.request_timeout;
        if (auto err = transport::parse_url(options.url, connect_options.url); err != transport::Error::None) {
            UMADB_ERROR("[SESSION] Invalid store URL '" << options.url << "'");
            return transport::to_error(err, "'" + options.url + "'");
        }
        if (options.ca_path) {
            std::string pem;
            Error err = transport::load_ca_file(*options.ca_path, pem);
            if (!err.ok()) {
                UMADB_ERROR("[SESSION] " << err);
                return err;
            }
            connect_options.ca_pem = std::move(pem);
        }
        UMADB_INFO("[SESSION] Connecting to " << connect_options.url.target()
                   << (connect_options.tls() ? " (tls)" : " (plaintext)"));
        Error err = transport_.connect(connect_options);
        if (!err.ok()) {
            UMADB_ERROR("[SESSION] Connection failed: " << err);
        }
        return err;
    }

    [[nodiscard]]
    Error require_connected_(const char* operation) const {
        if (state_.load(std::memory_order_acquire) != ConnectionState::Connected) {
            return Error{ErrorCode::Transport, std::string(operation) + "() called before connect()"};
        }
        return Error{};
    }

private:
    Transport transport_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::uint32_t batch_size_ = config::DEFAULT_BATCH_SIZE;
    telemetry::Session telemetry_;
};

} // namespace umadb::core
