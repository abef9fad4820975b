#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "umadb/core/config/client.hpp"
#include "umadb/dcb/append_condition.hpp"
#include "umadb/dcb/event.hpp"
#include "umadb/dcb/query.hpp"
#include "umadb/dcb/sequenced_event.hpp"
#include "umadb/dcb/types.hpp"
#include "umadb/error.hpp"


namespace umadb {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct client_config {
    /// Store endpoint. `http://` connects in plaintext, `https://` over TLS.
    /// The port defaults to 50051.
    std::string url = std::string(core::config::DEFAULT_URL);

    /// PEM file with the CA certificates trusted for TLS.
    /// Enables TLS even for an `http://` URL.
    std::optional<std::string> ca_path;

    /// Events requested per read round trip. Must be greater than zero.
    std::uint32_t batch_size = core::config::DEFAULT_BATCH_SIZE;

    /// Deadline for the initial connection.
    std::chrono::milliseconds connect_timeout = core::config::DEFAULT_CONNECT_TIMEOUT;

    /// Deadline for each head() and append() call; zero disables it.
    /// An expired deadline is reported as ErrorCode::Transport.
    std::chrono::milliseconds request_timeout = core::config::DEFAULT_REQUEST_TIMEOUT;
};


// -----------------------------------------------------------------------------
// ReadStream
// -----------------------------------------------------------------------------
//
// Lazily evaluated result of Client::read().
//
//   umadb::SequencedEvent e;
//   while (stream.next(e)) { ... }
//   if (!stream.error().ok()) { ... }
//
// Events are fetched from the store one batch at a time, as they are pulled.
// A subscription blocks in next() until new events arrive; cancel() (from
// any thread) ends it. Destroying a stream cancels it.
// -----------------------------------------------------------------------------
class ReadStream {
public:
    ReadStream();
    ~ReadStream();

    ReadStream(ReadStream&&) noexcept;
    ReadStream& operator=(ReadStream&&) noexcept;

    ReadStream(const ReadStream&) = delete;
    ReadStream& operator=(const ReadStream&) = delete;

    // False once the stream is exhausted, cancelled or failed
    [[nodiscard]] bool next(dcb::SequencedEvent& out);

    // Thread-safe
    void cancel() noexcept;

    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    // The failure that ended the stream; ok otherwise
    [[nodiscard]] const Error& error() const noexcept;

    // Store head reported with the latest batch, if any
    [[nodiscard]] std::optional<dcb::Position> head() const noexcept;

    [[nodiscard]] std::uint64_t delivered() const noexcept;

private:
    friend class Client;

    struct Impl;
    explicit ReadStream(std::unique_ptr<Impl> impl) noexcept;

    std::unique_ptr<Impl> impl_;
};


/*
===============================================================================
UmaDB Client - v1 Public API
===============================================================================

Blocking client of a DCB event store.

  - connect()  establish the channel (once)
  - head()     position of the last recorded event
  - append()   record a batch atomically, optionally guarded by a condition
  - read()     lazy stream of matching events, forward, backward or live

All operations report failures as umadb::Error; nothing throws. Operations
may be issued concurrently from several threads once connected. Streams keep
the underlying channel alive and may outlive the Client.
===============================================================================
*/
class Client {
public:
    // Construct a client using a configuration object.
    explicit Client(client_config cfg = {});
    // Construct a client for an explicit URL with default settings.
    explicit Client(std::string url);
    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    // Destructor
    ~Client();

    // lifecycle
    [[nodiscard]] Error connect();
    [[nodiscard]] bool is_connected() const noexcept;

    [[nodiscard]] const client_config& config() const noexcept;

    // -------------------------------------------------------------------------
    // head
    // -------------------------------------------------------------------------
    // `out` is empty when the store holds no event.
    [[nodiscard]]
    Error head(std::optional<dcb::Position>& out);

    // -------------------------------------------------------------------------
    // append
    // -------------------------------------------------------------------------
    // Records `events` atomically. On success `out` is the position of the
    // last event. With a condition, the whole batch is rejected with
    // ErrorCode::Integrity when an event stored after `condition->after`
    // matches `condition->fail_if_events_match`.
    [[nodiscard]]
    Error append(std::vector<dcb::Event> events,
                 std::optional<dcb::AppendCondition> condition,
                 dcb::Position& out);

    // -------------------------------------------------------------------------
    // read
    // -------------------------------------------------------------------------
    //   query      absent = every event
    //   start      inclusive; absent = beginning (forward) or head (backwards)
    //   backwards  descending positions
    //   limit      maximum number of events
    //   subscribe  keep delivering newly appended events (not with backwards)
    [[nodiscard]]
    Error read(std::optional<dcb::Query> query,
               std::optional<dcb::Position> start,
               bool backwards,
               std::optional<std::uint32_t> limit,
               bool subscribe,
               ReadStream& out);

    // Finite read collected into `out`
    [[nodiscard]]
    Error read_all(std::optional<dcb::Query> query,
                   std::optional<dcb::Position> start,
                   bool backwards,
                   std::optional<std::uint32_t> limit,
                   std::vector<dcb::SequencedEvent>& out);

    // Prints the client telemetry counters
    void dump_telemetry(std::ostream& os) const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace umadb
