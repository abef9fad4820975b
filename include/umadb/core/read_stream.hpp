#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "umadb/core/protocol/read_batch.hpp"
#include "umadb/core/protocol/read_request.hpp"
#include "umadb/core/telemetry.hpp"
#include "umadb/core/telemetry/session.hpp"
#include "umadb/core/transport/concepts.hpp"
#include "umadb/dcb/query.hpp"
#include "umadb/dcb/sequenced_event.hpp"
#include "umadb/error.hpp"
#include "lcr/log/logger.hpp"


namespace umadb::core {

template<transport::StoreTransportConcept Transport>
class Session;

/*
===============================================================================
 umadb::core::ReadStream
===============================================================================

Lazily produced sequence of SequencedEvent backed by one server-streaming
read call.

-------------------------------------------------------------------------------
 Pull model
-------------------------------------------------------------------------------
    SequencedEvent e;
    while (stream.next(e)) {
        ...
    }
    if (!stream.error().ok()) { ... }

- next() hands out buffered events and requests the next batch from the
  store only once the current batch is consumed. At most one batch request
  is outstanding per stream; nothing is materialized ahead of the caller.
- In subscribe mode next() blocks until new matching events are appended,
  until the limit is reached or the stream is cancelled.

-------------------------------------------------------------------------------
 Termination
-------------------------------------------------------------------------------
A stream ends exactly once, for one of these reasons:

- Exhausted  the store closed the stream, or `limit` events were delivered
- Cancelled  cancel() was called (from any thread)
- Failed     transport/store failure, or a batch violated the request

After termination next() keeps returning false, error() reports the failure
(ok for Exhausted/Cancelled) and the underlying call has been released.
Events delivered before a failure remain valid.

-------------------------------------------------------------------------------
 Incoming data checks
-------------------------------------------------------------------------------
Each event is checked before delivery:

- positions strictly increase (forward) or strictly decrease (backwards)
- positions respect `start` (>= forward, <= backwards)
- the event matches the request query

A violation is reported as ErrorCode::Corruption.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
Single consumer. cancel() is the only member safe to call concurrently with
next(); it unblocks a pending next().
===============================================================================
*/

template<transport::StoreTransportConcept Transport>
class ReadStream {
public:
    using call_type = typename Transport::read_call_type;

    enum class Status : std::uint8_t {
        Active,
        Exhausted,
        Cancelled,
        Failed
    };

    // An empty, already exhausted stream
    ReadStream() = default;

    ReadStream(ReadStream&&) noexcept = default;
    ReadStream& operator=(ReadStream&&) noexcept = default;

    ReadStream(const ReadStream&) = delete;
    ReadStream& operator=(const ReadStream&) = delete;

    // Produces the next event. Returns false once the stream has terminated.
    [[nodiscard]]
    bool next(dcb::SequencedEvent& out) {
        if (!state_) {
            return false;
        }
        State& s = *state_;
        for (;;) {
            if (s.status != Status::Active) {
                return false;
            }
            if (s.cancel_requested.load(std::memory_order_acquire)) {
                s.terminate(Status::Cancelled);
                return false;
            }
            // 1) Deliver from the current batch
            if (s.cursor < s.batch.events.size()) {
                dcb::SequencedEvent& candidate = s.batch.events[s.cursor++];
                Error err = s.check(candidate);
                if (!err.ok()) {
                    s.fail(std::move(err));
                    return false;
                }
                s.last_position = candidate.position;
                out = std::move(candidate);
                ++s.delivered;
                UMADB_TL1( s.telemetry->events_delivered_total.inc() );
                if (s.request.limit && s.delivered >= *s.request.limit) {
                    UMADB_DEBUG("[READ] Limit of " << *s.request.limit << " event(s) reached -> closing stream");
                    s.terminate(Status::Exhausted);
                }
                return true;
            }
            // 2) Current batch consumed: request the next one
            s.batch.clear();
            s.cursor = 0;
            if (!s.call->next_batch(s.batch)) {
                s.on_end_of_stream();
                return false;
            }
            UMADB_TL1( s.telemetry->batches_received_total.inc() );
            UMADB_TRACE("[READ] Received batch of " << s.batch.events.size() << " event(s)");
            if (s.batch.head) {
                s.head = s.batch.head;
            }
        }
    }

    // Requests termination. Safe to call from any thread, idempotent.
    void cancel() noexcept {
        if (state_) {
            state_->request_cancel();
        }
    }

    [[nodiscard]] Status status() const noexcept {
        return state_ ? state_->status : Status::Exhausted;
    }

    [[nodiscard]] bool done() const noexcept { return status() != Status::Active; }

    [[nodiscard]] bool cancelled() const noexcept { return status() == Status::Cancelled; }

    // Failure that terminated the stream; ok otherwise
    [[nodiscard]] const Error& error() const noexcept {
        static const Error none{};
        return state_ ? state_->error : none;
    }

    // Store head reported alongside the most recent batch, if any
    [[nodiscard]] std::optional<dcb::Position> head() const noexcept {
        return state_ ? state_->head : std::nullopt;
    }

    // Number of events handed to the caller so far
    [[nodiscard]] std::uint64_t delivered() const noexcept {
        return state_ ? state_->delivered : 0;
    }

private:
    friend class Session<Transport>;

    // Heap-allocated so that the stream stays movable while cancel() may hold
    // a pointer to it from another thread.
    struct State {
        State(std::unique_ptr<call_type> c, protocol::ReadRequest r, telemetry::Session* t)
            : call(std::move(c))
            , request(std::move(r))
            , telemetry(t)
        {}

        ~State() {
            if (status == Status::Active) {
                UMADB_DEBUG("[READ] Stream destroyed while active -> cancelling call");
                UMADB_TL1( telemetry->reads_cancelled_total.inc() );
                release(true);
            }
        }

        [[nodiscard]]
        Error check(const dcb::SequencedEvent& e) const {
            const auto pos = e.position;
            if (request.backwards) {
                if (last_position && pos >= *last_position) {
                    return out_of_order(pos);
                }
                if (request.start && pos > *request.start) {
                    return out_of_range(pos, "above");
                }
            } else {
                if (last_position && pos <= *last_position) {
                    return out_of_order(pos);
                }
                if (request.start && pos < *request.start) {
                    return out_of_range(pos, "below");
                }
            }
            if (request.query && !dcb::matches(e.event, *request.query)) {
                return Error{ErrorCode::Corruption,
                             "event at position " + std::to_string(pos) + " does not match the read query"};
            }
            return Error{};
        }

        void on_end_of_stream() {
            if (cancel_requested.load(std::memory_order_acquire)) {
                terminate(Status::Cancelled);
                return;
            }
            Error err = call->finish();
            if (!err.ok()) {
                fail(std::move(err));
                return;
            }
            UMADB_DEBUG("[READ] Stream exhausted after " << delivered << " event(s)");
            release(false);
            status = Status::Exhausted;
        }

        void terminate(Status st) {
            if (st == Status::Cancelled) {
                UMADB_DEBUG("[READ] Stream cancelled after " << delivered << " event(s)");
                UMADB_TL1( telemetry->reads_cancelled_total.inc() );
            }
            release(true);
            status = st;
        }

        void fail(Error err) {
            UMADB_WARN("[READ] Stream failed after " << delivered << " event(s): " << err);
            UMADB_TL1( telemetry->reads_failed_total.inc() );
            release(true);
            error = std::move(err);
            status = Status::Failed;
        }

        void request_cancel() noexcept {
            cancel_requested.store(true, std::memory_order_release);
            std::lock_guard<std::mutex> lock(call_mutex);
            if (call) {
                call->cancel();
            }
        }

        // Detaches the call under the lock, then closes it outside of it so
        // that a concurrent cancel() never observes a dangling call.
        void release(bool cancel_first) {
            std::unique_ptr<call_type> detached;
            {
                std::lock_guard<std::mutex> lock(call_mutex);
                detached = std::move(call);
            }
            if (!detached || !cancel_first) {
                return;
            }
            detached->cancel();
            const Error outcome = detached->finish();
            if (!outcome.ok()) {
                UMADB_TRACE("[READ] Call closed locally: " << outcome);
            }
        }

        std::unique_ptr<call_type>   call;
        std::mutex                   call_mutex;
        std::atomic<bool>            cancel_requested{false};
        protocol::ReadRequest        request;
        telemetry::Session*          telemetry;
        protocol::ReadBatch          batch;
        std::size_t                  cursor = 0;
        std::optional<dcb::Position> last_position;
        std::optional<dcb::Position> head;
        std::uint64_t                delivered = 0;
        Status                       status = Status::Active;
        Error                        error;

    private:
        [[nodiscard]]
        static Error out_of_order(dcb::Position pos) {
            return Error{ErrorCode::Corruption,
                         "event at position " + std::to_string(pos) + " is out of order"};
        }

        [[nodiscard]]
        Error out_of_range(dcb::Position pos, const char* side) const {
            return Error{ErrorCode::Corruption,
                         "event at position " + std::to_string(pos) + " is " + side +
                         " the requested start " + std::to_string(*request.start)};
        }
    };

    ReadStream(std::unique_ptr<call_type> call, protocol::ReadRequest request, telemetry::Session& telemetry)
        : state_(std::make_unique<State>(std::move(call), std::move(request), &telemetry))
    {}

    std::unique_ptr<State> state_;
};

} // namespace umadb::core
