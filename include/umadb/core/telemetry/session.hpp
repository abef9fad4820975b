#pragma once

#include <ostream>

#include "lcr/metrics/atomic/counter.hpp"

namespace umadb::core::telemetry {

// ============================================================================
// Session Telemetry
//
// Observes client-side decisions and outcomes of a core::Session.
// Mechanical facts only; shared by every stream opened by the session.
// ============================================================================

struct alignas(64) Session final {
    // ---------------------------------------------------------------------
    // Unary calls
    // ---------------------------------------------------------------------

    // head() calls issued to the store
    lcr::metrics::atomic::counter64 head_calls_total;

    // Appends committed by the store
    lcr::metrics::atomic::counter64 appends_committed_total;

    // Appends rejected with an integrity failure
    lcr::metrics::atomic::counter64 appends_rejected_total;

    // Appends that failed for any other reason (validation included)
    lcr::metrics::atomic::counter64 appends_failed_total;

    // Events carried by committed appends
    lcr::metrics::atomic::counter64 events_appended_total;

    // ---------------------------------------------------------------------
    // Reads
    // ---------------------------------------------------------------------

    // Read calls opened against the store
    lcr::metrics::atomic::counter64 reads_opened_total;

    // Batches received from the store
    lcr::metrics::atomic::counter64 batches_received_total;

    // Events handed to the caller
    lcr::metrics::atomic::counter64 events_delivered_total;

    // Streams cancelled locally (explicit cancel, destruction while active)
    lcr::metrics::atomic::counter64 reads_cancelled_total;

    // Streams terminated by an error
    lcr::metrics::atomic::counter64 reads_failed_total;

    // ---------------------------------------------------------------------
    // Dump
    // ---------------------------------------------------------------------
    void dump(std::ostream& os) const {
        os << "[Session telemetry]\n"
           << "  head calls        : " << head_calls_total.load() << "\n"
           << "  appends committed : " << appends_committed_total.load() << "\n"
           << "  appends rejected  : " << appends_rejected_total.load() << "\n"
           << "  appends failed    : " << appends_failed_total.load() << "\n"
           << "  events appended   : " << events_appended_total.load() << "\n"
           << "  reads opened      : " << reads_opened_total.load() << "\n"
           << "  batches received  : " << batches_received_total.load() << "\n"
           << "  events delivered  : " << events_delivered_total.load() << "\n"
           << "  reads cancelled   : " << reads_cancelled_total.load() << "\n"
           << "  reads failed      : " << reads_failed_total.load() << "\n";
    }
};

} // namespace umadb::core::telemetry
