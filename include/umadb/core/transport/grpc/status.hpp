#pragma once

#include <grpcpp/support/status.h>

#include "umadb/error.hpp"


namespace umadb::core::transport::grpc {

// -----------------------------------------------------------------------------
// Status classification
// -----------------------------------------------------------------------------
//
// Maps a failed gRPC status onto the public error taxonomy.
//
// The store attaches an `umadb.v1.ErrorDetails` message to the status
// details of domain failures; its error type wins over the gRPC code:
//
//   INTEGRITY                                  → Integrity
//   CORRUPTION, SERIALIZATION                  → Corruption
//   IO                                         → Io
//   INVALID_ARGUMENT                           → Validation
//
// Without usable details the gRPC code decides:
//
//   FAILED_PRECONDITION, ALREADY_EXISTS        → Integrity
//   DATA_LOSS                                  → Corruption
//   INVALID_ARGUMENT                           → Validation
//   anything else                              → Transport
//
// The message is taken from the details when present, else from the status.
// -----------------------------------------------------------------------------
[[nodiscard]]
umadb::Error classify(const ::grpc::Status& status);

} // namespace umadb::core::transport::grpc
