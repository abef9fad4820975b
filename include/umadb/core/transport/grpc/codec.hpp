#pragma once

#include <cstdint>

#include "umadb.pb.h"

#include "umadb/core/protocol/append_request.hpp"
#include "umadb/core/protocol/read_batch.hpp"
#include "umadb/core/protocol/read_request.hpp"
#include "umadb/dcb/event.hpp"
#include "umadb/dcb/query.hpp"
#include "umadb/dcb/sequenced_event.hpp"
#include "umadb/error.hpp"


namespace umadb::core::transport::grpc::codec {

// -----------------------------------------------------------------------------
// Domain → wire
// -----------------------------------------------------------------------------
// Encoding never fails: every domain value has a wire representation.

void encode(const dcb::Event& in, ::umadb::v1::Event& out);

void encode(const dcb::Query& in, ::umadb::v1::Query& out);

void encode(const protocol::AppendRequest& in, ::umadb::v1::AppendRequest& out);

void encode(const protocol::ReadRequest& in, std::uint32_t batch_size, ::umadb::v1::ReadRequest& out);

// -----------------------------------------------------------------------------
// Wire → domain
// -----------------------------------------------------------------------------
// Data coming from the store is untrusted: a missing event envelope or an
// unparsable uuid is reported as ErrorCode::Corruption.

[[nodiscard]]
umadb::Error decode(const ::umadb::v1::Event& in, dcb::Event& out);

[[nodiscard]]
umadb::Error decode(const ::umadb::v1::SequencedEvent& in, dcb::SequencedEvent& out);

// Appends the decoded events of `in` to `out.events` and records its head
[[nodiscard]]
umadb::Error decode(const ::umadb::v1::ReadResponse& in, protocol::ReadBatch& out);

} // namespace umadb::core::transport::grpc::codec
