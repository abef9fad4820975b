#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <grpcpp/grpcpp.h>

#include "umadb.grpc.pb.h"

#include "umadb/core/protocol/append_request.hpp"
#include "umadb/core/protocol/read_batch.hpp"
#include "umadb/core/protocol/read_request.hpp"
#include "umadb/core/transport/concepts.hpp"
#include "umadb/dcb/types.hpp"
#include "umadb/error.hpp"


namespace umadb::core::transport::grpc {

/*
===============================================================================
 GrpcReadCall
===============================================================================

One server-streaming DcbService.Read call driven synchronously.

- next_batch() performs exactly one blocking Read() on the stream
- cancel() maps to ClientContext::TryCancel() and is safe from any thread
- finish() drains whatever is left, collects the final status and
  classifies it; it is idempotent

A response that cannot be decoded cancels the call; finish() then reports
the decoding failure instead of the (local) cancellation status.
===============================================================================
*/

class GrpcReadCall {
public:
    GrpcReadCall(::umadb::v1::DcbService::Stub& stub, const ::umadb::v1::ReadRequest& request);
    ~GrpcReadCall();

    GrpcReadCall(const GrpcReadCall&) = delete;
    GrpcReadCall& operator=(const GrpcReadCall&) = delete;

    [[nodiscard]]
    bool next_batch(protocol::ReadBatch& out);

    [[nodiscard]]
    umadb::Error finish();

    void cancel() noexcept;

private:
    ::grpc::ClientContext context_;
    std::unique_ptr<::grpc::ClientReader<::umadb::v1::ReadResponse>> reader_;
    ::umadb::v1::ReadResponse response_;
    std::optional<umadb::Error> outcome_;
    umadb::Error decode_error_;
};

/*
===============================================================================
 GrpcChannel
===============================================================================

Store transport over a gRPC channel (satisfies StoreTransportConcept).

- connect() builds plaintext or TLS credentials, creates the channel and
  waits for it to become ready within the connect timeout
- head() / append() are blocking unary calls, bounded by the request
  timeout when it is non-zero (an expired deadline maps to Transport)
- open_read() starts a server-streaming read

Every failure is classified into umadb::Error before it is returned.
Safe to share between threads once connected.
===============================================================================
*/

class GrpcChannel {
public:
    using read_call_type = GrpcReadCall;

    GrpcChannel() = default;

    GrpcChannel(const GrpcChannel&) = delete;
    GrpcChannel& operator=(const GrpcChannel&) = delete;

    [[nodiscard]]
    umadb::Error connect(const ConnectOptions& options);

    [[nodiscard]]
    umadb::Error head(std::optional<dcb::Position>& out);

    [[nodiscard]]
    umadb::Error append(const protocol::AppendRequest& request, dcb::Position& out);

    [[nodiscard]]
    std::unique_ptr<GrpcReadCall> open_read(const protocol::ReadRequest& request, std::uint32_t batch_size);

private:
    void set_deadline_(::grpc::ClientContext& context) const;

private:
    std::shared_ptr<::grpc::Channel> channel_;
    std::unique_ptr<::umadb::v1::DcbService::Stub> stub_;
    std::chrono::milliseconds request_timeout_{0};
};

static_assert(StoreTransportConcept<GrpcChannel>);

} // namespace umadb::core::transport::grpc
