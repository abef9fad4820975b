#include "umadb/core/transport/grpc/channel.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "umadb/core/transport/error.hpp"
#include "umadb/core/transport/grpc/codec.hpp"
#include "umadb/core/transport/grpc/status.hpp"
#include "lcr/log/logger.hpp"


namespace umadb::core::transport::grpc {

// =============================================================================
// GrpcReadCall
// =============================================================================

GrpcReadCall::GrpcReadCall(::umadb::v1::DcbService::Stub& stub, const ::umadb::v1::ReadRequest& request)
    : reader_(stub.Read(&context_, request))
{}

GrpcReadCall::~GrpcReadCall() {
    if (!outcome_) {
        cancel();
        const umadb::Error err = finish();
        UMADB_TRACE("[GRPC] Read call dropped: " << err);
    }
}

bool GrpcReadCall::next_batch(protocol::ReadBatch& out) {
    if (outcome_ || !decode_error_.ok()) {
        return false;
    }
    response_.Clear();
    if (!reader_->Read(&response_)) {
        return false;
    }
    umadb::Error err = codec::decode(response_, out);
    if (!err.ok()) {
        UMADB_WARN("[GRPC] Undecodable read response: " << err);
        decode_error_ = std::move(err);
        context_.TryCancel();
        return false;
    }
    return true;
}

umadb::Error GrpcReadCall::finish() {
    if (outcome_) {
        return *outcome_;
    }
    // Finish() is only valid once the stream has been read to its end
    while (reader_->Read(&response_)) {
        response_.Clear();
    }
    const ::grpc::Status status = reader_->Finish();
    if (!decode_error_.ok()) {
        outcome_ = decode_error_;
    } else {
        outcome_ = classify(status);
    }
    return *outcome_;
}

void GrpcReadCall::cancel() noexcept {
    context_.TryCancel();
}

// =============================================================================
// GrpcChannel
// =============================================================================

umadb::Error GrpcChannel::connect(const ConnectOptions& options) {
    if (channel_) {
        return to_error(Error::InvalidState, "channel already connected");
    }
    std::shared_ptr<::grpc::ChannelCredentials> credentials;
    if (options.tls()) {
        ::grpc::SslCredentialsOptions ssl;
        if (options.ca_pem) {
            ssl.pem_root_certs = *options.ca_pem;
        }
        credentials = ::grpc::SslCredentials(ssl);
    } else {
        credentials = ::grpc::InsecureChannelCredentials();
    }
    const std::string target = options.url.target();
    auto channel = ::grpc::CreateChannel(target, credentials);
    if (!channel) {
        return to_error(Error::ConnectionFailed, "cannot create channel to " + target);
    }
    const auto deadline = std::chrono::system_clock::now() + options.timeout;
    if (!channel->WaitForConnected(deadline)) {
        const auto state = channel->GetState(false);
        UMADB_WARN("[GRPC] Channel to " << target << " not ready (state " << static_cast<int>(state) << ")");
        if (state == GRPC_CHANNEL_TRANSIENT_FAILURE) {
            return to_error(options.tls() ? Error::HandshakeFailed : Error::ConnectionFailed,
                            "cannot connect to " + target);
        }
        return to_error(Error::Timeout,
                        "no connection to " + target + " within " +
                        std::to_string(options.timeout.count()) + " ms");
    }
    UMADB_DEBUG("[GRPC] Channel to " << target << " ready");
    stub_ = ::umadb::v1::DcbService::NewStub(channel);
    channel_ = std::move(channel);
    request_timeout_ = options.request_timeout;
    return umadb::Error{};
}

void GrpcChannel::set_deadline_(::grpc::ClientContext& context) const {
    if (request_timeout_.count() > 0) {
        context.set_deadline(std::chrono::system_clock::now() + request_timeout_);
    }
}

umadb::Error GrpcChannel::head(std::optional<dcb::Position>& out) {
    if (!stub_) {
        return to_error(Error::InvalidState, "not connected");
    }
    ::grpc::ClientContext context;
    set_deadline_(context);
    ::umadb::v1::HeadRequest request;
    ::umadb::v1::HeadResponse response;
    const ::grpc::Status status = stub_->Head(&context, request, &response);
    if (!status.ok()) {
        return classify(status);
    }
    if (response.has_position()) {
        out = response.position();
    } else {
        out.reset();
    }
    return umadb::Error{};
}

umadb::Error GrpcChannel::append(const protocol::AppendRequest& request, dcb::Position& out) {
    if (!stub_) {
        return to_error(Error::InvalidState, "not connected");
    }
    ::grpc::ClientContext context;
    set_deadline_(context);
    ::umadb::v1::AppendRequest wire;
    codec::encode(request, wire);
    ::umadb::v1::AppendResponse response;
    const ::grpc::Status status = stub_->Append(&context, wire, &response);
    if (!status.ok()) {
        return classify(status);
    }
    out = response.position();
    return umadb::Error{};
}

std::unique_ptr<GrpcReadCall> GrpcChannel::open_read(const protocol::ReadRequest& request, std::uint32_t batch_size) {
    if (!stub_) {
        UMADB_ERROR("[GRPC] open_read() on a channel that is not connected");
        return nullptr;
    }
    ::umadb::v1::ReadRequest wire;
    codec::encode(request, batch_size, wire);
    return std::make_unique<GrpcReadCall>(*stub_, wire);
}

} // namespace umadb::core::transport::grpc
