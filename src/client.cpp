#include "umadb/client.hpp"

#include <ostream>
#include <utility>

// ---- Core includes (PRIVATE) ----
#include "umadb/core/session.hpp"
#include "umadb/core/transport/grpc/channel.hpp"


namespace umadb {

using Transport = core::transport::grpc::GrpcChannel;
using Session   = core::Session<Transport>;

// -----------------------------
// Client::Impl
// -----------------------------

struct Client::Impl {
    client_config cfg;

    // Core session (owning)
    Session session;

    explicit Impl(client_config c)
        : cfg(std::move(c))
        , session()
    {}

    [[nodiscard]]
    core::SessionOptions options() const {
        core::SessionOptions opts;
        opts.url = cfg.url;
        opts.ca_path = cfg.ca_path;
        opts.batch_size = cfg.batch_size;
        opts.connect_timeout = cfg.connect_timeout;
        opts.request_timeout = cfg.request_timeout;
        return opts;
    }
};

// -----------------------------
// ReadStream::Impl
// -----------------------------

struct ReadStream::Impl {
    // Keeps the session (and its channel) alive while the stream exists.
    // Declared first so that the stream is released before the session.
    std::shared_ptr<const void> owner;
    Session::stream_type stream;
};

// -----------------------------
// ReadStream
// -----------------------------

ReadStream::ReadStream() = default;
ReadStream::~ReadStream() = default;
ReadStream::ReadStream(ReadStream&&) noexcept = default;
ReadStream& ReadStream::operator=(ReadStream&&) noexcept = default;

ReadStream::ReadStream(std::unique_ptr<Impl> impl) noexcept
    : impl_(std::move(impl))
{}

bool ReadStream::next(dcb::SequencedEvent& out) {
    return impl_ ? impl_->stream.next(out) : false;
}

void ReadStream::cancel() noexcept {
    if (impl_) {
        impl_->stream.cancel();
    }
}

bool ReadStream::done() const noexcept {
    return impl_ ? impl_->stream.done() : true;
}

bool ReadStream::cancelled() const noexcept {
    return impl_ ? impl_->stream.cancelled() : false;
}

const Error& ReadStream::error() const noexcept {
    static const Error none{};
    return impl_ ? impl_->stream.error() : none;
}

std::optional<dcb::Position> ReadStream::head() const noexcept {
    return impl_ ? impl_->stream.head() : std::nullopt;
}

std::uint64_t ReadStream::delivered() const noexcept {
    return impl_ ? impl_->stream.delivered() : 0;
}

// -----------------------------
// Client
// -----------------------------

Client::Client(client_config cfg)
    : impl_(std::make_shared<Impl>(std::move(cfg)))
{}

Client::Client(std::string url)
    : Client(client_config{std::move(url)})
{}

Client::~Client() = default;

Error Client::connect() {
    return impl_->session.connect(impl_->options());
}

bool Client::is_connected() const noexcept {
    return impl_->session.is_connected();
}

const client_config& Client::config() const noexcept {
    return impl_->cfg;
}

Error Client::head(std::optional<dcb::Position>& out) {
    return impl_->session.head(out);
}

Error Client::append(std::vector<dcb::Event> events,
                     std::optional<dcb::AppendCondition> condition,
                     dcb::Position& out) {
    return impl_->session.append(std::move(events), std::move(condition), out);
}

Error Client::read(std::optional<dcb::Query> query,
                   std::optional<dcb::Position> start,
                   bool backwards,
                   std::optional<std::uint32_t> limit,
                   bool subscribe,
                   ReadStream& out) {
    core::protocol::ReadRequest request{std::move(query), start, backwards, limit, subscribe};
    auto impl = std::make_unique<ReadStream::Impl>();
    impl->owner = impl_;
    if (Error err = impl_->session.read(std::move(request), impl->stream); !err.ok()) {
        return err;
    }
    out = ReadStream{std::move(impl)};
    return Error{};
}

Error Client::read_all(std::optional<dcb::Query> query,
                       std::optional<dcb::Position> start,
                       bool backwards,
                       std::optional<std::uint32_t> limit,
                       std::vector<dcb::SequencedEvent>& out) {
    core::protocol::ReadRequest request{std::move(query), start, backwards, limit, false};
    return impl_->session.read_all(std::move(request), out);
}

void Client::dump_telemetry(std::ostream& os) const {
    impl_->session.telemetry().dump(os);
}

} // namespace umadb
