#include "umadb/core/transport/grpc/status.hpp"

#include <string>

#include "umadb.pb.h"


namespace umadb::core::transport::grpc {

namespace {

using Details = ::umadb::v1::ErrorDetails;

[[nodiscard]]
ErrorCode from_details(Details::ErrorType type) noexcept {
    switch (type) {
        case Details::INTEGRITY:        return ErrorCode::Integrity;
        case Details::CORRUPTION:
        case Details::SERIALIZATION:    return ErrorCode::Corruption;
        case Details::IO:               return ErrorCode::Io;
        case Details::INVALID_ARGUMENT: return ErrorCode::Validation;
        default:                        return ErrorCode::None;
    }
}

[[nodiscard]]
ErrorCode from_status_code(::grpc::StatusCode code) noexcept {
    switch (code) {
        case ::grpc::StatusCode::FAILED_PRECONDITION:
        case ::grpc::StatusCode::ALREADY_EXISTS:   return ErrorCode::Integrity;
        case ::grpc::StatusCode::DATA_LOSS:        return ErrorCode::Corruption;
        case ::grpc::StatusCode::INVALID_ARGUMENT: return ErrorCode::Validation;
        default:                                   return ErrorCode::Transport;
    }
}

} // namespace

umadb::Error classify(const ::grpc::Status& status) {
    if (status.ok()) {
        return umadb::Error{};
    }
    ErrorCode code = ErrorCode::None;
    std::string message;
    const std::string& raw = status.error_details();
    if (!raw.empty()) {
        Details details;
        if (details.ParseFromString(raw)) {
            code = from_details(details.error_type());
            message = details.message();
        }
    }
    if (code == ErrorCode::None) {
        code = from_status_code(status.error_code());
    }
    if (message.empty()) {
        message = status.error_message();
    }
    if (message.empty()) {
        message = "gRPC status " + std::to_string(static_cast<int>(status.error_code()));
    }
    return umadb::Error{code, std::move(message)};
}

} // namespace umadb::core::transport::grpc
