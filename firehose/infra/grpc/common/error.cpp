// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <string>

namespace firehose::rpc {

std::string_view to_string(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK:
            return "OK";
        case grpc::StatusCode::CANCELLED:
            return "CANCELLED";
        case grpc::StatusCode::UNKNOWN:
            return "UNKNOWN";
        case grpc::StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return "DEADLINE_EXCEEDED";
        case grpc::StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case grpc::StatusCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case grpc::StatusCode::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case grpc::StatusCode::UNAUTHENTICATED:
            return "UNAUTHENTICATED";
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return "RESOURCE_EXHAUSTED";
        case grpc::StatusCode::FAILED_PRECONDITION:
            return "FAILED_PRECONDITION";
        case grpc::StatusCode::ABORTED:
            return "ABORTED";
        case grpc::StatusCode::OUT_OF_RANGE:
            return "OUT_OF_RANGE";
        case grpc::StatusCode::UNIMPLEMENTED:
            return "UNIMPLEMENTED";
        case grpc::StatusCode::INTERNAL:
            return "INTERNAL";
        case grpc::StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case grpc::StatusCode::DATA_LOSS:
            return "DATA_LOSS";
        default:
            return "UNRECOGNIZED";
    }
}

class GrpcErrorCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return kGrpcErrorCategoryName; }

    std::string message(int ev) const override {
        return std::string{to_string(static_cast<grpc::StatusCode>(ev))};
    }
};

const std::error_category& grpc_category() noexcept {
    static const GrpcErrorCategory kCategory{};
    return kCategory;
}

std::error_code make_error_code(grpc::StatusCode code) {
    return {static_cast<int>(code), grpc_category()};
}

std::error_code make_error_code(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return make_error_code(status.error_code());
}

bool is_grpc_error(const std::error_code& ec) {
    return ec && ec.category() == grpc_category();
}

bool is_grpc_error(const std::error_code& ec, grpc::StatusCode code) {
    return is_grpc_error(ec) && ec.value() == static_cast<int>(code);
}

}  // namespace firehose::rpc
