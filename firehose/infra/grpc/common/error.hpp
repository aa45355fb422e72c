// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>
#include <system_error>

#include <grpcpp/grpcpp.h>

namespace firehose::rpc {

//! Name of the error category used for gRPC transport failures
inline constexpr const char* kGrpcErrorCategoryName{"grpc"};

//! Canonical name of the status code, e.g. UNAVAILABLE
std::string_view to_string(grpc::StatusCode code);

//! Error category whose values are gRPC status codes
//! \note The category holds no state: the status message must be carried apart from the error code
const std::error_category& grpc_category() noexcept;

//! Build an error code in the gRPC category for the given status code
std::error_code make_error_code(grpc::StatusCode code);

//! Build an error code from a non-OK gRPC status, an empty error code from an OK status
std::error_code make_error_code(const grpc::Status& status);

//! Check if the error code represents a gRPC transport failure
bool is_grpc_error(const std::error_code& ec);

//! Check if the error code represents a gRPC failure with the given status code
bool is_grpc_error(const std::error_code& ec, grpc::StatusCode code);

}  // namespace firehose::rpc
