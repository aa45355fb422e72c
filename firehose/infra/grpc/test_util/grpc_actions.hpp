// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/grpc_context.hpp>
#include <agrpc/test.hpp>
#pragma GCC diagnostic pop
#include <grpcpp/grpcpp.h>

//! gmock actions completing the asynchronous operations of mocked gRPC readers on a GrpcContext
namespace firehose::rpc::test_util {

inline auto start_call(agrpc::GrpcContext& grpc_context, bool ok) {
    return [&grpc_context, ok](void* tag) { agrpc::process_grpc_tag(grpc_context, tag, ok); };
}

template <typename Reply>
auto read_success_with(agrpc::GrpcContext& grpc_context, Reply reply) {
    return [&grpc_context, reply = std::move(reply)](Reply* out, void* tag) {
        *out = reply;
        agrpc::process_grpc_tag(grpc_context, tag, /*ok=*/true);
    };
}

//! Read completing with ok=false, i.e. no more messages
inline auto read_failure(agrpc::GrpcContext& grpc_context) {
    return [&grpc_context](auto*, void* tag) { agrpc::process_grpc_tag(grpc_context, tag, /*ok=*/false); };
}

inline auto finish_streaming_with(agrpc::GrpcContext& grpc_context, grpc::Status status) {
    return [&grpc_context, status = std::move(status)](grpc::Status* out, void* tag) {
        *out = status;
        agrpc::process_grpc_tag(grpc_context, tag, /*ok=*/true);
    };
}

inline auto finish_streaming_ok(agrpc::GrpcContext& grpc_context) {
    return finish_streaming_with(grpc_context, grpc::Status::OK);
}

inline auto finish_streaming_cancelled(agrpc::GrpcContext& grpc_context) {
    return finish_streaming_with(grpc_context, grpc::Status::CANCELLED);
}

template <typename Reply>
auto finish_with(agrpc::GrpcContext& grpc_context, Reply reply) {
    return [&grpc_context, reply = std::move(reply)](Reply* out, grpc::Status* status, void* tag) {
        *out = reply;
        *status = grpc::Status::OK;
        agrpc::process_grpc_tag(grpc_context, tag, /*ok=*/true);
    };
}

inline auto finish_error(agrpc::GrpcContext& grpc_context, grpc::Status status) {
    return [&grpc_context, status = std::move(status)](auto*, grpc::Status* out, void* tag) {
        *out = status;
        agrpc::process_grpc_tag(grpc_context, tag, /*ok=*/true);
    };
}

}  // namespace firehose::rpc::test_util
