// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include <firehose/infra/concurrency/task.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/client_rpc.hpp>
#include <agrpc/grpc_context.hpp>
#pragma GCC diagnostic pop
#include <boost/asio/use_awaitable.hpp>
#include <grpcpp/grpcpp.h>

#include <firehose/infra/common/log.hpp>
#include <firehose/infra/grpc/common/util.hpp>

namespace firehose::rpc {

//! Exception raised when a unary call completes with a non-OK status
class GrpcStatusError : public std::runtime_error {
  public:
    explicit GrpcStatusError(grpc::Status status)
        : std::runtime_error(status.error_message()), status_(std::move(status)) {}

    const grpc::Status& status() const { return status_; }

  private:
    grpc::Status status_;
};

//! Hook to customize the client context (metadata, deadline...) before the call starts
using ClientContextSetup = std::function<void(grpc::ClientContext&)>;

namespace detail {
    template <typename>
    struct UnaryRpcTraits;

    template <typename Stub, typename Request, template <typename> typename Responder, typename Reply>
    struct UnaryRpcTraits<std::unique_ptr<Responder<Reply>> (Stub::*)(grpc::ClientContext*, const Request&, grpc::CompletionQueue*)> {
        using StubType = Stub;
        using RequestType = Request;
        using ReplyType = Reply;
    };
}  // namespace detail

//! Perform a unary RPC asynchronously on the gRPC context, throwing GrpcStatusError on failure
template <auto PrepareAsync, typename Traits = detail::UnaryRpcTraits<decltype(PrepareAsync)>>
Task<typename Traits::ReplyType> unary_rpc(typename Traits::StubType& stub,
                                           typename Traits::RequestType request,
                                           agrpc::GrpcContext& grpc_context,
                                           const ClientContextSetup& setup = {}) {
    grpc::ClientContext client_context;
    if (setup) {
        setup(client_context);
    }
    typename Traits::ReplyType reply;
    const grpc::Status status = co_await agrpc::ClientRPC<PrepareAsync>::request(
        grpc_context, stub, client_context, request, reply, boost::asio::use_awaitable);
    if (!status.ok()) {
        FIREHOSE_TRACE << "unary_rpc failed: " << status;
        throw GrpcStatusError{status};
    }
    co_return reply;
}

}  // namespace firehose::rpc
