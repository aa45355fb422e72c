// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "remote_stream_client.hpp"

#include <utility>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/client_rpc.hpp>
#pragma GCC diagnostic pop
#include <boost/asio/use_awaitable.hpp>

#include <firehose/client/channel.hpp>
#include <firehose/client/conversion.hpp>
#include <firehose/infra/common/log.hpp>
#include <firehose/infra/grpc/common/util.hpp>

namespace firehose::client {

using BlocksRpc = agrpc::ClientRPC<&RemoteStreamClient::Stub::PrepareAsyncBlocks>;

RemoteStreamClient::RemoteStreamClient(const std::shared_ptr<grpc::Channel>& channel,
                                       agrpc::GrpcContext& grpc_context,
                                       Settings settings)
    : RemoteStreamClient(::sf::firehose::v2::Stream::NewStub(channel), grpc_context, std::move(settings)) {}

RemoteStreamClient::RemoteStreamClient(std::unique_ptr<Stub> stub, agrpc::GrpcContext& grpc_context, Settings settings)
    : stub_(std::move(stub)), grpc_context_(grpc_context), settings_(std::move(settings)) {}

Task<TransportError> RemoteStreamClient::blocks(const StreamRequest& request, ResponseConsumer consumer) {
    FIREHOSE_DEBUG << "RemoteStreamClient::blocks " << request;

    BlocksRpc rpc{grpc_context_};
    add_auth_metadata(rpc.context(), settings_);
    if (settings_.compression) {
        rpc.context().set_compression_algorithm(GRPC_COMPRESS_GZIP);
    }

    const auto proto_request = request_to_proto(request);
    if (!co_await rpc.start(*stub_, proto_request, boost::asio::use_awaitable)) {
        const grpc::Status status = co_await rpc.finish(boost::asio::use_awaitable);
        FIREHOSE_DEBUG << "RemoteStreamClient::blocks start failed: " << status;
        co_return transport_error_from_status(status);
    }

    bool stopped_by_consumer{false};
    uint64_t received{0};
    proto::Response reply;
    while (co_await rpc.read(reply, boost::asio::use_awaitable)) {
        ++received;
        auto response = response_from_proto(reply);
        FIREHOSE_TRACE << "RemoteStreamClient::blocks received step=" << response.step
                       << " cursor=" << response.cursor;
        if (co_await consumer(std::move(response)) == StreamControl::kStop) {
            stopped_by_consumer = true;
            break;
        }
    }

    if (stopped_by_consumer) {
        // Cancel the call and drain any message already in flight before finishing
        rpc.cancel();
        while (co_await rpc.read(reply, boost::asio::use_awaitable)) {
        }
    }

    const grpc::Status status = co_await rpc.finish(boost::asio::use_awaitable);
    FIREHOSE_DEBUG << "RemoteStreamClient::blocks end received=" << received << " status=" << status;
    if (stopped_by_consumer && status.error_code() == grpc::StatusCode::CANCELLED) {
        co_return TransportError{};
    }
    co_return transport_error_from_status(status);
}

}  // namespace firehose::client
