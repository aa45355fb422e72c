// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "remote_fetch_client.hpp"

#include <chrono>
#include <utility>

#include <firehose/client/channel.hpp>
#include <firehose/client/conversion.hpp>
#include <firehose/infra/common/log.hpp>
#include <firehose/infra/grpc/client/call.hpp>

namespace firehose::client {

RemoteFetchClient::RemoteFetchClient(const std::shared_ptr<grpc::Channel>& channel,
                                     agrpc::GrpcContext& grpc_context,
                                     Settings settings)
    : RemoteFetchClient(::sf::firehose::v2::Fetch::NewStub(channel), grpc_context, std::move(settings)) {}

RemoteFetchClient::RemoteFetchClient(std::unique_ptr<Stub> stub, agrpc::GrpcContext& grpc_context, Settings settings)
    : stub_(std::move(stub)), grpc_context_(grpc_context), settings_(std::move(settings)) {}

Task<FetchResult> RemoteFetchClient::block(const SingleBlockRequest& request) {
    const auto start_time = std::chrono::steady_clock::now();
    auto setup = [&](grpc::ClientContext& context) {
        add_auth_metadata(context, settings_);
        if (settings_.request_timeout.count() > 0) {
            context.set_deadline(std::chrono::system_clock::now() + settings_.request_timeout);
        }
        if (settings_.compression) {
            context.set_compression_algorithm(GRPC_COMPRESS_GZIP);
        }
    };
    try {
        const auto reply = co_await rpc::unary_rpc<&Stub::PrepareAsyncBlock>(
            *stub_, single_block_request_to_proto(request), grpc_context_, setup);
        FIREHOSE_TRACE << "RemoteFetchClient::block " << request << " t="
                       << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count()
                       << "ms";
        co_return single_block_response_from_proto(reply);
    } catch (const rpc::GrpcStatusError& error) {
        FIREHOSE_DEBUG << "RemoteFetchClient::block " << request << " failed: " << error.status();
        co_return tl::make_unexpected(transport_error_from_status(error.status()));
    }
}

}  // namespace firehose::client
