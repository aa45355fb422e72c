// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/grpc_context.hpp>
#pragma GCC diagnostic pop
#include <grpcpp/grpcpp.h>

#include <firehose/interfaces/sf/firehose/v2/firehose.grpc.pb.h>

#include <firehose/client/settings.hpp>
#include <firehose/client/stream_client.hpp>

namespace firehose::client {

//! StreamClient implementation calling the sf.firehose.v2.Stream service over gRPC
class RemoteStreamClient final : public StreamClient {
  public:
    using Stub = ::sf::firehose::v2::Stream::StubInterface;

    RemoteStreamClient(const std::shared_ptr<grpc::Channel>& channel, agrpc::GrpcContext& grpc_context, Settings settings);
    RemoteStreamClient(std::unique_ptr<Stub> stub, agrpc::GrpcContext& grpc_context, Settings settings);

    RemoteStreamClient(const RemoteStreamClient&) = delete;
    RemoteStreamClient& operator=(const RemoteStreamClient&) = delete;

    Task<TransportError> blocks(const StreamRequest& request, ResponseConsumer consumer) override;

  private:
    std::unique_ptr<Stub> stub_;
    agrpc::GrpcContext& grpc_context_;
    Settings settings_;
};

}  // namespace firehose::client
