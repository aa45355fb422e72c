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

#include <firehose/client/fetch_client.hpp>
#include <firehose/client/settings.hpp>

namespace firehose::client {

//! FetchClient implementation calling the sf.firehose.v2.Fetch service over gRPC
class RemoteFetchClient final : public FetchClient {
  public:
    using Stub = ::sf::firehose::v2::Fetch::StubInterface;

    RemoteFetchClient(const std::shared_ptr<grpc::Channel>& channel, agrpc::GrpcContext& grpc_context, Settings settings);
    RemoteFetchClient(std::unique_ptr<Stub> stub, agrpc::GrpcContext& grpc_context, Settings settings);

    RemoteFetchClient(const RemoteFetchClient&) = delete;
    RemoteFetchClient& operator=(const RemoteFetchClient&) = delete;

    Task<FetchResult> block(const SingleBlockRequest& request) override;

  private:
    std::unique_ptr<Stub> stub_;
    agrpc::GrpcContext& grpc_context_;
    Settings settings_;
};

}  // namespace firehose::client
