// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <grpcpp/support/status.h>

#include <firehose/interfaces/sf/firehose/v2/firehose.pb.h>

#include <firehose/core/request.hpp>
#include <firehose/core/response.hpp>

#include <firehose/client/transport_error.hpp>

namespace firehose::client {

namespace proto = ::sf::firehose::v2;

proto::Request request_to_proto(const StreamRequest& request);
StreamRequest request_from_proto(const proto::Request& request);

proto::SingleBlockRequest single_block_request_to_proto(const SingleBlockRequest& request);
SingleBlockRequest single_block_request_from_proto(const proto::SingleBlockRequest& request);

Response response_from_proto(const proto::Response& response);
proto::Response response_to_proto(const Response& response);

SingleBlockResponse single_block_response_from_proto(const proto::SingleBlockResponse& response);

ForkStep fork_step_from_proto(proto::ForkStep step);
proto::ForkStep fork_step_to_proto(ForkStep step);

BlockMetadata metadata_from_proto(const proto::BlockMetadata& metadata);
proto::BlockMetadata metadata_to_proto(const BlockMetadata& metadata);

//! Empty error for an OK status, the status code in the grpc category plus the status message otherwise
TransportError transport_error_from_status(const grpc::Status& status);

}  // namespace firehose::client
