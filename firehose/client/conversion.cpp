// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "conversion.hpp"

#include <firehose/core/overloaded.hpp>
#include <firehose/infra/grpc/common/conversion.hpp>
#include <firehose/infra/grpc/common/error.hpp>

namespace firehose::client {

static Payload payload_from_any(const google::protobuf::Any& any) {
    return Payload{.type_url = any.type_url(), .value = any.value()};
}

static void payload_to_any(const Payload& payload, google::protobuf::Any* any) {
    any->set_type_url(payload.type_url);
    any->set_value(payload.value);
}

proto::Request request_to_proto(const StreamRequest& request) {
    proto::Request proto_request;
    proto_request.set_start_block_num(request.start_block_num);
    proto_request.set_stop_block_num(request.stop_block_num);
    proto_request.set_cursor(request.cursor);
    proto_request.set_final_blocks_only(request.final_blocks_only);
    for (const auto& transform : request.transforms) {
        payload_to_any(transform, proto_request.add_transforms());
    }
    return proto_request;
}

StreamRequest request_from_proto(const proto::Request& request) {
    StreamRequest stream_request{
        .start_block_num = request.start_block_num(),
        .stop_block_num = request.stop_block_num(),
        .cursor = request.cursor(),
        .final_blocks_only = request.final_blocks_only(),
    };
    stream_request.transforms.reserve(static_cast<size_t>(request.transforms_size()));
    for (const auto& transform : request.transforms()) {
        stream_request.transforms.push_back(payload_from_any(transform));
    }
    return stream_request;
}

proto::SingleBlockRequest single_block_request_to_proto(const SingleBlockRequest& request) {
    proto::SingleBlockRequest proto_request;
    if (request.reference) {
        std::visit(Overloaded{
                       [&](const BlockNumber& r) {
                           proto_request.mutable_block_number()->set_num(r.num);
                       },
                       [&](const BlockHashAndNumber& r) {
                           auto* reference = proto_request.mutable_block_hash_and_number();
                           reference->set_hash(r.hash);
                           reference->set_num(r.num);
                       },
                       [&](const Cursor& r) {
                           proto_request.mutable_cursor()->set_cursor(r.cursor);
                       },
                   },
                   *request.reference);
    }
    for (const auto& transform : request.transforms) {
        payload_to_any(transform, proto_request.add_transforms());
    }
    return proto_request;
}

SingleBlockRequest single_block_request_from_proto(const proto::SingleBlockRequest& request) {
    SingleBlockRequest single_block_request;
    switch (request.reference_case()) {
        case proto::SingleBlockRequest::kBlockNumber:
            single_block_request.reference = BlockNumber{request.block_number().num()};
            break;
        case proto::SingleBlockRequest::kBlockHashAndNumber:
            single_block_request.reference = BlockHashAndNumber{
                request.block_hash_and_number().hash(),
                request.block_hash_and_number().num(),
            };
            break;
        case proto::SingleBlockRequest::kCursor:
            single_block_request.reference = Cursor{request.cursor().cursor()};
            break;
        default:
            break;
    }
    for (const auto& transform : request.transforms()) {
        single_block_request.transforms.push_back(payload_from_any(transform));
    }
    return single_block_request;
}

Response response_from_proto(const proto::Response& response) {
    Response result{
        .step = fork_step_from_proto(response.step()),
        .cursor = response.cursor(),
    };
    if (response.has_block()) {
        result.block = payload_from_any(response.block());
    }
    if (response.has_metadata()) {
        result.metadata = metadata_from_proto(response.metadata());
    }
    return result;
}

proto::Response response_to_proto(const Response& response) {
    proto::Response proto_response;
    proto_response.set_step(fork_step_to_proto(response.step));
    proto_response.set_cursor(response.cursor);
    if (response.block) {
        payload_to_any(*response.block, proto_response.mutable_block());
    }
    if (response.metadata) {
        *proto_response.mutable_metadata() = metadata_to_proto(*response.metadata);
    }
    return proto_response;
}

SingleBlockResponse single_block_response_from_proto(const proto::SingleBlockResponse& response) {
    SingleBlockResponse result;
    if (response.has_block()) {
        result.block = payload_from_any(response.block());
    }
    if (response.has_metadata()) {
        result.metadata = metadata_from_proto(response.metadata());
    }
    return result;
}

ForkStep fork_step_from_proto(proto::ForkStep step) {
    switch (step) {
        case proto::STEP_NEW:
            return ForkStep::kNew;
        case proto::STEP_UNDO:
            return ForkStep::kUndo;
        case proto::STEP_FINAL:
            return ForkStep::kFinal;
        default:
            return ForkStep::kUnset;
    }
}

proto::ForkStep fork_step_to_proto(ForkStep step) {
    switch (step) {
        case ForkStep::kNew:
            return proto::STEP_NEW;
        case ForkStep::kUndo:
            return proto::STEP_UNDO;
        case ForkStep::kFinal:
            return proto::STEP_FINAL;
        default:
            return proto::STEP_UNSET;
    }
}

BlockMetadata metadata_from_proto(const proto::BlockMetadata& metadata) {
    BlockMetadata block_metadata{
        .num = metadata.num(),
        .id = metadata.id(),
        .parent_num = metadata.parent_num(),
        .parent_id = metadata.parent_id(),
        .lib_num = metadata.lib_num(),
    };
    if (metadata.has_time()) {
        block_metadata.time = rpc::time_point_from_timestamp(metadata.time());
    }
    return block_metadata;
}

proto::BlockMetadata metadata_to_proto(const BlockMetadata& metadata) {
    proto::BlockMetadata proto_metadata;
    proto_metadata.set_num(metadata.num);
    proto_metadata.set_id(metadata.id);
    proto_metadata.set_parent_num(metadata.parent_num);
    proto_metadata.set_parent_id(metadata.parent_id);
    proto_metadata.set_lib_num(metadata.lib_num);
    *proto_metadata.mutable_time() = rpc::timestamp_from_time_point(metadata.time);
    return proto_metadata;
}

TransportError transport_error_from_status(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return TransportError{.code = rpc::make_error_code(status.error_code()), .message = status.error_message()};
}

}  // namespace firehose::client
