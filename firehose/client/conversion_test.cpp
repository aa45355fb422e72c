// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "conversion.hpp"

#include <sstream>

#include <catch2/catch.hpp>

#include <firehose/infra/grpc/common/error.hpp>

namespace firehose::client {

using namespace std::chrono_literals;

TEST_CASE("request_to_proto", "[firehose][client][conversion]") {
    SECTION("default request") {
        const auto proto_request = request_to_proto(StreamRequest{});
        CHECK(proto_request.start_block_num() == 0);
        CHECK(proto_request.stop_block_num() == 0);
        CHECK(proto_request.cursor().empty());
        CHECK_FALSE(proto_request.final_blocks_only());
        CHECK(proto_request.transforms_size() == 0);
    }

    SECTION("all fields") {
        const StreamRequest request{
            .start_block_num = -100,
            .stop_block_num = 2000,
            .cursor = "c7",
            .final_blocks_only = true,
            .transforms = {Payload{.type_url = make_type_url("sf.ethereum.transform.v1.HeaderOnly"), .value = "x"}},
        };
        const auto proto_request = request_to_proto(request);
        CHECK(proto_request.start_block_num() == -100);
        CHECK(proto_request.stop_block_num() == 2000);
        CHECK(proto_request.cursor() == "c7");
        CHECK(proto_request.final_blocks_only());
        REQUIRE(proto_request.transforms_size() == 1);
        CHECK(proto_request.transforms(0).type_url() == "type.googleapis.com/sf.ethereum.transform.v1.HeaderOnly");
        CHECK(proto_request.transforms(0).value() == "x");
        CHECK(request_from_proto(proto_request) == request);
    }
}

TEST_CASE("single_block_request_to_proto", "[firehose][client][conversion]") {
    SECTION("by block number") {
        const auto proto_request = single_block_request_to_proto(SingleBlockRequest::by_block_number(12345));
        REQUIRE(proto_request.reference_case() == proto::SingleBlockRequest::kBlockNumber);
        CHECK(proto_request.block_number().num() == 12345);
    }

    SECTION("by block hash and number") {
        const auto proto_request = single_block_request_to_proto(SingleBlockRequest::by_block_hash_and_number("0xabc", 12345));
        REQUIRE(proto_request.reference_case() == proto::SingleBlockRequest::kBlockHashAndNumber);
        CHECK(proto_request.block_hash_and_number().hash() == "0xabc");
        CHECK(proto_request.block_hash_and_number().num() == 12345);
    }

    SECTION("by cursor") {
        const auto proto_request = single_block_request_to_proto(SingleBlockRequest::by_cursor("c3"));
        REQUIRE(proto_request.reference_case() == proto::SingleBlockRequest::kCursor);
        CHECK(proto_request.cursor().cursor() == "c3");
    }

    SECTION("no reference") {
        const auto proto_request = single_block_request_to_proto(SingleBlockRequest{});
        CHECK(proto_request.reference_case() == proto::SingleBlockRequest::REFERENCE_NOT_SET);
        CHECK(single_block_request_from_proto(proto_request) == SingleBlockRequest{});
    }
}

TEST_CASE("response_from_proto", "[firehose][client][conversion]") {
    proto::Response proto_response;
    proto_response.set_step(proto::STEP_UNDO);
    proto_response.set_cursor("c9");
    proto_response.mutable_block()->set_type_url("type.googleapis.com/sf.ethereum.type.v2.Block");
    proto_response.mutable_block()->set_value("payload");
    auto* metadata = proto_response.mutable_metadata();
    metadata->set_num(10);
    metadata->set_id("aa");
    metadata->set_parent_num(9);
    metadata->set_parent_id("bb");
    metadata->set_lib_num(2);
    metadata->mutable_time()->set_seconds(1'700'000'000);
    metadata->mutable_time()->set_nanos(500'000'000);

    const Response response = response_from_proto(proto_response);
    CHECK(response.step == ForkStep::kUndo);
    CHECK(response.cursor == "c9");
    REQUIRE(response.block);
    CHECK(response.block->type_url == "type.googleapis.com/sf.ethereum.type.v2.Block");
    CHECK(response.block->value == "payload");
    REQUIRE(response.metadata);
    CHECK(response.metadata->num == 10);
    CHECK(response.metadata->id == "aa");
    CHECK(response.metadata->parent_num == 9);
    CHECK(response.metadata->parent_id == "bb");
    CHECK(response.metadata->lib_num == 2);
    CHECK(response.metadata->time == std::chrono::system_clock::time_point{1'700'000'000s + 500ms});

    SECTION("back to proto") {
        const auto round_trip = response_to_proto(response);
        CHECK(round_trip.SerializeAsString() == proto_response.SerializeAsString());
    }

    SECTION("absent block and metadata") {
        const Response empty = response_from_proto(proto::Response{});
        CHECK(empty.step == ForkStep::kUnset);
        CHECK_FALSE(empty.block);
        CHECK_FALSE(empty.metadata);
    }
}

TEST_CASE("fork_step conversion", "[firehose][client][conversion]") {
    CHECK(fork_step_from_proto(proto::STEP_NEW) == ForkStep::kNew);
    CHECK(fork_step_from_proto(proto::STEP_UNDO) == ForkStep::kUndo);
    CHECK(fork_step_from_proto(proto::STEP_FINAL) == ForkStep::kFinal);
    CHECK(fork_step_from_proto(proto::STEP_UNSET) == ForkStep::kUnset);
    CHECK(fork_step_from_proto(static_cast<proto::ForkStep>(99)) == ForkStep::kUnset);
    CHECK(fork_step_to_proto(ForkStep::kFinal) == proto::STEP_FINAL);
}

TEST_CASE("single_block_response_from_proto", "[firehose][client][conversion]") {
    proto::SingleBlockResponse proto_response;
    proto_response.mutable_block()->set_type_url("type.googleapis.com/x.Y");
    proto_response.mutable_metadata()->set_num(5);
    const auto response = single_block_response_from_proto(proto_response);
    REQUIRE(response.block);
    CHECK(response.block->type_url == "type.googleapis.com/x.Y");
    REQUIRE(response.metadata);
    CHECK(response.metadata->num == 5);
}

TEST_CASE("transport_error_from_status", "[firehose][client][conversion]") {
    SECTION("OK status") {
        CHECK_FALSE(transport_error_from_status(grpc::Status::OK));
    }

    SECTION("retained errors keep their own message") {
        const auto unavailable = transport_error_from_status(grpc::Status{grpc::StatusCode::UNAVAILABLE, "connection reset"});
        const auto not_found = transport_error_from_status(grpc::Status{grpc::StatusCode::NOT_FOUND, "block not found"});
        REQUIRE(unavailable);
        CHECK(rpc::is_grpc_error(unavailable.code, grpc::StatusCode::UNAVAILABLE));
        CHECK(unavailable.message == "connection reset");
        CHECK(rpc::is_grpc_error(not_found.code, grpc::StatusCode::NOT_FOUND));
        CHECK(not_found.message == "block not found");
        std::ostringstream out;
        out << unavailable;
        CHECK(out.str() == "UNAVAILABLE: connection reset");
    }
}

}  // namespace firehose::client
