// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "typed.hpp"

#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <firehose/client/test_util/mock_stream_client.hpp>
#include <firehose/client/test_util/sample_block.hpp>
#include <firehose/client/test_util/scripted_stream_client.hpp>
#include <firehose/infra/grpc/common/error.hpp>
#include <firehose/infra/test_util/task_runner.hpp>

namespace firehose::client {

using testing::_;
using testing::Invoke;
using test_util::make_response;
using test_util::MockFetchClient;
using test_util::MockStreamClient;
using test_util::SampleBlock;
using test_util::ScriptedStreamClient;

TEST_CASE("to_typed_response", "[firehose][client][typed]") {
    SECTION("convertible response") {
        const auto typed = to_typed_response<SampleBlock>(make_response(ForkStep::kNew, 5, "h5", "c5"));
        CHECK(typed.step == ForkStep::kNew);
        CHECK(typed.cursor == "c5");
        REQUIRE(typed.metadata);
        CHECK(typed.metadata->num == 5);
        REQUIRE(typed.block);
        CHECK(*typed.block == SampleBlock{5, "h5"});
    }

    SECTION("conversion error keeps the cursor") {
        auto response = make_response(ForkStep::kUndo, 5, "h5", "c5");
        response.metadata.reset();
        const auto typed = to_typed_response<SampleBlock>(response);
        CHECK(typed.step == ForkStep::kUndo);
        CHECK(typed.cursor == "c5");
        REQUIRE_FALSE(typed.block);
        CHECK(typed.block.error() == ConversionError::kMissingField);
    }
}

TEST_CASE("stream_blocks", "[firehose][client][typed]") {
    firehose::test_util::TaskRunner runner;

    SECTION("responses are converted in server order") {
        auto script = test_util::make_linear_script(1, 3);
        script[1].metadata.reset();
        ScriptedStreamClient client{script};
        std::vector<TypedResponse<SampleBlock>> received;
        const auto error = runner.run(stream_blocks<SampleBlock>(client, StreamRequest{}, [&](TypedResponse<SampleBlock> r) -> Task<StreamControl> {
            received.push_back(std::move(r));
            co_return StreamControl::kContinue;
        }));
        CHECK_FALSE(error);
        REQUIRE(received.size() == 3);
        CHECK(received[0].block);
        CHECK_FALSE(received[1].block);
        CHECK(received[1].cursor == "c2");
        CHECK(received[2].block->number == 3);
    }

    SECTION("request is forwarded and transport error is returned") {
        MockStreamClient client;
        const StreamRequest request{.start_block_num = 10, .stop_block_num = 20};
        EXPECT_CALL(client, blocks(request, _)).WillOnce(Invoke([](const StreamRequest&, ResponseConsumer consumer) -> Task<TransportError> {
            co_await consumer(make_response(ForkStep::kNew, 10, "h10", "c10"));
            co_return TransportError{.code = rpc::make_error_code(grpc::StatusCode::UNAVAILABLE), .message = "gone"};
        }));
        size_t count{0};
        const auto error = runner.run(stream_blocks<SampleBlock>(client, request, [&](TypedResponse<SampleBlock>) -> Task<StreamControl> {
            ++count;
            co_return StreamControl::kContinue;
        }));
        CHECK(count == 1);
        CHECK(rpc::is_grpc_error(error.code, grpc::StatusCode::UNAVAILABLE));
        CHECK(error.message == "gone");
    }
}

TEST_CASE("fetch_block", "[firehose][client][typed]") {
    firehose::test_util::TaskRunner runner;
    MockFetchClient client;
    const auto request = SingleBlockRequest::by_block_hash_and_number("0xabc", 12345);

    SECTION("block found") {
        EXPECT_CALL(client, block(request)).WillOnce(Invoke([](const SingleBlockRequest&) -> Task<FetchResult> {
            co_return SingleBlockResponse{.metadata = BlockMetadata{.num = 12345, .id = "abc"}};
        }));
        const auto result = runner.run(fetch_block<SampleBlock>(client, request));
        REQUIRE(result);
        CHECK(*result == SampleBlock{12345, "abc"});
    }

    SECTION("transport error") {
        EXPECT_CALL(client, block(request)).WillOnce(Invoke([](const SingleBlockRequest&) -> Task<FetchResult> {
            co_return tl::make_unexpected(TransportError{.code = rpc::make_error_code(grpc::StatusCode::NOT_FOUND),
                                                         .message = "block not found"});
        }));
        const auto result = runner.run(fetch_block<SampleBlock>(client, request));
        REQUIRE_FALSE(result);
        CHECK(result.error().is_transport());
        CHECK(describe(result.error()) == "transport error: NOT_FOUND: block not found");
    }

    SECTION("conversion error") {
        EXPECT_CALL(client, block(request)).WillOnce(Invoke([](const SingleBlockRequest&) -> Task<FetchResult> {
            co_return SingleBlockResponse{};
        }));
        const auto result = runner.run(fetch_block<SampleBlock>(client, request));
        REQUIRE_FALSE(result);
        CHECK(result.error().is_conversion());
        CHECK(std::get<ConversionError>(result.error().cause) == ConversionError::kMissingField);
    }
}

}  // namespace firehose::client
