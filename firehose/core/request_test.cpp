// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <sstream>
#include <variant>

#include <catch2/catch.hpp>

namespace firehose {

TEST_CASE("SingleBlockRequest::by_block_number", "[firehose][core][request]") {
    const auto request = SingleBlockRequest::by_block_number(12345);
    REQUIRE(request.reference);
    REQUIRE(std::holds_alternative<BlockNumber>(*request.reference));
    CHECK(std::get<BlockNumber>(*request.reference).num == 12345);
    CHECK(request.transforms.empty());

    SECTION("legacy constructor is the same request") {
        CHECK(SingleBlockRequest{12345} == request);
        CHECK(SingleBlockRequest{0} == SingleBlockRequest::by_block_number(0));
    }
}

TEST_CASE("SingleBlockRequest::by_block_hash_and_number", "[firehose][core][request]") {
    const auto request = SingleBlockRequest::by_block_hash_and_number("0xabc", 12345);
    REQUIRE(request.reference);
    REQUIRE(std::holds_alternative<BlockHashAndNumber>(*request.reference));
    const auto& reference = std::get<BlockHashAndNumber>(*request.reference);
    CHECK(reference.hash == "0xabc");
    CHECK(reference.num == 12345);
    CHECK(request != SingleBlockRequest::by_block_number(12345));

    SECTION("hash is not validated") {
        const auto empty_hash = SingleBlockRequest::by_block_hash_and_number("", 0);
        CHECK(std::get<BlockHashAndNumber>(*empty_hash.reference).hash.empty());
        const auto odd_hash = SingleBlockRequest::by_block_hash_and_number("not-hex", 1);
        CHECK(std::get<BlockHashAndNumber>(*odd_hash.reference).hash == "not-hex");
    }
}

TEST_CASE("SingleBlockRequest::by_cursor", "[firehose][core][request]") {
    const auto request = SingleBlockRequest::by_cursor("c1");
    REQUIRE(request.reference);
    REQUIRE(std::holds_alternative<Cursor>(*request.reference));
    CHECK(std::get<Cursor>(*request.reference).cursor == "c1");
}

TEST_CASE("SingleBlockRequest default has no reference", "[firehose][core][request]") {
    const SingleBlockRequest request;
    CHECK_FALSE(request.reference);
    std::stringstream out;
    out << request;
    CHECK(out.str() == "reference=<none> transforms=0");
}

TEST_CASE("StreamRequest default values", "[firehose][core][request]") {
    const StreamRequest request;
    CHECK(request.start_block_num == 0);
    CHECK(request.stop_block_num == 0);
    CHECK(request.cursor.empty());
    CHECK_FALSE(request.final_blocks_only);
    CHECK(request.transforms.empty());
    CHECK_FALSE(request.is_bounded());
    CHECK_FALSE(request.has_cursor());
}

TEST_CASE("StreamRequest with cursor and start block", "[firehose][core][request]") {
    const StreamRequest request{.start_block_num = 100, .stop_block_num = 200, .cursor = "c42"};
    CHECK(request.is_bounded());
    CHECK(request.has_cursor());
    CHECK(request.start_block_num == 100);

    std::stringstream out;
    out << request;
    CHECK(out.str() == "start=100 stop=200 cursor=c42 final_blocks_only=false transforms=0");
}

TEST_CASE("StreamRequest relative start", "[firehose][core][request]") {
    const StreamRequest request{.start_block_num = -10, .final_blocks_only = true};
    CHECK(request.start_block_num == -10);
    CHECK(request.final_blocks_only);
    CHECK_FALSE(request.is_bounded());
}

}  // namespace firehose
