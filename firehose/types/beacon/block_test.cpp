// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <catch2/catch.hpp>

#include <firehose/core/block_identity.hpp>
#include <firehose/core/from_response.hpp>
#include <firehose/interfaces/sf/beacon/type/v1/type.pb.h>
#include <firehose/types/unpack.hpp>

namespace firehose::beacon {

namespace proto = ::sf::beacon::type::v1;

static_assert(FromResponse<Block>);
static_assert(HasNumberOrSlot<Block>);

static proto::Block sample_block(uint64_t slot = 9'000'000) {
    proto::Block block;
    block.set_version(1);
    block.set_spec(proto::DENEB);
    block.set_slot(slot);
    block.set_parent_slot(slot - 2);
    block.set_root(std::string{"\x0a\x0b", 2});
    block.set_parent_root(std::string{"\x0c", 1});
    block.set_state_root(std::string{"\x0d", 1});
    block.set_proposer_index(42);
    block.mutable_timestamp()->set_seconds(1'710'000'000);
    return block;
}

static Response response_for(const proto::Block& block) {
    return Response{
        .step = ForkStep::kFinal,
        .block = pack_payload(block),
        .cursor = "slot-cursor",
        .metadata = BlockMetadata{.num = block.slot(), .id = "0a0b"},
    };
}

TEST_CASE("beacon::Block::from_response", "[firehose][types][beacon]") {
    SECTION("valid block identified by slot") {
        const auto block = Block::from_response(response_for(sample_block()));
        REQUIRE(block);
        CHECK(block->fork == Fork::kDeneb);
        CHECK(block->slot == 9'000'000);
        CHECK(block->number_or_slot() == 9'000'000);
        CHECK(block->parent_slot == 8'999'998);
        CHECK(block->root == "0a0b");
        CHECK(block->parent_root == "0c");
        CHECK(block->state_root == "0d");
        CHECK(block->proposer_index == 42);
        CHECK(to_string(block->fork) == "deneb");
    }

    SECTION("genesis slot") {
        auto proto_block = sample_block();
        proto_block.set_slot(0);
        proto_block.set_parent_slot(0);
        const auto block = Block::from_response(response_for(proto_block));
        REQUIRE(block);
        CHECK(block->number_or_slot() == 0);
    }

    SECTION("wrong payload type carries the cursor") {
        auto response = response_for(sample_block());
        response.block->type_url = make_type_url("sf.ethereum.type.v2.Block");
        const auto block = Block::from_response(response);
        REQUIRE_FALSE(block);
        CHECK(block.error().code == ConversionError::kUnexpectedTypeUrl);
        CHECK(block.error().detail == "cursor slot-cursor");
        CHECK(describe(block.error()) == "unexpected block payload type: cursor slot-cursor");
    }

    SECTION("unsupported version") {
        auto proto_block = sample_block();
        proto_block.set_version(2);
        const auto block = Block::from_response(response_for(proto_block));
        REQUIRE_FALSE(block);
        CHECK(block.error().code == ConversionError::kUnsupportedVersion);
    }

    SECTION("missing root") {
        auto proto_block = sample_block();
        proto_block.clear_root();
        const auto block = Block::from_response(response_for(proto_block));
        REQUIRE_FALSE(block);
        CHECK(block.error().code == ConversionError::kMissingField);
    }

    SECTION("parent slot not before slot") {
        auto proto_block = sample_block();
        proto_block.set_parent_slot(proto_block.slot());
        const auto block = Block::from_response(response_for(proto_block));
        REQUIRE_FALSE(block);
        CHECK(block.error().code == ConversionError::kMalformedPayload);
    }

    SECTION("metadata num differs from slot") {
        auto response = response_for(sample_block());
        response.metadata->num = 1;
        const auto block = Block::from_response(response);
        REQUIRE_FALSE(block);
        CHECK(block.error().code == ConversionError::kInconsistentMetadata);
    }
}

}  // namespace firehose::beacon
