// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <firehose/core/base.hpp>
#include <firehose/core/payload.hpp>

namespace firehose {

//! How a streamed block relates to the canonical chain
enum class ForkStep : uint8_t {
    kUnset = 0,  // Wire default, only found in responses adapted from a single-block fetch
    kNew = 1,    // Block appended to the canonical chain
    kUndo = 2,   // Block retracted from the canonical chain due to a reorg
    kFinal = 3,  // Block is now irreversible
};

std::string_view to_string(ForkStep step);

std::ostream& operator<<(std::ostream& out, ForkStep step);

//! Denormalized block information allowing to filter without decoding the payload
struct BlockMetadata {
    BlockNum num{0};
    //! Block hash
    std::string id;
    BlockNum parent_num{0};
    std::string parent_id;
    //! Last irreversible block number known by the server when emitting this block
    BlockNum lib_num{0};
    std::chrono::system_clock::time_point time;

    friend bool operator==(const BlockMetadata&, const BlockMetadata&) = default;
};

std::ostream& operator<<(std::ostream& out, const BlockMetadata& metadata);

//! One unit of the Firehose block stream
struct Response {
    ForkStep step{ForkStep::kUnset};
    //! Chain specific block, opaque at this layer
    std::optional<Payload> block;
    //! Resumption point to be persisted by the consumer once this response has been processed
    std::string cursor;
    std::optional<BlockMetadata> metadata;

    friend bool operator==(const Response&, const Response&) = default;
};

std::ostream& operator<<(std::ostream& out, const Response& response);

//! Result of a point lookup on the Firehose Fetch API: no fork step, no cursor
struct SingleBlockResponse {
    std::optional<Payload> block;
    std::optional<BlockMetadata> metadata;

    friend bool operator==(const SingleBlockResponse&, const SingleBlockResponse&) = default;
};

//! Adapt a fetch response so that it can go through the same conversion as streamed responses
Response to_response(SingleBlockResponse response);

}  // namespace firehose
