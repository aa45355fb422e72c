// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include <firehose/core/base.hpp>
#include <firehose/core/conversion_error.hpp>
#include <firehose/core/response.hpp>

namespace firehose::client::test_util {

//! Minimal domain block built from the response metadata only, a response without metadata cannot be converted
struct SampleBlock {
    using Error = ConversionError;

    BlockNum number{0};
    std::string hash;

    BlockNum number_or_slot() const { return number; }

    static tl::expected<SampleBlock, Error> from_response(Response msg) {
        if (!msg.metadata) {
            return tl::make_unexpected(ConversionError::kMissingField);
        }
        return SampleBlock{msg.metadata->num, std::move(msg.metadata->id)};
    }

    friend bool operator==(const SampleBlock&, const SampleBlock&) = default;
};

inline std::ostream& operator<<(std::ostream& out, const SampleBlock& block) {
    out << "#" << block.number << " " << block.hash;
    return out;
}

//! Stream response for block (number, hash) carrying metadata and the given cursor
inline Response make_response(ForkStep step, BlockNum number, std::string hash, std::string cursor) {
    return Response{
        .step = step,
        .block = Payload{.type_url = "type.googleapis.com/test.SampleBlock", .value = hash},
        .cursor = std::move(cursor),
        .metadata = BlockMetadata{.num = number, .id = std::move(hash), .parent_num = number > 0 ? number - 1 : 0},
    };
}

//! Linear chain of kNew responses for blocks [first, first + count) with cursors "c<number>"
inline std::vector<Response> make_linear_script(BlockNum first, size_t count) {
    std::vector<Response> script;
    script.reserve(count);
    for (BlockNum n = first; n < first + count; ++n) {
        script.push_back(make_response(ForkStep::kNew, n, "h" + std::to_string(n), "c" + std::to_string(n)));
    }
    return script;
}

}  // namespace firehose::client::test_util
