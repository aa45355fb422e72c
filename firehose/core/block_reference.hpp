// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <variant>

#include <firehose/core/base.hpp>

namespace firehose {

//! The current canonical block at the given number
struct BlockNumber {
    BlockNum num{0};

    friend bool operator==(const BlockNumber&, const BlockNumber&) = default;
};

//! The block with the given hash and number, the hash encoding is chain specific and not validated here
struct BlockHashAndNumber {
    std::string hash;
    BlockNum num{0};

    friend bool operator==(const BlockHashAndNumber&, const BlockHashAndNumber&) = default;
};

//! The block which generated the given stream cursor
struct Cursor {
    std::string cursor;

    friend bool operator==(const Cursor&, const Cursor&) = default;
};

//! Reference to a single block: exactly one alternative is active
using BlockReference = std::variant<BlockNumber, BlockHashAndNumber, Cursor>;

std::ostream& operator<<(std::ostream& out, const BlockReference& reference);

std::string to_string(const BlockReference& reference);

}  // namespace firehose
