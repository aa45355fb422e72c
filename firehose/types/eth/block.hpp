// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include <firehose/core/base.hpp>
#include <firehose/core/conversion_error.hpp>
#include <firehose/core/response.hpp>

namespace firehose::eth {

//! Oldest and newest versions of the sf.ethereum.type.v2.Block model this client understands
inline constexpr int32_t kMinBlockModelVersion{1};
inline constexpr int32_t kMaxBlockModelVersion{4};

//! Execution layer block decoded from sf.ethereum.type.v2.Block, identified by its block number
struct Block {
    using Error = ConversionError;

    int32_t version{0};
    BlockNum number{0};
    //! Hashes are lowercase hex without prefix, the same format as BlockMetadata::id
    std::string hash;
    std::string parent_hash;
    uint64_t size{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    std::chrono::system_clock::time_point timestamp;
    size_t transaction_count{0};

    BlockNum number_or_slot() const { return number; }

    static ConversionResult<Block> from_response(Response msg);

    friend bool operator==(const Block&, const Block&) = default;
};

std::ostream& operator<<(std::ostream& out, const Block& block);

}  // namespace firehose::eth
