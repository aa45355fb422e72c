// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <firehose/core/base.hpp>
#include <firehose/core/conversion_error.hpp>
#include <firehose/core/response.hpp>

namespace firehose::beacon {

//! Consensus layer fork the block belongs to
enum class Fork : uint8_t {
    kUnknown,
    kPhase0,
    kAltair,
    kBellatrix,
    kCapella,
    kDeneb,
    kElectra,
};

std::string_view to_string(Fork fork);

//! Conversion error enriched with the slot being decoded, if known
struct DecodeError {
    ConversionError code;
    std::string detail;

    friend bool operator==(const DecodeError&, const DecodeError&) = default;
};

std::ostream& operator<<(std::ostream& out, const DecodeError& error);

//! Consensus layer block decoded from sf.beacon.type.v1.Block, identified by its slot
struct Block {
    using Error = DecodeError;

    Fork fork{Fork::kUnknown};
    BlockNum slot{0};
    BlockNum parent_slot{0};
    //! Roots are lowercase hex without prefix, the same format as BlockMetadata::id
    std::string root;
    std::string parent_root;
    std::string state_root;
    uint64_t proposer_index{0};
    std::chrono::system_clock::time_point timestamp;

    BlockNum number_or_slot() const { return slot; }

    static tl::expected<Block, DecodeError> from_response(Response msg);

    friend bool operator==(const Block&, const Block&) = default;
};

std::ostream& operator<<(std::ostream& out, const Block& block);

}  // namespace firehose::beacon
