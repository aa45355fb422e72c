// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <firehose/core/base.hpp>
#include <firehose/core/block_reference.hpp>
#include <firehose/core/payload.hpp>

namespace firehose {

//! \brief Request for the Firehose Stream API.
//! \details Start from a default value and set the fields you need.
//! When \p cursor is not empty the server resumes the stream right after the cursor position and \p start_block_num is
//! ignored: providing both is legit and is not validated client-side (the cursor always wins).
struct StreamRequest {
    //! First block to deliver (inclusive), negative values are relative to the chain head
    int64_t start_block_num{0};
    //! Last block to deliver (inclusive), 0 means unbounded
    BlockNum stop_block_num{0};
    //! Resumption point previously received in Response::cursor, empty means none
    std::string cursor;
    //! Deliver only irreversible blocks if true, all blocks (including the ones subject to reorg) otherwise
    bool final_blocks_only{false};
    //! Opaque chain specific filters and field masks
    std::vector<Payload> transforms;

    bool is_bounded() const { return stop_block_num != 0; }
    bool has_cursor() const { return !cursor.empty(); }

    friend bool operator==(const StreamRequest&, const StreamRequest&) = default;
};

std::ostream& operator<<(std::ostream& out, const StreamRequest& request);

//! \brief Request for the Firehose Fetch API.
//! \details A default value has no reference: the server rejects it as an invalid argument.
struct SingleBlockRequest {
    SingleBlockRequest() = default;

    //! Same as by_block_number, kept for backward compatibility
    explicit SingleBlockRequest(BlockNum num);

    static SingleBlockRequest by_block_number(BlockNum num);
    static SingleBlockRequest by_block_hash_and_number(std::string hash, BlockNum num);
    static SingleBlockRequest by_cursor(std::string cursor);

    std::optional<BlockReference> reference;
    std::vector<Payload> transforms;

    friend bool operator==(const SingleBlockRequest&, const SingleBlockRequest&) = default;
};

std::ostream& operator<<(std::ostream& out, const SingleBlockRequest& request);

}  // namespace firehose
