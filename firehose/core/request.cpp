// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <utility>

namespace firehose {

std::ostream& operator<<(std::ostream& out, const StreamRequest& request) {
    out << "start=" << request.start_block_num
        << " stop=" << request.stop_block_num
        << " cursor=" << (request.has_cursor() ? request.cursor : "<none>")
        << " final_blocks_only=" << std::boolalpha << request.final_blocks_only << std::noboolalpha
        << " transforms=" << request.transforms.size();
    return out;
}

SingleBlockRequest::SingleBlockRequest(BlockNum num) : SingleBlockRequest{by_block_number(num)} {}

SingleBlockRequest SingleBlockRequest::by_block_number(BlockNum num) {
    SingleBlockRequest request;
    request.reference = BlockNumber{num};
    return request;
}

SingleBlockRequest SingleBlockRequest::by_block_hash_and_number(std::string hash, BlockNum num) {
    SingleBlockRequest request;
    request.reference = BlockHashAndNumber{std::move(hash), num};
    return request;
}

SingleBlockRequest SingleBlockRequest::by_cursor(std::string cursor) {
    SingleBlockRequest request;
    request.reference = Cursor{std::move(cursor)};
    return request;
}

std::ostream& operator<<(std::ostream& out, const SingleBlockRequest& request) {
    if (request.reference) {
        out << *request.reference;
    } else {
        out << "reference=<none>";
    }
    out << " transforms=" << request.transforms.size();
    return out;
}

}  // namespace firehose
