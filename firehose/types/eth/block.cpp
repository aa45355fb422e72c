// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <firehose/infra/grpc/common/conversion.hpp>
#include <firehose/interfaces/sf/ethereum/type/v2/type.pb.h>
#include <firehose/types/unpack.hpp>

namespace firehose::eth {

namespace proto = ::sf::ethereum::type::v2;

ConversionResult<Block> Block::from_response(Response msg) {
    const auto decoded = unpack_payload<proto::Block>(msg.block);
    if (!decoded) {
        return tl::unexpected{decoded.error()};
    }
    const proto::Block& proto_block = *decoded;
    if (proto_block.ver() < kMinBlockModelVersion || proto_block.ver() > kMaxBlockModelVersion) {
        return tl::unexpected{ConversionError::kUnsupportedVersion};
    }
    if (!proto_block.has_header() || proto_block.hash().empty()) {
        return tl::unexpected{ConversionError::kMissingField};
    }
    const proto::BlockHeader& header = proto_block.header();
    if (header.number() != proto_block.number()) {
        return tl::unexpected{ConversionError::kMalformedPayload};
    }

    Block block{
        .version = proto_block.ver(),
        .number = proto_block.number(),
        .hash = rpc::hex_from_bytes(proto_block.hash()),
        .parent_hash = rpc::hex_from_bytes(header.parent_hash()),
        .size = proto_block.size(),
        .gas_limit = header.gas_limit(),
        .gas_used = header.gas_used(),
        .timestamp = header.has_timestamp() ? rpc::time_point_from_timestamp(header.timestamp()) : std::chrono::system_clock::time_point{},
        .transaction_count = static_cast<size_t>(proto_block.transaction_traces_size()),
    };

    if (msg.metadata) {
        const BlockMetadata& metadata = *msg.metadata;
        if (metadata.num != block.number || (!metadata.id.empty() && metadata.id != block.hash)) {
            return tl::unexpected{ConversionError::kInconsistentMetadata};
        }
    }
    return block;
}

std::ostream& operator<<(std::ostream& out, const Block& block) {
    out << "number=" << block.number << " hash=" << block.hash << " parent=" << block.parent_hash
        << " txs=" << block.transaction_count << " gas_used=" << block.gas_used;
    return out;
}

}  // namespace firehose::eth
