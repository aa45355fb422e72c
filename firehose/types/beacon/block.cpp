// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <absl/strings/str_cat.h>

#include <firehose/infra/grpc/common/conversion.hpp>
#include <firehose/interfaces/sf/beacon/type/v1/type.pb.h>
#include <firehose/types/unpack.hpp>

namespace firehose::beacon {

namespace proto = ::sf::beacon::type::v1;

//! The only sf.beacon.type.v1.Block model version this client understands
static constexpr uint32_t kBlockModelVersion{1};

std::string_view to_string(Fork fork) {
    switch (fork) {
        case Fork::kPhase0:
            return "phase0";
        case Fork::kAltair:
            return "altair";
        case Fork::kBellatrix:
            return "bellatrix";
        case Fork::kCapella:
            return "capella";
        case Fork::kDeneb:
            return "deneb";
        case Fork::kElectra:
            return "electra";
        default:
            return "unknown";
    }
}

static Fork fork_from_spec(proto::Spec spec) {
    switch (spec) {
        case proto::PHASE0:
            return Fork::kPhase0;
        case proto::ALTAIR:
            return Fork::kAltair;
        case proto::BELLATRIX:
            return Fork::kBellatrix;
        case proto::CAPELLA:
            return Fork::kCapella;
        case proto::DENEB:
            return Fork::kDeneb;
        case proto::ELECTRA:
            return Fork::kElectra;
        default:
            return Fork::kUnknown;
    }
}

std::ostream& operator<<(std::ostream& out, const DecodeError& error) {
    out << error.code;
    if (!error.detail.empty()) {
        out << ": " << error.detail;
    }
    return out;
}

tl::expected<Block, DecodeError> Block::from_response(Response msg) {
    auto decoded = unpack_payload<proto::Block>(msg.block);
    if (!decoded) {
        return tl::unexpected{DecodeError{decoded.error(), absl::StrCat("cursor ", msg.cursor)}};
    }
    const proto::Block& proto_block = *decoded;
    const auto slot_detail = [&]() { return absl::StrCat("slot ", proto_block.slot()); };

    if (proto_block.version() != kBlockModelVersion) {
        return tl::unexpected{DecodeError{ConversionError::kUnsupportedVersion,
                                          absl::StrCat("version ", proto_block.version())}};
    }
    if (proto_block.root().empty()) {
        return tl::unexpected{DecodeError{ConversionError::kMissingField, absl::StrCat("root missing at ", slot_detail())}};
    }
    if (proto_block.slot() != 0 && proto_block.parent_slot() >= proto_block.slot()) {
        return tl::unexpected{DecodeError{ConversionError::kMalformedPayload,
                                          absl::StrCat("parent slot ", proto_block.parent_slot(), " not before ", slot_detail())}};
    }

    Block block{
        .fork = fork_from_spec(proto_block.spec()),
        .slot = proto_block.slot(),
        .parent_slot = proto_block.parent_slot(),
        .root = rpc::hex_from_bytes(proto_block.root()),
        .parent_root = rpc::hex_from_bytes(proto_block.parent_root()),
        .state_root = rpc::hex_from_bytes(proto_block.state_root()),
        .proposer_index = proto_block.proposer_index(),
        .timestamp = proto_block.has_timestamp() ? rpc::time_point_from_timestamp(proto_block.timestamp()) : std::chrono::system_clock::time_point{},
    };

    if (msg.metadata && msg.metadata->num != block.slot) {
        return tl::unexpected{DecodeError{ConversionError::kInconsistentMetadata,
                                          absl::StrCat("metadata num ", msg.metadata->num, " at ", slot_detail())}};
    }
    return block;
}

std::ostream& operator<<(std::ostream& out, const Block& block) {
    out << "slot=" << block.slot << " root=" << block.root << " fork=" << to_string(block.fork)
        << " proposer=" << block.proposer_index;
    return out;
}

}  // namespace firehose::beacon
