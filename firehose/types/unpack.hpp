// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <google/protobuf/message.h>

#include <firehose/core/conversion_error.hpp>
#include <firehose/core/payload.hpp>

namespace firehose {

//! Decode the block payload as the given generated protobuf message, checking its type URL first
template <typename Message>
ConversionResult<Message> unpack_payload(const std::optional<Payload>& payload) {
    if (!payload) {
        return tl::unexpected{ConversionError::kMissingPayload};
    }
    const std::string_view expected_name{Message::descriptor()->full_name()};
    if (type_name(payload->type_url) != expected_name) {
        return tl::unexpected{ConversionError::kUnexpectedTypeUrl};
    }
    Message message;
    if (!message.ParseFromString(payload->value)) {
        return tl::unexpected{ConversionError::kMalformedPayload};
    }
    return message;
}

//! Encode the given protobuf message as block payload
template <typename Message>
Payload pack_payload(const Message& message) {
    return Payload{
        .type_url = make_type_url(Message::descriptor()->full_name()),
        .value = message.SerializeAsString(),
    };
}

}  // namespace firehose
