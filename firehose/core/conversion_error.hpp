// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string_view>

#include <tl/expected.hpp>

namespace firehose {

// Error codes for the conversion of responses into domain block types
enum class [[nodiscard]] ConversionError {
    kMissingPayload,        // Response carries no block at all
    kUnexpectedTypeUrl,     // Block payload is not the message type expected by the domain type
    kMalformedPayload,      // Block payload bytes cannot be decoded
    kMissingField,          // A field required by the domain type is absent
    kUnsupportedVersion,    // Block model encoding version not supported
    kInconsistentMetadata,  // Denormalized metadata does not match the decoded block
};

std::string_view to_string(ConversionError error);

std::ostream& operator<<(std::ostream& out, ConversionError error);

// TODO(C++23) Switch to std::expected
template <typename T>
using ConversionResult = tl::expected<T, ConversionError>;

}  // namespace firehose
