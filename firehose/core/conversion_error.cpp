// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "conversion_error.hpp"

namespace firehose {

std::string_view to_string(ConversionError error) {
    switch (error) {
        case ConversionError::kMissingPayload:
            return "missing block payload";
        case ConversionError::kUnexpectedTypeUrl:
            return "unexpected block payload type";
        case ConversionError::kMalformedPayload:
            return "malformed block payload";
        case ConversionError::kMissingField:
            return "missing required field";
        case ConversionError::kUnsupportedVersion:
            return "unsupported block model version";
        case ConversionError::kInconsistentMetadata:
            return "block metadata inconsistent with payload";
    }
    return "unknown conversion error";
}

std::ostream& operator<<(std::ostream& out, ConversionError error) {
    out << to_string(error);
    return out;
}

}  // namespace firehose
