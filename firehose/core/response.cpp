// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "response.hpp"

#include <utility>

namespace firehose {

std::string_view to_string(ForkStep step) {
    switch (step) {
        case ForkStep::kNew:
            return "new";
        case ForkStep::kUndo:
            return "undo";
        case ForkStep::kFinal:
            return "final";
        default:
            return "unset";
    }
}

std::ostream& operator<<(std::ostream& out, ForkStep step) {
    out << to_string(step);
    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockMetadata& metadata) {
    out << "num=" << metadata.num << " id=" << metadata.id
        << " parent_num=" << metadata.parent_num << " parent_id=" << metadata.parent_id
        << " lib_num=" << metadata.lib_num
        << " time=" << std::chrono::duration_cast<std::chrono::seconds>(metadata.time.time_since_epoch()).count();
    return out;
}

std::ostream& operator<<(std::ostream& out, const Response& response) {
    out << "step=" << response.step << " cursor=" << response.cursor;
    if (response.block) {
        out << " " << *response.block;
    }
    if (response.metadata) {
        out << " " << *response.metadata;
    }
    return out;
}

Response to_response(SingleBlockResponse response) {
    return Response{
        .step = ForkStep::kUnset,
        .block = std::move(response.block),
        .cursor = {},
        .metadata = std::move(response.metadata),
    };
}

}  // namespace firehose
