// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "resumption_state.hpp"

#include <utility>

namespace firehose::sequencing {

ResumptionState::ResumptionState(StreamRequest initial, std::optional<std::string> persisted_cursor)
    : initial_(std::move(initial)), cursor_(initial_.cursor) {
    if (persisted_cursor && !persisted_cursor->empty()) {
        cursor_ = std::move(*persisted_cursor);
    }
}

StreamRequest ResumptionState::next_request() const {
    StreamRequest request = initial_;
    request.cursor = cursor_;
    return request;
}

void ResumptionState::commit(std::string cursor) {
    if (cursor.empty()) return;
    cursor_ = std::move(cursor);
    ++commits_;
}

}  // namespace firehose::sequencing
