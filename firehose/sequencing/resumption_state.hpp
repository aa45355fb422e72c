// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <firehose/core/request.hpp>

namespace firehose::sequencing {

//! \brief Track the position reached by a consumer so that an interrupted stream can be re-issued.
//! \details The start block of the initial request is never changed: on reconnection the server resumes from the
//! committed cursor, which takes precedence over the start block.
class ResumptionState {
  public:
    //! \param initial the request issued the very first time
    //! \param persisted_cursor cursor loaded from durable storage, if any, overriding the initial request cursor
    explicit ResumptionState(StreamRequest initial, std::optional<std::string> persisted_cursor = std::nullopt);

    //! The request to issue now: the initial one carrying the last committed cursor
    StreamRequest next_request() const;

    //! Record the cursor of a fully processed response, empty cursors are ignored
    void commit(std::string cursor);

    //! The last committed cursor, empty if none
    const std::string& cursor() const { return cursor_; }

    bool has_cursor() const { return !cursor_.empty(); }

    //! Number of commits since construction
    uint64_t commits() const { return commits_; }

    const StreamRequest& initial_request() const { return initial_; }

  private:
    StreamRequest initial_;
    std::string cursor_;
    uint64_t commits_{0};
};

}  // namespace firehose::sequencing
