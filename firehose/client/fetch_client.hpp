// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

#include <firehose/infra/concurrency/task.hpp>

#include <firehose/core/request.hpp>
#include <firehose/core/response.hpp>

#include <firehose/client/transport_error.hpp>

namespace firehose::client {

using FetchResult = tl::expected<SingleBlockResponse, TransportError>;

//! Transport-agnostic access to the Firehose Fetch API
class FetchClient {
  public:
    virtual ~FetchClient() = default;

    //! Fetch one block, a transport failure (including a block not found) is returned as error
    virtual Task<FetchResult> block(const SingleBlockRequest& request) = 0;
};

}  // namespace firehose::client
