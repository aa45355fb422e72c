// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <firehose/client/fetch_client.hpp>
#include <firehose/client/stream_client.hpp>

namespace firehose::client::test_util {

class MockStreamClient : public StreamClient {  // NOLINT
  public:
    MOCK_METHOD((Task<TransportError>), blocks, (const StreamRequest&, ResponseConsumer), (override));
};

class MockFetchClient : public FetchClient {  // NOLINT
  public:
    MOCK_METHOD((Task<FetchResult>), block, (const SingleBlockRequest&), (override));
};

}  // namespace firehose::client::test_util
