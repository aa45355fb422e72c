// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>
#include <grpcpp/grpcpp.h>

namespace firehose::rpc::test_util {

template <typename Reply>
class MockAsyncResponseReader : public grpc::ClientAsyncResponseReaderInterface<Reply> {
  public:
    MOCK_METHOD(void, StartCall, (), (override));
    MOCK_METHOD(void, ReadInitialMetadata, (void*), (override));
    MOCK_METHOD(void, Finish, (Reply*, ::grpc::Status*, void*), (override));
};

template <typename Reply>
using StrictMockAsyncResponseReader = testing::StrictMock<MockAsyncResponseReader<Reply>>;

template <typename Reply>
class MockAsyncReader : public grpc::ClientAsyncReaderInterface<Reply> {
  public:
    MOCK_METHOD(void, StartCall, (void*), (override));
    MOCK_METHOD(void, ReadInitialMetadata, (void*), (override));
    MOCK_METHOD(void, Read, (Reply*, void*), (override));
    MOCK_METHOD(void, Finish, (::grpc::Status*, void*), (override));
};

template <typename Reply>
using StrictMockAsyncReader = testing::StrictMock<MockAsyncReader<Reply>>;

}  // namespace firehose::rpc::test_util
