// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <thread>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <firehose/client/client_context.hpp>
#include <firehose/infra/concurrency/task.hpp>

namespace firehose::client::test_util {

//! Test fixture running a ClientContext execution loop on a dedicated thread
class ContextTestBase {
  public:
    ContextTestBase() : context_thread_{[&]() { context_.execute_loop(); }} {}

    ContextTestBase(const ContextTestBase&) = delete;
    ContextTestBase& operator=(const ContextTestBase&) = delete;

    ~ContextTestBase() {
        context_.stop();
        if (context_thread_.joinable()) {
            context_thread_.join();
        }
    }

    //! Run the task on the context and block until it completes, rethrowing its exception if any
    template <typename T>
    T spawn_and_wait(Task<T> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future).get();
    }

  protected:
    ClientContext context_;
    boost::asio::io_context& ioc_{context_.ioc()};
    agrpc::GrpcContext& grpc_context_{context_.grpc_context()};
    std::thread context_thread_;
};

}  // namespace firehose::client::test_util
