// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <firehose/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace firehose::test_util {

//! Run Task-s to completion on a private io_context in tests
class TaskRunner {
  public:
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
        ioc_.restart();
        using namespace std::chrono_literals;
        while (future.wait_for(0s) != std::future_status::ready) {
            // Timers (e.g. back-off sleeps) require waiting rather than polling
            ioc_.run_one_for(10ms);
        }
        return future.get();
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace firehose::test_util
