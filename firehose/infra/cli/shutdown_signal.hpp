// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <csignal>

#include <firehose/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace firehose::cmd::common {

//! Wait for SIGINT or SIGTERM
class ShutdownSignal {
  public:
    using SignalNumber = int;

    explicit ShutdownSignal(const boost::asio::any_io_executor& executor)
        : signals_(executor, SIGINT, SIGTERM) {}

    Task<SignalNumber> wait_me();

    //! Wait for a shutdown signal on the calling coroutine executor
    static Task<SignalNumber> wait();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace firehose::cmd::common
