// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <iostream>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <firehose/infra/common/log.hpp>

namespace firehose::cmd::common {

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait_me() {
    const int signal_number = co_await signals_.async_wait(boost::asio::use_awaitable);
    std::cout << "\n";
    FIREHOSE_INFO << "Signal caught, number: " << signal_number;
    co_return signal_number;
}

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait() {
    auto executor = co_await boost::asio::this_coro::executor;
    ShutdownSignal signal{executor};
    co_return (co_await signal.wait_me());
}

}  // namespace firehose::cmd::common
