// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>

#include <firehose/infra/test_util/log.hpp>

namespace firehose::cmd::common {

using namespace std::chrono_literals;

TEST_CASE("ShutdownSignal::wait_me", "[firehose][infra][cli][shutdown_signal]") {
    const int raised = GENERATE(SIGINT, SIGTERM);
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::stringstream out;
    test_util::StreamSwap cout_swap{std::cout, out};

    boost::asio::io_context ioc;
    // Handlers are installed on construction, before the signal is raised
    ShutdownSignal signal{ioc.get_executor()};
    auto signal_number = boost::asio::co_spawn(ioc, signal.wait_me(), boost::asio::use_future);

    REQUIRE(std::raise(raised) == 0);
    while (signal_number.wait_for(0s) != std::future_status::ready) {
        ioc.run_one_for(10ms);
    }
    CHECK(signal_number.get() == raised);
}

}  // namespace firehose::cmd::common
