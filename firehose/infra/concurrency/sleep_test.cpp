// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "sleep.hpp"

#include <chrono>

#include <catch2/catch.hpp>

#include <firehose/infra/test_util/task_runner.hpp>

namespace firehose {

using namespace std::chrono_literals;

TEST_CASE("sleep", "[firehose][infra][concurrency]") {
    test_util::TaskRunner runner;
    const auto start = std::chrono::steady_clock::now();
    runner.run(sleep(20ms));
    CHECK(std::chrono::steady_clock::now() - start >= 20ms);
}

}  // namespace firehose
