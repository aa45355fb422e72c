// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "conversion.hpp"

#include <catch2/catch.hpp>

namespace firehose::rpc {

using namespace std::chrono_literals;

TEST_CASE("time_point_from_timestamp", "[firehose][infra][grpc][conversion]") {
    google::protobuf::Timestamp timestamp;
    CHECK(time_point_from_timestamp(timestamp) == std::chrono::system_clock::time_point{});
    timestamp.set_seconds(1'700'000'000);
    timestamp.set_nanos(250'000'000);
    CHECK(time_point_from_timestamp(timestamp) == std::chrono::system_clock::time_point{1'700'000'000s + 250ms});
}

TEST_CASE("timestamp_from_time_point", "[firehose][infra][grpc][conversion]") {
    const auto timestamp = timestamp_from_time_point(std::chrono::system_clock::time_point{12s + 5ms});
    CHECK(timestamp.seconds() == 12);
    CHECK(timestamp.nanos() == 5'000'000);
    CHECK(time_point_from_timestamp(timestamp) == std::chrono::system_clock::time_point{12s + 5ms});
}

TEST_CASE("hex_from_bytes", "[firehose][infra][grpc][conversion]") {
    CHECK(hex_from_bytes("").empty());
    CHECK(hex_from_bytes(std::string{"\x00\xAB\xff", 3}) == "00abff");
}

}  // namespace firehose::rpc
