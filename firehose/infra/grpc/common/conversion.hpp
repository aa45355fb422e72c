// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <google/protobuf/timestamp.pb.h>

namespace firehose::rpc {

std::chrono::system_clock::time_point time_point_from_timestamp(const google::protobuf::Timestamp& timestamp);

google::protobuf::Timestamp timestamp_from_time_point(std::chrono::system_clock::time_point time_point);

//! Lowercase hex representation of raw bytes without any prefix, i.e. the Firehose block id format
std::string hex_from_bytes(std::string_view bytes);

}  // namespace firehose::rpc
