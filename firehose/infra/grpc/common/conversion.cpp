// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "conversion.hpp"

#include <absl/strings/escaping.h>

namespace firehose::rpc {

using namespace std::chrono;

system_clock::time_point time_point_from_timestamp(const google::protobuf::Timestamp& timestamp) {
    const auto since_epoch = seconds{timestamp.seconds()} + nanoseconds{timestamp.nanos()};
    return system_clock::time_point{duration_cast<system_clock::duration>(since_epoch)};
}

google::protobuf::Timestamp timestamp_from_time_point(system_clock::time_point time_point) {
    const auto since_epoch = duration_cast<nanoseconds>(time_point.time_since_epoch());
    const auto secs = floor<seconds>(since_epoch);
    google::protobuf::Timestamp timestamp;
    timestamp.set_seconds(secs.count());
    timestamp.set_nanos(static_cast<int32_t>((since_epoch - secs).count()));
    return timestamp;
}

std::string hex_from_bytes(std::string_view bytes) {
    return absl::BytesToHexString(absl::string_view{bytes.data(), bytes.size()});
}

}  // namespace firehose::rpc
