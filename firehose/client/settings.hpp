// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace firehose::client {

inline constexpr const char* kApiKeyHeader{"x-api-key"};
inline constexpr const char* kAuthorizationHeader{"authorization"};

//! Default maximum size of a received message, blocks of busy chains easily exceed the gRPC 4MiB default
inline constexpr int kDefaultMaxReceiveMessageSize{1024 * 1024 * 1024};

//! Connection settings for Firehose gRPC endpoints
struct Settings {
    //! Endpoint address in the host:port form
    std::string endpoint{"localhost:10015"};
    //! Value sent as x-api-key metadata, empty means none
    std::string api_key;
    //! Value sent as authorization bearer token metadata, empty means none
    std::string bearer_token;
    //! Use insecure channel credentials instead of TLS
    bool plaintext{false};
    //! Ask the server to gzip the responses
    bool compression{false};
    int max_receive_message_size{kDefaultMaxReceiveMessageSize};
    //! Deadline applied to each fetch request, 0 means none
    std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
};

}  // namespace firehose::client
