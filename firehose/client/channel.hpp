// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include <firehose/client/settings.hpp>

namespace firehose::client {

//! Create the gRPC channel towards the configured endpoint
std::shared_ptr<grpc::Channel> make_channel(const Settings& settings);

//! Add the authentication metadata required by the settings to the client context
void add_auth_metadata(grpc::ClientContext& context, const Settings& settings);

}  // namespace firehose::client
