// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <system_error>

namespace firehose::client {

//! \brief Outcome of a transport operation: an empty code means success.
//! \details The code identifies the failure class (e.g. a gRPC status code), the message is the detail sent by the
//! remote peer. Both are plain values so that a retained error never changes after the fact.
struct TransportError {
    std::error_code code;
    std::string message;

    explicit operator bool() const { return static_cast<bool>(code); }

    friend bool operator==(const TransportError&, const TransportError&) = default;
};

std::ostream& operator<<(std::ostream& out, const TransportError& error);

}  // namespace firehose::client
