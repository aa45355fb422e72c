// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "transport_error.hpp"

namespace firehose::client {

std::ostream& operator<<(std::ostream& out, const TransportError& error) {
    if (!error) {
        out << "success";
        return out;
    }
    out << error.code.message();
    if (!error.message.empty()) {
        out << ": " << error.message;
    }
    return out;
}

}  // namespace firehose::client
