// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace firehose {

//! Opaque typed payload (i.e. the wire google.protobuf.Any): the chain specific block bytes or a request transform
struct Payload {
    //! Type URL identifying the encoded message, e.g. type.googleapis.com/sf.ethereum.type.v2.Block
    std::string type_url;
    //! Encoded message bytes, never interpreted by the stream machinery
    std::string value;

    friend bool operator==(const Payload&, const Payload&) = default;
};

//! Fully-qualified message name contained in a type URL, i.e. anything after the last '/'
std::string_view type_name(std::string_view type_url);

//! Build the canonical type URL for the given fully-qualified message name
std::string make_type_url(std::string_view message_name);

std::ostream& operator<<(std::ostream& out, const Payload& payload);

}  // namespace firehose
