// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_reference.hpp"

#include <sstream>

#include <firehose/core/overloaded.hpp>

namespace firehose {

std::ostream& operator<<(std::ostream& out, const BlockReference& reference) {
    std::visit(Overloaded{
                   [&](const BlockNumber& r) { out << "number=" << r.num; },
                   [&](const BlockHashAndNumber& r) { out << "hash=" << r.hash << " number=" << r.num; },
                   [&](const Cursor& r) { out << "cursor=" << r.cursor; },
               },
               reference);
    return out;
}

std::string to_string(const BlockReference& reference) {
    std::stringstream out;
    out << reference;
    return out.str();
}

}  // namespace firehose
