// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch.hpp>

namespace firehose {

TEST_CASE("ensure", "[firehose][infra][ensure]") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_AS(ensure(false, "error"), std::logic_error);
    CHECK_THROWS_WITH(ensure(false, "condition violation"), "condition violation");
    CHECK_THROWS_WITH(ensure(false, []() { return "slot " + std::to_string(42); }), "slot 42");
}

TEST_CASE("ensure_invariant", "[firehose][infra][ensure]") {
    CHECK_NOTHROW(ensure_invariant(true, "ignored"));
    CHECK_THROWS_WITH(ensure_invariant(false, "x"), "Invariant violation: x");
    CHECK_THROWS_WITH(ensure_invariant(false, []() { return "x " + std::to_string(42); }), "Invariant violation: x 42");
}

}  // namespace firehose
