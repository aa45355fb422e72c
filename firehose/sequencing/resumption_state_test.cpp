// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "resumption_state.hpp"

#include <catch2/catch.hpp>

namespace firehose::sequencing {

TEST_CASE("ResumptionState", "[firehose][sequencing][resumption]") {
    const StreamRequest initial{.start_block_num = 100, .stop_block_num = 200, .final_blocks_only = true};

    SECTION("first request is the initial one") {
        ResumptionState state{initial};
        CHECK(state.next_request() == initial);
        CHECK_FALSE(state.has_cursor());
        CHECK(state.commits() == 0);
    }

    SECTION("committed cursor replaces the request cursor keeping the start block") {
        ResumptionState state{initial};
        state.commit("c1");
        state.commit("c2");
        const auto request = state.next_request();
        CHECK(request.cursor == "c2");
        CHECK(request.start_block_num == 100);
        CHECK(request.stop_block_num == 200);
        CHECK(request.final_blocks_only);
        CHECK(state.commits() == 2);
        CHECK(state.initial_request() == initial);
    }

    SECTION("empty cursor is ignored") {
        ResumptionState state{initial};
        state.commit("c1");
        state.commit("");
        CHECK(state.cursor() == "c1");
        CHECK(state.commits() == 1);
    }

    SECTION("persisted cursor wins over the initial cursor") {
        StreamRequest with_cursor = initial;
        with_cursor.cursor = "initial";
        CHECK(ResumptionState{with_cursor}.cursor() == "initial");
        CHECK(ResumptionState{with_cursor, std::nullopt}.cursor() == "initial");
        CHECK(ResumptionState{with_cursor, ""}.cursor() == "initial");
        CHECK(ResumptionState{with_cursor, "persisted"}.cursor() == "persisted");
    }
}

}  // namespace firehose::sequencing
