// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "from_response.hpp"

#include <string>
#include <utility>

#include <catch2/catch.hpp>

#include <firehose/core/block_identity.hpp>
#include <firehose/core/conversion_error.hpp>

namespace firehose {

namespace {

    //! Echo the cursor back, the smallest possible domain type
    struct CursorEcho {
        using Error = ConversionError;
        std::string cursor;
        static tl::expected<CursorEcho, Error> from_response(Response msg) {
            if (msg.cursor.empty()) {
                return tl::make_unexpected(ConversionError::kMissingField);
            }
            return CursorEcho{std::move(msg.cursor)};
        }
    };

    struct NotStreamableError {};

    struct WithNotStreamableError {
        using Error = NotStreamableError;
        static tl::expected<WithNotStreamableError, Error> from_response(Response) { return {}; }
    };

    struct WithWrongResult {
        using Error = ConversionError;
        static WithWrongResult from_response(Response) { return {}; }
    };

    struct Slot {
        uint64_t slot{0};
        BlockNum number_or_slot() const { return slot; }
    };

    struct SignedNumber {
        int64_t number_or_slot() const { return 0; }
    };

}  // namespace

static_assert(FromResponse<CursorEcho>);
static_assert(!FromResponse<WithNotStreamableError>);
static_assert(!FromResponse<WithWrongResult>);
static_assert(!FromResponse<Response>);

static_assert(HasNumberOrSlot<Slot>);
static_assert(!HasNumberOrSlot<SignedNumber>);
static_assert(!HasNumberOrSlot<Slot&>);
static_assert(!HasNumberOrSlot<CursorEcho>);

TEST_CASE("FromResponse user defined type", "[firehose][core][from_response]") {
    SECTION("success") {
        const FromResponseResult<CursorEcho> result = CursorEcho::from_response(Response{.cursor = "c1"});
        REQUIRE(result);
        CHECK(result->cursor == "c1");
    }
    SECTION("error value, no exception") {
        FromResponseResult<CursorEcho> result;
        CHECK_NOTHROW(result = CursorEcho::from_response(Response{}));
        REQUIRE_FALSE(result);
        CHECK(describe(result.error()) == "missing required field");
    }
}

TEST_CASE("number_or_slot", "[firehose][core][block_identity]") {
    CHECK(number_or_slot(Slot{42}) == 42);
    CHECK(number_or_slot(Slot{}) == 0);
}

}  // namespace firehose
