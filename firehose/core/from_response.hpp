// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <ostream>
#include <sstream>
#include <string>

#include <tl/expected.hpp>

#include <firehose/core/response.hpp>

namespace firehose {

//! Error type which can be copied across coroutines and threads and displayed to humans
template <typename E>
concept DisplayableError =
    std::copyable<E> &&
    requires(std::ostream& out, const E& error) {
        { out << error } -> std::convertible_to<std::ostream&>;
    };

//! \brief Convert Firehose responses into domain-specific block types.
//! \details This is the only extension point needed to stream a new block representation: the domain type declares
//! its error type and a static conversion function. The conversion must be a pure function of the response (no hidden
//! state, no I/O) and must report any decoding problem as an error value, never by throwing or aborting.
//! \code
//! struct MyBlock {
//!     using Error = ConversionError;
//!     std::string cursor;
//!     static tl::expected<MyBlock, Error> from_response(Response msg) { return MyBlock{std::move(msg.cursor)}; }
//! };
//! \endcode
template <typename T>
concept FromResponse =
    DisplayableError<typename T::Error> &&
    requires(Response msg) {
        { T::from_response(std::move(msg)) } -> std::same_as<tl::expected<T, typename T::Error>>;
    };

//! Result of converting a response into the domain type T
template <FromResponse T>
using FromResponseResult = tl::expected<T, typename T::Error>;

//! Human-readable description of any conversion error
template <DisplayableError E>
std::string describe(const E& error) {
    std::stringstream out;
    out << error;
    return out.str();
}

}  // namespace firehose
