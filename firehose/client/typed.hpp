// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <tl/expected.hpp>

#include <firehose/core/from_response.hpp>
#include <firehose/core/overloaded.hpp>

#include <firehose/client/fetch_client.hpp>
#include <firehose/client/stream_client.hpp>

namespace firehose::client {

//! Stream response whose block payload has been converted into the domain type T
template <FromResponse T>
struct TypedResponse {
    ForkStep step{ForkStep::kUnset};
    std::string cursor;
    std::optional<BlockMetadata> metadata;
    FromResponseResult<T> block;
};

template <FromResponse T>
using TypedResponseConsumer = std::function<Task<StreamControl>(TypedResponse<T>)>;

//! Convert one stream response, keeping the step, cursor and metadata beside the conversion result
template <FromResponse T>
TypedResponse<T> to_typed_response(Response response) {
    // Initializers are evaluated in order: step, cursor and metadata are copied before the response is consumed
    return TypedResponse<T>{
        .step = response.step,
        .cursor = response.cursor,
        .metadata = response.metadata,
        .block = T::from_response(std::move(response)),
    };
}

//! \brief Stream blocks converting each response into T before handing it to the consumer.
//! \details Conversion errors do not interrupt the stream: the consumer decides what to do with them.
template <FromResponse T>
Task<TransportError> stream_blocks(StreamClient& client, const StreamRequest& request, TypedResponseConsumer<T> consumer) {
    return client.blocks(request, [consumer = std::move(consumer)](Response response) -> Task<StreamControl> {
        co_return co_await consumer(to_typed_response<T>(std::move(response)));
    });
}

//! Failure of a typed fetch: either the transport failed or the returned block could not be converted
template <FromResponse T>
struct FetchError {
    std::variant<TransportError, typename T::Error> cause;

    bool is_transport() const { return std::holds_alternative<TransportError>(cause); }
    bool is_conversion() const { return !is_transport(); }
};

template <FromResponse T>
std::ostream& operator<<(std::ostream& out, const FetchError<T>& error) {
    std::visit(Overloaded{
                   [&](const TransportError& e) { out << "transport error: " << e; },
                   [&](const typename T::Error& e) { out << "conversion error: " << e; },
               },
               error.cause);
    return out;
}

template <FromResponse T>
using FetchBlockResult = tl::expected<T, FetchError<T>>;

//! Fetch one block and convert it into T
template <FromResponse T>
Task<FetchBlockResult<T>> fetch_block(FetchClient& client, const SingleBlockRequest& request) {
    auto result = co_await client.block(request);
    if (!result) {
        co_return tl::make_unexpected(FetchError<T>{result.error()});
    }
    auto block = T::from_response(to_response(std::move(*result)));
    if (!block) {
        co_return tl::make_unexpected(FetchError<T>{std::move(block.error())});
    }
    co_return std::move(*block);
}

}  // namespace firehose::client
