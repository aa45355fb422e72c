// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include <firehose/infra/concurrency/task.hpp>

#include <firehose/core/request.hpp>
#include <firehose/core/response.hpp>

#include <firehose/client/transport_error.hpp>

namespace firehose::client {

//! What the consumer wants the stream to do after processing one response
enum class StreamControl {
    kContinue,
    kStop,
};

//! Asynchronous consumer of the responses delivered by a block stream, called in server order, one at a time
using ResponseConsumer = std::function<Task<StreamControl>(Response)>;

//! Transport-agnostic access to the Firehose Stream API
class StreamClient {
  public:
    virtual ~StreamClient() = default;

    //! \brief Open a block stream and feed each received response to the consumer until the stream ends.
    //! \details The next response is requested only after the consumer has completed: no responses are buffered.
    //! Cancelling the returned task terminates the stream.
    //! \return an empty error if the stream ended normally (stop block reached or consumer stopped it), the
    //! transport failure otherwise so that the caller can resume from the last processed cursor
    virtual Task<TransportError> blocks(const StreamRequest& request, ResponseConsumer consumer) = 0;
};

}  // namespace firehose::client
