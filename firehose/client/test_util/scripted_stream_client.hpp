// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/support/status.h>

#include <firehose/client/stream_client.hpp>
#include <firehose/infra/grpc/common/error.hpp>

namespace firehose::client::test_util {

//! \brief In-process StreamClient replaying a fixed sequence of responses.
//! \details Resuming from the cursor of response i delivers again response i and then the following ones, as a
//! Firehose server is allowed to do at the cursor boundary. Transport failures can be injected after a given
//! number of delivered responses, each one firing once.
class ScriptedStreamClient : public StreamClient {
  public:
    explicit ScriptedStreamClient(std::vector<Response> script) : script_(std::move(script)) {}

    //! Fail the next session with UNAVAILABLE after delivering the given count of responses
    void fail_after(size_t delivered) { failures_.push_back(delivered); }

    Task<TransportError> blocks(const StreamRequest& request, ResponseConsumer consumer) override {
        requests_.push_back(request);
        std::optional<size_t> failure;
        if (!failures_.empty()) {
            failure = failures_.front();
            failures_.erase(failures_.begin());
        }
        size_t delivered{0};
        for (size_t i = resume_index(request.cursor); i < script_.size(); ++i) {
            if (failure && delivered == *failure) {
                co_return connection_reset();
            }
            ++delivered;
            ++total_delivered_;
            if (co_await consumer(script_[i]) == StreamControl::kStop) {
                co_return TransportError{};
            }
        }
        if (failure && delivered == *failure) {
            co_return connection_reset();
        }
        co_return TransportError{};
    }

    const std::vector<StreamRequest>& requests() const { return requests_; }
    size_t total_delivered() const { return total_delivered_; }

  private:
    static TransportError connection_reset() {
        return {.code = rpc::make_error_code(grpc::StatusCode::UNAVAILABLE), .message = "connection reset"};
    }

    size_t resume_index(const std::string& cursor) const {
        if (cursor.empty()) return 0;
        for (size_t i = 0; i < script_.size(); ++i) {
            if (script_[i].cursor == cursor) return i;
        }
        return script_.size();
    }

    std::vector<Response> script_;
    std::vector<size_t> failures_;
    std::vector<StreamRequest> requests_;
    size_t total_delivered_{0};
};

}  // namespace firehose::client::test_util
