// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <firehose/infra/common/ensure.hpp>
#include <firehose/infra/common/log.hpp>
#include <firehose/infra/concurrency/sleep.hpp>
#include <firehose/infra/concurrency/task.hpp>

#include <firehose/client/stream_client.hpp>
#include <firehose/core/block_identity.hpp>
#include <firehose/core/from_response.hpp>
#include <firehose/sequencing/cursor_store.hpp>
#include <firehose/sequencing/resumption_state.hpp>

namespace firehose::sequencing {

//! What to do with a response whose block cannot be converted
enum class ConversionErrorPolicy {
    kSkip,       // log it, commit its cursor and go on
    kRetry,      // reconnect from the last committed cursor, the response will be delivered again
    kTerminate,  // stop streaming without committing its cursor
};

std::string_view to_string(ConversionErrorPolicy policy);

struct ResumableStreamSettings {
    //! Max consecutive transport failures before giving up, 0 means retry forever
    uint32_t max_retries{0};
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30'000};
    ConversionErrorPolicy on_conversion_error{ConversionErrorPolicy::kSkip};
    //! Max reconnections attempted for the same undecodable response with kRetry policy, 0 means retry forever
    uint32_t max_conversion_retries{3};
};

//! Summary of a resumable stream session
struct StreamResult {
    enum class Outcome {
        kCompleted,          // server closed the stream normally, e.g. stop block reached
        kStoppedByConsumer,  // handler asked to stop
        kConversionFailed,   // conversion error policy gave up
        kRetriesExhausted,   // too many consecutive transport failures
    };

    Outcome outcome{Outcome::kCompleted};
    //! Last committed cursor, to be used for resuming later
    std::string cursor;
    uint64_t responses{0};
    uint64_t reconnections{0};
    client::TransportError last_error;
    std::string last_conversion_error;
};

std::string_view to_string(StreamResult::Outcome outcome);
std::ostream& operator<<(std::ostream& out, StreamResult::Outcome outcome);
std::ostream& operator<<(std::ostream& out, const StreamResult& result);

//! Check settings consistency
//! \throws std::logic_error on invalid values
void validate(const ResumableStreamSettings& settings);

//! \brief Consume a block stream with at-least-once semantics across transport failures.
//! \details Each response is converted into T and handed to the handler, then its cursor is committed and saved into
//! the cursor store. Upon transport failure the stream is re-issued with the original start block and the last
//! committed cursor after an exponential back-off, so the handler may see the response at the cursor boundary again.
//! The handler receives every fork step: maintaining the canonical view (e.g. with CanonicalChain) is up to it.
template <typename T>
    requires FromResponse<T> && HasNumberOrSlot<T>
class ResumableStream {
  public:
    using Handler = std::function<Task<client::StreamControl>(ForkStep, const T&, const Response&)>;

    ResumableStream(client::StreamClient& client, CursorStore& store, StreamRequest request, ResumableStreamSettings settings = {})
        : client_(client), store_(store), state_(std::move(request), store_.load()), settings_(settings) {
        validate(settings_);
    }

    ResumableStream(const ResumableStream&) = delete;
    ResumableStream& operator=(const ResumableStream&) = delete;

    Task<StreamResult> run(Handler handler) {
        StreamResult result;
        uint32_t consecutive_failures{0};
        uint32_t conversion_failures{0};
        std::string failed_cursor;
        std::chrono::milliseconds backoff{settings_.initial_backoff};

        while (true) {
            std::optional<StreamResult::Outcome> outcome;
            bool conversion_retry{false};
            bool received{false};

            auto consumer = [&](Response response) -> Task<client::StreamControl> {
                received = true;
                ++result.responses;
                auto block = T::from_response(response);
                if (!block) {
                    result.last_conversion_error = describe(block.error());
                    FIREHOSE_WARN << "ResumableStream: cannot convert response step=" << response.step
                                  << " cursor=" << response.cursor << " error: " << result.last_conversion_error
                                  << " policy=" << to_string(settings_.on_conversion_error);
                    switch (settings_.on_conversion_error) {
                        case ConversionErrorPolicy::kSkip:
                            commit(response.cursor);
                            co_return client::StreamControl::kContinue;
                        case ConversionErrorPolicy::kRetry:
                            if (response.cursor == failed_cursor) {
                                ++conversion_failures;
                            } else {
                                failed_cursor = response.cursor;
                                conversion_failures = 1;
                            }
                            if (settings_.max_conversion_retries > 0 && conversion_failures > settings_.max_conversion_retries) {
                                outcome = StreamResult::Outcome::kConversionFailed;
                            } else {
                                conversion_retry = true;
                            }
                            co_return client::StreamControl::kStop;
                        case ConversionErrorPolicy::kTerminate:
                            outcome = StreamResult::Outcome::kConversionFailed;
                            co_return client::StreamControl::kStop;
                    }
                }
                const auto control = co_await handler(response.step, *block, response);
                commit(response.cursor);
                if (control == client::StreamControl::kStop) {
                    outcome = StreamResult::Outcome::kStoppedByConsumer;
                }
                co_return control;
            };

            const auto request = state_.next_request();
            FIREHOSE_DEBUG << "ResumableStream: issuing " << request;
            auto error = co_await client_.blocks(request, consumer);

            if (outcome) {
                result.outcome = *outcome;
                break;
            }
            if (received) {
                consecutive_failures = 0;
                backoff = settings_.initial_backoff;
            }
            if (conversion_retry) {
                FIREHOSE_INFO << "ResumableStream: reconnecting after conversion error from cursor " << state_.cursor();
            } else if (!error) {
                result.outcome = StreamResult::Outcome::kCompleted;
                break;
            } else {
                result.last_error = std::move(error);
                ++consecutive_failures;
                if (settings_.max_retries > 0 && consecutive_failures > settings_.max_retries) {
                    FIREHOSE_ERROR << "ResumableStream: giving up after " << settings_.max_retries << " retries, last error: "
                                   << result.last_error;
                    result.outcome = StreamResult::Outcome::kRetriesExhausted;
                    break;
                }
                FIREHOSE_WARN << "ResumableStream: stream interrupted: " << result.last_error << ", reconnecting in "
                              << backoff.count() << "ms";
            }
            co_await sleep(backoff);
            backoff = std::min(backoff * 2, settings_.max_backoff);
            ++result.reconnections;
        }

        result.cursor = state_.cursor();
        FIREHOSE_DEBUG << "ResumableStream: " << result;
        co_return result;
    }

    const ResumptionState& state() const { return state_; }

  private:
    void commit(const std::string& cursor) {
        if (cursor.empty()) return;
        state_.commit(cursor);
        store_.save(cursor);
    }

    client::StreamClient& client_;
    CursorStore& store_;
    ResumptionState state_;
    ResumableStreamSettings settings_;
};

}  // namespace firehose::sequencing
