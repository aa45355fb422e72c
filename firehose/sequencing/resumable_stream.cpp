// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "resumable_stream.hpp"

namespace firehose::sequencing {

std::string_view to_string(ConversionErrorPolicy policy) {
    switch (policy) {
        case ConversionErrorPolicy::kSkip:
            return "skip";
        case ConversionErrorPolicy::kRetry:
            return "retry";
        case ConversionErrorPolicy::kTerminate:
            return "terminate";
    }
    return "unknown";
}

std::string_view to_string(StreamResult::Outcome outcome) {
    switch (outcome) {
        case StreamResult::Outcome::kCompleted:
            return "completed";
        case StreamResult::Outcome::kStoppedByConsumer:
            return "stopped by consumer";
        case StreamResult::Outcome::kConversionFailed:
            return "conversion failed";
        case StreamResult::Outcome::kRetriesExhausted:
            return "retries exhausted";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, StreamResult::Outcome outcome) {
    out << to_string(outcome);
    return out;
}

std::ostream& operator<<(std::ostream& out, const StreamResult& result) {
    out << "outcome: " << result.outcome << " responses: " << result.responses
        << " reconnections: " << result.reconnections << " cursor: " << result.cursor;
    if (result.last_error) {
        out << " last_error: " << result.last_error;
    }
    if (!result.last_conversion_error.empty()) {
        out << " last_conversion_error: " << result.last_conversion_error;
    }
    return out;
}

void validate(const ResumableStreamSettings& settings) {
    ensure(settings.initial_backoff.count() > 0, "ResumableStream: initial back-off must be positive");
    ensure(settings.max_backoff >= settings.initial_backoff, "ResumableStream: max back-off must not be lower than initial back-off");
}

}  // namespace firehose::sequencing
