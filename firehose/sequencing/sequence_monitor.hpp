// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <firehose/core/base.hpp>
#include <firehose/core/block_identity.hpp>
#include <firehose/core/response.hpp>
#include <firehose/infra/common/log.hpp>

namespace firehose::sequencing {

enum class SequenceEvent {
    kFirst,          // first block observed
    kInOrder,        // head + 1
    kGap,            // above head + 1, some numbers were never observed
    kRedelivery,     // same number as the head
    kRewind,         // below the head, either undo or new block on another branch
    kIrreversible,   // final step at or below the head
};

std::string_view to_string(SequenceEvent event);
std::ostream& operator<<(std::ostream& out, SequenceEvent event);

struct SequenceObservation {
    SequenceEvent event{SequenceEvent::kFirst};
    BlockNum number{0};
    //! Count of numbers skipped for kGap, 0 otherwise
    uint64_t missing{0};
};

//! \brief Detect gaps and redeliveries in a block stream and periodically log the progress.
//! \details Sparse numbering is legit on some chains (e.g. consensus layer missed slots) so gaps are just reported.
template <HasNumberOrSlot T>
class SequenceMonitor {
  public:
    explicit SequenceMonitor(std::string name, uint64_t progress_interval = 1000)
        : name_(std::move(name)), progress_interval_(progress_interval), start_time_(std::chrono::steady_clock::now()) {}

    SequenceObservation observe(ForkStep step, const T& block) {
        const BlockNum number = number_or_slot(block);
        SequenceObservation observation{.number = number};
        if (step == ForkStep::kUndo) {
            observation.event = SequenceEvent::kRewind;
            ++rewinds_;
            head_ = number > 0 ? std::optional<BlockNum>{number - 1} : std::nullopt;
            return observation;
        }
        if (step == ForkStep::kFinal && head_ && number <= *head_) {
            observation.event = SequenceEvent::kIrreversible;
            return observation;
        }
        if (!head_) {
            observation.event = first_seen_ ? SequenceEvent::kInOrder : SequenceEvent::kFirst;
        } else if (number == *head_ + 1) {
            observation.event = SequenceEvent::kInOrder;
        } else if (number > *head_ + 1) {
            observation.event = SequenceEvent::kGap;
            observation.missing = number - *head_ - 1;
            gaps_ += observation.missing;
            FIREHOSE_DEBUG << "SequenceMonitor " << name_ << " gap of " << observation.missing << " after " << *head_;
        } else if (number == *head_) {
            observation.event = SequenceEvent::kRedelivery;
            ++redeliveries_;
        } else {
            observation.event = SequenceEvent::kRewind;
            ++rewinds_;
        }
        first_seen_ = true;
        head_ = number;
        ++observed_;
        if (progress_interval_ > 0 && observed_ % progress_interval_ == 0) {
            log_progress();
        }
        return observation;
    }

    std::optional<BlockNum> head() const { return head_; }
    uint64_t observed() const { return observed_; }
    uint64_t gaps() const { return gaps_; }
    uint64_t redeliveries() const { return redeliveries_; }
    uint64_t rewinds() const { return rewinds_; }

  private:
    void log_progress() const {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_);
        const auto rate = elapsed.count() > 0 ? observed_ * 1000 / static_cast<uint64_t>(elapsed.count()) : observed_;
        FIREHOSE_INFO_M("Stream progress", {"name", name_,
                                            "head", std::to_string(head_.value_or(0)),
                                            "blocks", std::to_string(observed_),
                                            "gaps", std::to_string(gaps_),
                                            "redeliveries", std::to_string(redeliveries_),
                                            "blk/s", std::to_string(rate)});
    }

    std::string name_;
    uint64_t progress_interval_;
    std::chrono::steady_clock::time_point start_time_;
    std::optional<BlockNum> head_;
    bool first_seen_{false};
    uint64_t observed_{0};
    uint64_t gaps_{0};
    uint64_t redeliveries_{0};
    uint64_t rewinds_{0};
};

}  // namespace firehose::sequencing
