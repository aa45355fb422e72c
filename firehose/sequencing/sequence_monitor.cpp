// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "sequence_monitor.hpp"

namespace firehose::sequencing {

std::string_view to_string(SequenceEvent event) {
    switch (event) {
        case SequenceEvent::kFirst:
            return "first";
        case SequenceEvent::kInOrder:
            return "in-order";
        case SequenceEvent::kGap:
            return "gap";
        case SequenceEvent::kRedelivery:
            return "redelivery";
        case SequenceEvent::kRewind:
            return "rewind";
        case SequenceEvent::kIrreversible:
            return "irreversible";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, SequenceEvent event) {
    out << to_string(event);
    return out;
}

}  // namespace firehose::sequencing
