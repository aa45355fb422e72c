// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "canonical_chain.hpp"

namespace firehose::sequencing {

std::ostream& operator<<(std::ostream& out, const BlockId& id) {
    out << "#" << id.number << " " << (id.hash.empty() ? "<no hash>" : id.hash);
    return out;
}

std::string_view to_string(ChainUpdate update) {
    switch (update) {
        case ChainUpdate::kAppended:
            return "appended";
        case ChainUpdate::kRetracted:
            return "retracted";
        case ChainUpdate::kFinalized:
            return "finalized";
        case ChainUpdate::kDuplicate:
            return "duplicate";
    }
    return "unknown";
}

std::string_view to_string(ChainError error) {
    switch (error) {
        case ChainError::kOutOfOrder:
            return "new block out of order";
        case ChainError::kUndoNotAtTip:
            return "undo of a block which is not the tip";
        case ChainError::kUndoFinalized:
            return "undo of a final block";
        case ChainError::kUnknownBlock:
            return "unknown block";
        case ChainError::kConflictsWithFinal:
            return "block conflicting with the last final block";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& out, ChainUpdate update) {
    out << to_string(update);
    return out;
}

std::ostream& operator<<(std::ostream& out, ChainError error) {
    out << to_string(error);
    return out;
}

}  // namespace firehose::sequencing
