// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include <firehose/core/base.hpp>
#include <firehose/core/block_identity.hpp>
#include <firehose/core/response.hpp>
#include <firehose/infra/common/ensure.hpp>

namespace firehose::sequencing {

//! Identity of a block on a possibly forked chain
struct BlockId {
    BlockNum number{0};
    std::string hash;

    friend bool operator==(const BlockId&, const BlockId&) = default;
};

std::ostream& operator<<(std::ostream& out, const BlockId& id);

//! Effect of a fork step on the canonical chain
enum class ChainUpdate {
    kAppended,
    kRetracted,
    kFinalized,
    kDuplicate,  // step already applied, e.g. redelivered at the cursor boundary after a reconnection
};

//! Fork step inconsistent with the chain tracked so far
enum class [[nodiscard]] ChainError {
    kOutOfOrder,          // new block at or below the tip which is not a redelivery
    kUndoNotAtTip,        // undo of a known block which is not the tip
    kUndoFinalized,       // undo of a block already marked final
    kUnknownBlock,        // undo or final of a block never seen
    kConflictsWithFinal,  // new or final block at the last final height with another hash
};

std::string_view to_string(ChainUpdate update);
std::string_view to_string(ChainError error);
std::ostream& operator<<(std::ostream& out, ChainUpdate update);
std::ostream& operator<<(std::ostream& out, ChainError error);

using ChainResult = tl::expected<ChainUpdate, ChainError>;

//! \brief Consumer-side view of the canonical chain built from the fork steps of a block stream.
//! \details New appends at the tip, Undo retracts the tip, Final marks a block irreversible and prunes everything
//! before it: only the blocks which may still be reorganized plus the latest final block are retained.
//! Blocks are kept in ascending number order, numbers may be sparse (e.g. skipped slots).
template <HasNumberOrSlot T>
class CanonicalChain {
  public:
    struct Entry {
        BlockId id;
        T block;
        bool final{false};
    };

    ChainResult apply(ForkStep step, std::string hash, T block) {
        BlockId id{number_or_slot(block), std::move(hash)};
        switch (step) {
            case ForkStep::kUndo:
                return undo(id);
            case ForkStep::kFinal:
                return finalize(std::move(id), std::move(block));
            default:
                return append(std::move(id), std::move(block));
        }
    }

    //! Mark as final every block up to the given last irreversible block number
    void on_irreversible(BlockNum lib_num) {
        auto it = std::find_if(entries_.rbegin(), entries_.rend(), [&](const Entry& e) { return e.id.number <= lib_num; });
        if (it == entries_.rend()) return;
        it->final = true;
        prune_before(std::prev(it.base()));
    }

    std::vector<BlockId> ids() const {
        std::vector<BlockId> ids;
        ids.reserve(entries_.size());
        for (const auto& entry : entries_) {
            ids.push_back(entry.id);
        }
        return ids;
    }

    std::vector<T> blocks() const {
        std::vector<T> blocks;
        blocks.reserve(entries_.size());
        for (const auto& entry : entries_) {
            blocks.push_back(entry.block);
        }
        return blocks;
    }

    const T* find(const BlockId& id) const {
        const auto it = locate(id);
        return it != entries_.end() ? &it->block : nullptr;
    }

    bool contains(const BlockId& id) const { return locate(id) != entries_.end(); }

    std::optional<BlockId> tip() const {
        if (entries_.empty()) return std::nullopt;
        return entries_.back().id;
    }

    std::optional<BlockId> last_final() const { return last_final_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

  private:
    using Iterator = typename std::deque<Entry>::iterator;
    using ConstIterator = typename std::deque<Entry>::const_iterator;

    ChainResult append(BlockId id, T block) {
        if (conflicts_with_final(id)) {
            return tl::make_unexpected(ChainError::kConflictsWithFinal);
        }
        if (contains(id) || is_finalized_height(id.number)) {
            return ChainUpdate::kDuplicate;
        }
        if (!entries_.empty() && id.number <= entries_.back().id.number) {
            return tl::make_unexpected(ChainError::kOutOfOrder);
        }
        entries_.push_back(Entry{std::move(id), std::move(block), false});
        last_retracted_.reset();
        return ChainUpdate::kAppended;
    }

    ChainResult undo(const BlockId& id) {
        if (!entries_.empty() && entries_.back().id == id) {
            if (entries_.back().final) {
                return tl::make_unexpected(ChainError::kUndoFinalized);
            }
            last_retracted_ = id;
            entries_.pop_back();
            return ChainUpdate::kRetracted;
        }
        if (contains(id)) {
            return tl::make_unexpected(ChainError::kUndoNotAtTip);
        }
        if (last_retracted_ == id) {
            return ChainUpdate::kDuplicate;
        }
        return tl::make_unexpected(ChainError::kUnknownBlock);
    }

    ChainResult finalize(BlockId id, T block) {
        if (const auto it = locate(id); it != entries_.end()) {
            if (it->final) {
                return ChainUpdate::kDuplicate;
            }
            it->final = true;
            prune_before(it);
            return ChainUpdate::kFinalized;
        }
        if (conflicts_with_final(id)) {
            return tl::make_unexpected(ChainError::kConflictsWithFinal);
        }
        if (is_finalized_height(id.number)) {
            return ChainUpdate::kDuplicate;
        }
        if (!entries_.empty() && id.number <= entries_.back().id.number) {
            return tl::make_unexpected(ChainError::kUnknownBlock);
        }
        // Final step for a block above the tip: the stream delivers final blocks only
        entries_.push_back(Entry{std::move(id), std::move(block), true});
        prune_before(std::prev(entries_.end()));
        return ChainUpdate::kFinalized;
    }

    //! Drop every entry before the given final one, which becomes the last final block
    void prune_before(Iterator final_it) {
        ensure_invariant(final_it->final, "pruning point must be final");
        last_final_ = final_it->id;
        entries_.erase(entries_.begin(), final_it);
    }

    bool is_finalized_height(BlockNum number) const {
        return last_final_ && number <= last_final_->number;
    }

    //! Heights below the last final block are pruned, their hashes are no longer known
    bool conflicts_with_final(const BlockId& id) const {
        return last_final_ && id.number == last_final_->number && id.hash != last_final_->hash;
    }

    ConstIterator locate(const BlockId& id) const {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.id == id; });
    }
    Iterator locate(const BlockId& id) {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.id == id; });
    }

    std::deque<Entry> entries_;
    std::optional<BlockId> last_final_;
    std::optional<BlockId> last_retracted_;
};

}  // namespace firehose::sequencing
