// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <type_traits>

#include <firehose/core/base.hpp>

namespace firehose {

//! \brief Work with block numbers or slots in a unified way.
//! \details Execution layer blocks expose their block number, consensus layer blocks expose their slot: generic
//! stream processing (gap detection, fork tracking, progress reporting) only needs this single ordering value.
//! Implementers must be plain copyable values not bound to the lifetime of the call that produced them, so that
//! they can be handed over to other coroutines or threads.
//! \code
//! struct ExecutionBlock {
//!     BlockNum block_number{0};
//!     BlockNum number_or_slot() const { return block_number; }
//! };
//! \endcode
template <typename T>
concept HasNumberOrSlot =
    std::is_object_v<T> && std::copyable<T> && std::is_nothrow_destructible_v<T> &&
    requires(const T& block) {
        { block.number_or_slot() } -> std::same_as<BlockNum>;
    };

//! Block number or slot of any block type satisfying HasNumberOrSlot
template <HasNumberOrSlot T>
BlockNum number_or_slot(const T& block) {
    return block.number_or_slot();
}

}  // namespace firehose
