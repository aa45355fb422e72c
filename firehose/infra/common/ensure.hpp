// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace firehose {

template <typename F>
concept MessageBuilder = std::invocable<F> && std::convertible_to<std::invoke_result_t<F>, std::string>;

//! Throw std::logic_error with the given message unless condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Same as ensure but the message is built only on failure
//! Usage: `ensure(slot > parent_slot, [&]() { return "bad slot " + std::to_string(slot); });`
template <MessageBuilder F>
void ensure(bool condition, F&& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{build_message()}};
    }
}

//! Check an internal invariant, the message is prefixed to tell it apart from argument errors
inline void ensure_invariant(bool condition, std::string_view message) {
    ensure(condition, [message]() { return "Invariant violation: " + std::string{message}; });
}

template <MessageBuilder F>
void ensure_invariant(bool condition, F&& build_message) {
    ensure(condition, [&]() { return "Invariant violation: " + std::string{build_message()}; });
}

}  // namespace firehose
