// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <firehose/infra/common/log.hpp>

namespace firehose::test_util {

//! Change the log verbosity level for the guard lifetime (tests may run in shuffled order)
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : previous_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

  private:
    log::Level previous_level_;
};

//! Redirect the first stream into the buffer of the second one for the guard lifetime
class StreamSwap {
  public:
    StreamSwap(std::ostream& redirected, std::ostream& target) : buffer_(redirected.rdbuf()), stream_(redirected) {
        redirected.rdbuf(target.rdbuf());
    }
    ~StreamSwap() { stream_.rdbuf(buffer_); }

  private:
    std::streambuf* buffer_;
    std::ostream& stream_;
};

}  // namespace firehose::test_util
