// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <firehose/infra/concurrency/task.hpp>

namespace firehose {

//! Suspend the calling coroutine for the given duration without blocking its executor
Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace firehose
