// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace firehose {

//! Block number (execution layer) or slot (consensus layer)
using BlockNum = uint64_t;

}  // namespace firehose
