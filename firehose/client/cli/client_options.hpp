// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include <firehose/client/settings.hpp>
#include <firehose/core/base.hpp>
#include <firehose/core/request.hpp>
#include <firehose/sequencing/resumable_stream.hpp>

namespace firehose::cmd::common {

//! Chain layer served by the endpoint, selecting the block model to decode
enum class Layer {
    kExecution,
    kConsensus,
};

std::string_view to_string(Layer layer);

struct StreamOptions {
    StreamRequest request;
    sequencing::ResumableStreamSettings resumable;
    //! File where the last committed cursor is persisted, empty means in-memory only
    std::string cursor_file;
    uint64_t progress_interval{1000};
};

struct FetchOptions {
    std::optional<BlockNum> number;
    std::string hash;
    std::string cursor;
};

//! Build the single block request selected by the fetch options
//! \throws std::invalid_argument if no block reference is given
SingleBlockRequest make_single_block_request(const FetchOptions& options);

void add_endpoint_options(CLI::App& cli, client::Settings& settings);

void add_layer_option(CLI::App& cli, Layer& layer);

void add_stream_options(CLI::App& cli, StreamOptions& options);

void add_fetch_options(CLI::App& cli, FetchOptions& options);

}  // namespace firehose::cmd::common
