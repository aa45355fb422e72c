// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "client_options.hpp"

#include <map>
#include <stdexcept>

namespace firehose::cmd::common {

std::string_view to_string(Layer layer) {
    switch (layer) {
        case Layer::kExecution:
            return "execution";
        case Layer::kConsensus:
            return "consensus";
    }
    return "unknown";
}

SingleBlockRequest make_single_block_request(const FetchOptions& options) {
    if (!options.cursor.empty()) {
        return SingleBlockRequest::by_cursor(options.cursor);
    }
    if (!options.number) {
        throw std::invalid_argument{"either a block number or a cursor must be specified"};
    }
    if (!options.hash.empty()) {
        return SingleBlockRequest::by_block_hash_and_number(options.hash, *options.number);
    }
    return SingleBlockRequest::by_block_number(*options.number);
}

void add_endpoint_options(CLI::App& cli, client::Settings& settings) {
    auto& endpoint_opts = *cli.add_option_group("Endpoint", "Firehose endpoint options");
    endpoint_opts.add_option("--endpoint", settings.endpoint, "Firehose gRPC endpoint as host:port")
        ->capture_default_str();
    endpoint_opts.add_option("--api-key", settings.api_key, "API key sent in x-api-key metadata");
    endpoint_opts.add_option("--bearer-token", settings.bearer_token, "Token sent in authorization metadata");
    endpoint_opts.add_flag("--plaintext", settings.plaintext, "Use an insecure connection instead of TLS");
    endpoint_opts.add_flag("--compression", settings.compression, "Ask the server for gzip compressed responses");
    endpoint_opts.add_option("--max-message-size", settings.max_receive_message_size, "Max size of a received message in bytes")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    endpoint_opts.add_option_function<uint32_t>(
                     "--timeout",
                     [&settings](const uint32_t& timeout_ms) { settings.request_timeout = std::chrono::milliseconds{timeout_ms}; },
                     "Deadline of fetch requests in milliseconds, 0 means none")
        ->default_str(std::to_string(settings.request_timeout.count()));
}

void add_layer_option(CLI::App& cli, Layer& layer) {
    std::map<std::string, Layer> layer_mapping{
        {"execution", Layer::kExecution},
        {"consensus", Layer::kConsensus},
    };
    cli.add_option("--layer", layer, "Block model to decode: execution (Ethereum) or consensus (Beacon)")
        ->transform(CLI::CheckedTransformer(layer_mapping, CLI::ignore_case))
        ->default_str("execution");
}

void add_stream_options(CLI::App& cli, StreamOptions& options) {
    std::map<std::string, sequencing::ConversionErrorPolicy> policy_mapping{
        {"skip", sequencing::ConversionErrorPolicy::kSkip},
        {"retry", sequencing::ConversionErrorPolicy::kRetry},
        {"terminate", sequencing::ConversionErrorPolicy::kTerminate},
    };
    auto& request = options.request;
    cli.add_option("--start", request.start_block_num, "First block to stream, negative means relative to head")
        ->capture_default_str();
    cli.add_option("--stop", request.stop_block_num, "Last block to stream, 0 means unbounded")
        ->capture_default_str();
    cli.add_option("--cursor", request.cursor, "Resume right after this cursor, overrides --start");
    cli.add_flag("--final-blocks-only", request.final_blocks_only, "Stream irreversible blocks only");

    auto& resumable = options.resumable;
    cli.add_option("--cursor-file", options.cursor_file, "File where the last processed cursor is persisted");
    cli.add_option("--max-retries", resumable.max_retries, "Max consecutive reconnections, 0 means forever")
        ->capture_default_str();
    cli.add_option_function<uint32_t>(
           "--backoff",
           [&resumable](const uint32_t& backoff_ms) { resumable.initial_backoff = std::chrono::milliseconds{backoff_ms}; },
           "Initial reconnection back-off in milliseconds")
        ->check(CLI::PositiveNumber)
        ->default_str(std::to_string(resumable.initial_backoff.count()));
    cli.add_option_function<uint32_t>(
           "--max-backoff",
           [&resumable](const uint32_t& backoff_ms) { resumable.max_backoff = std::chrono::milliseconds{backoff_ms}; },
           "Max reconnection back-off in milliseconds")
        ->check(CLI::PositiveNumber)
        ->default_str(std::to_string(resumable.max_backoff.count()));
    cli.add_option("--on-conversion-error", resumable.on_conversion_error, "What to do with undecodable blocks")
        ->transform(CLI::CheckedTransformer(policy_mapping, CLI::ignore_case))
        ->default_str("skip");
    cli.add_option("--progress-interval", options.progress_interval, "Log progress every this many blocks")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
}

void add_fetch_options(CLI::App& cli, FetchOptions& options) {
    auto number_option = cli.add_option("--number", options.number, "Block number or slot to fetch");
    auto hash_option = cli.add_option("--hash", options.hash, "Block hash, requires --number");
    auto cursor_option = cli.add_option("--cursor", options.cursor, "Fetch the block at this cursor");
    hash_option->needs(number_option);
    cursor_option->excludes(number_option);
    cursor_option->excludes(hash_option);
}

}  // namespace firehose::cmd::common
