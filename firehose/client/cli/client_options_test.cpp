// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "client_options.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

namespace firehose::cmd::common {

using namespace std::chrono_literals;

static void parse(CLI::App& cli, std::vector<std::string> args) {
    // CLI11 parses the vector in reverse order
    std::reverse(args.begin(), args.end());
    cli.parse(args);
}

TEST_CASE("add_endpoint_options", "[client][cli]") {
    CLI::App cli;
    client::Settings settings;
    add_endpoint_options(cli, settings);

    SECTION("defaults") {
        parse(cli, {});
        CHECK(settings.endpoint == "localhost:10015");
        CHECK_FALSE(settings.plaintext);
        CHECK(settings.request_timeout == 30s);
    }
    SECTION("all options") {
        parse(cli, {"--endpoint", "mainnet.eth.example.io:443", "--api-key", "k", "--bearer-token", "t",
                    "--plaintext", "--compression", "--timeout", "1500"});
        CHECK(settings.endpoint == "mainnet.eth.example.io:443");
        CHECK(settings.api_key == "k");
        CHECK(settings.bearer_token == "t");
        CHECK(settings.plaintext);
        CHECK(settings.compression);
        CHECK(settings.request_timeout == 1500ms);
    }
}

TEST_CASE("add_layer_option", "[client][cli]") {
    CLI::App cli;
    Layer layer{Layer::kExecution};
    add_layer_option(cli, layer);

    SECTION("case insensitive") {
        parse(cli, {"--layer", "Consensus"});
        CHECK(layer == Layer::kConsensus);
    }
    SECTION("unknown layer") {
        CHECK_THROWS_AS(parse(cli, {"--layer", "data"}), CLI::ValidationError);
    }
}

TEST_CASE("add_stream_options", "[client][cli]") {
    CLI::App cli;
    StreamOptions options;
    add_stream_options(cli, options);

    SECTION("defaults") {
        parse(cli, {});
        CHECK(options.request == StreamRequest{});
        CHECK(options.resumable.on_conversion_error == sequencing::ConversionErrorPolicy::kSkip);
        CHECK(options.cursor_file.empty());
    }
    SECTION("relative start") {
        parse(cli, {"--start=-100", "--final-blocks-only"});
        CHECK(options.request.start_block_num == -100);
        CHECK(options.request.final_blocks_only);
    }
    SECTION("resumption options") {
        parse(cli, {"--start", "10", "--stop", "20", "--cursor", "abc", "--cursor-file", "cursor.txt",
                    "--max-retries", "5", "--backoff", "100", "--max-backoff", "1000", "--on-conversion-error", "terminate"});
        CHECK(options.request.start_block_num == 10);
        CHECK(options.request.stop_block_num == 20);
        CHECK(options.request.cursor == "abc");
        CHECK(options.cursor_file == "cursor.txt");
        CHECK(options.resumable.max_retries == 5);
        CHECK(options.resumable.initial_backoff == 100ms);
        CHECK(options.resumable.max_backoff == 1000ms);
        CHECK(options.resumable.on_conversion_error == sequencing::ConversionErrorPolicy::kTerminate);
    }
}

TEST_CASE("add_fetch_options", "[client][cli]") {
    CLI::App cli;
    FetchOptions options;
    add_fetch_options(cli, options);

    SECTION("by number") {
        parse(cli, {"--number", "42"});
        CHECK(make_single_block_request(options) == SingleBlockRequest::by_block_number(42));
    }
    SECTION("by hash and number") {
        parse(cli, {"--number", "42", "--hash", "ab01"});
        CHECK(make_single_block_request(options) == SingleBlockRequest::by_block_hash_and_number("ab01", 42));
    }
    SECTION("by cursor") {
        parse(cli, {"--cursor", "c42"});
        CHECK(make_single_block_request(options) == SingleBlockRequest::by_cursor("c42"));
    }
    SECTION("hash requires number") {
        CHECK_THROWS_AS(parse(cli, {"--hash", "ab01"}), CLI::RequiresError);
    }
    SECTION("cursor excludes number") {
        CHECK_THROWS_AS(parse(cli, {"--cursor", "c42", "--number", "42"}), CLI::ExcludesError);
    }
    SECTION("no reference") {
        parse(cli, {});
        CHECK_THROWS_AS(make_single_block_request(options), std::invalid_argument);
    }
}

}  // namespace firehose::cmd::common
