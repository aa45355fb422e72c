// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <firehose/client/channel.hpp>
#include <firehose/client/cli/client_options.hpp>
#include <firehose/client/client_context.hpp>
#include <firehose/client/remote_fetch_client.hpp>
#include <firehose/client/remote_stream_client.hpp>
#include <firehose/client/typed.hpp>
#include <firehose/infra/cli/common.hpp>
#include <firehose/infra/cli/shutdown_signal.hpp>
#include <firehose/infra/common/log.hpp>
#include <firehose/infra/grpc/common/util.hpp>
#include <firehose/sequencing/canonical_chain.hpp>
#include <firehose/sequencing/cursor_store.hpp>
#include <firehose/sequencing/resumable_stream.hpp>
#include <firehose/sequencing/sequence_monitor.hpp>
#include <firehose/types/beacon/block.hpp>
#include <firehose/types/eth/block.hpp>

using namespace firehose;
using namespace firehose::cmd::common;

namespace {

constexpr int kExitSuccess{0};
constexpr int kExitFailure{1};
constexpr int kExitInterrupted{130};

enum class Command {
    kStream,
    kFetch,
};

struct ClientSettings {
    log::Settings log_settings;
    client::Settings endpoint;
    Layer layer{Layer::kExecution};
    Command command{Command::kStream};
    StreamOptions stream;
    FetchOptions fetch;
};

ClientSettings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Firehose client - stream and fetch blocks from Firehose endpoints"};
    cli.require_subcommand(1);

    ClientSettings settings;
    add_logging_options(cli, settings.log_settings);
    add_endpoint_options(cli, settings.endpoint);

    auto& stream_cmd = *cli.add_subcommand("stream", "Stream blocks with automatic resumption from the last cursor");
    add_layer_option(stream_cmd, settings.layer);
    add_stream_options(stream_cmd, settings.stream);

    auto& fetch_cmd = *cli.add_subcommand("fetch", "Fetch a single block by number, hash and number or cursor");
    add_layer_option(fetch_cmd, settings.layer);
    add_fetch_options(fetch_cmd, settings.fetch);

    // Allow endpoint and logging options after the sub-command name
    stream_cmd.fallthrough();
    fetch_cmd.fallthrough();

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }
    settings.command = fetch_cmd.parsed() ? Command::kFetch : Command::kStream;
    return settings;
}

std::string_view block_hash(const eth::Block& block) { return block.hash; }
std::string_view block_hash(const beacon::Block& block) { return block.root; }

std::unique_ptr<sequencing::CursorStore> make_cursor_store(const StreamOptions& options) {
    if (options.cursor_file.empty()) {
        return std::make_unique<sequencing::InMemoryCursorStore>();
    }
    return std::make_unique<sequencing::FileCursorStore>(options.cursor_file);
}

template <typename T>
Task<int> stream_command(client::StreamClient& client, const StreamOptions& options) {
    auto store = make_cursor_store(options);
    sequencing::ResumableStream<T> stream{client, *store, options.request, options.resumable};
    sequencing::SequenceMonitor<T> monitor{"stream", options.progress_interval};
    sequencing::CanonicalChain<T> chain;

    auto handler = [&](ForkStep step, const T& block, const Response& response) -> Task<client::StreamControl> {
        const auto observation = monitor.observe(step, block);
        const auto update = chain.apply(step, std::string{block_hash(block)}, block);
        if (!update) {
            FIREHOSE_WARN << "Inconsistent chain update at " << block.number_or_slot() << ": " << update.error();
        }
        if (response.metadata) {
            chain.on_irreversible(response.metadata->lib_num);
        }
        FIREHOSE_DEBUG_M("Block", {"step", std::string{to_string(step)},
                                   "number", std::to_string(block.number_or_slot()),
                                   "event", std::string{to_string(observation.event)},
                                   "cursor", response.cursor});
        FIREHOSE_LOG << block;
        co_return client::StreamControl::kContinue;
    };

    const auto result = co_await stream.run(handler);
    FIREHOSE_INFO_M("Stream ended", {"outcome", std::string{to_string(result.outcome)},
                                     "responses", std::to_string(result.responses),
                                     "reconnections", std::to_string(result.reconnections),
                                     "gaps", std::to_string(monitor.gaps()),
                                     "redeliveries", std::to_string(monitor.redeliveries()),
                                     "cursor", result.cursor});
    switch (result.outcome) {
        case sequencing::StreamResult::Outcome::kCompleted:
        case sequencing::StreamResult::Outcome::kStoppedByConsumer:
            co_return kExitSuccess;
        case sequencing::StreamResult::Outcome::kConversionFailed:
            FIREHOSE_ERROR << "Stream aborted by conversion error: " << result.last_conversion_error;
            co_return kExitFailure;
        case sequencing::StreamResult::Outcome::kRetriesExhausted:
            FIREHOSE_ERROR << "Stream aborted by transport error: " << result.last_error;
            co_return kExitFailure;
    }
    co_return kExitFailure;
}

template <typename T>
Task<int> fetch_command(client::FetchClient& client, const FetchOptions& options) {
    const auto request = make_single_block_request(options);
    FIREHOSE_INFO << "Fetching " << request;
    const auto block = co_await client::fetch_block<T>(client, request);
    if (!block) {
        FIREHOSE_ERROR << "Fetch failed: " << block.error();
        co_return kExitFailure;
    }
    FIREHOSE_LOG << *block;
    co_return kExitSuccess;
}

template <typename T>
Task<int> run_command(const ClientSettings& settings, agrpc::GrpcContext& grpc_context) {
    auto channel = client::make_channel(settings.endpoint);
    switch (settings.command) {
        case Command::kStream: {
            client::RemoteStreamClient client{channel, grpc_context, settings.endpoint};
            co_return co_await stream_command<T>(client, settings.stream);
        }
        case Command::kFetch: {
            client::RemoteFetchClient client{channel, grpc_context, settings.endpoint};
            co_return co_await fetch_command<T>(client, settings.fetch);
        }
    }
    co_return kExitFailure;
}

int firehose_client_main(const ClientSettings& settings) {
    using namespace boost::asio::experimental::awaitable_operators;

    log::init(settings.log_settings);
    log::set_thread_name("main");
    rpc::Grpc2FirehoseLogGuard log_guard;

    client::ClientContext context;
    auto command = settings.layer == Layer::kConsensus
                       ? run_command<beacon::Block>(settings, context.grpc_context())
                       : run_command<eth::Block>(settings, context.grpc_context());

    std::optional<int> exit_code;
    std::exception_ptr failure;
    boost::asio::co_spawn(
        context.ioc(),
        std::move(command) || ShutdownSignal::wait(),
        [&](std::exception_ptr eptr, std::variant<int, ShutdownSignal::SignalNumber> result) {
            failure = eptr;
            if (!eptr) {
                exit_code = result.index() == 0 ? std::get<0>(result) : kExitInterrupted;
            }
            context.stop();
        });

    const auto tid = std::this_thread::get_id();
    FIREHOSE_INFO << "Firehose client connecting to " << settings.endpoint.endpoint << " layer="
                  << to_string(settings.layer) << " [main thread=" << tid << "]";

    // wait until either:
    // - shutdown signal, then the command is cancelled gracefully
    // - command completion or exception, then the latter is rethrown here
    context.execute_loop();
    if (failure) {
        std::rethrow_exception(failure);
    }

    FIREHOSE_INFO << "Firehose client exiting [main thread=" << tid << "]";
    return exit_code.value_or(kExitFailure);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        return firehose_client_main(parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code();
    } catch (const std::exception& e) {
        FIREHOSE_CRIT << "Firehose client exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        FIREHOSE_CRIT << "Firehose client exiting due to unexpected exception";
        return -3;
    }
}
