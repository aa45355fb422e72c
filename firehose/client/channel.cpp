// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "channel.hpp"

#include <firehose/infra/common/log.hpp>

namespace firehose::client {

std::shared_ptr<grpc::Channel> make_channel(const Settings& settings) {
    grpc::ChannelArguments channel_args;
    channel_args.SetMaxReceiveMessageSize(settings.max_receive_message_size);
    if (settings.compression) {
        channel_args.SetCompressionAlgorithm(GRPC_COMPRESS_GZIP);
    }
    const auto credentials = settings.plaintext ? grpc::InsecureChannelCredentials()
                                                : grpc::SslCredentials(grpc::SslCredentialsOptions{});
    FIREHOSE_DEBUG << "Creating channel to " << settings.endpoint << (settings.plaintext ? " [plaintext]" : " [tls]");
    return grpc::CreateCustomChannel(settings.endpoint, credentials, channel_args);
}

void add_auth_metadata(grpc::ClientContext& context, const Settings& settings) {
    if (!settings.api_key.empty()) {
        context.AddMetadata(kApiKeyHeader, settings.api_key);
    }
    if (!settings.bearer_token.empty()) {
        context.AddMetadata(kAuthorizationHeader, "Bearer " + settings.bearer_token);
    }
}

}  // namespace firehose::client
