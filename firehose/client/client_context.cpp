// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "client_context.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/run.hpp>
#pragma GCC diagnostic pop

#include <firehose/infra/common/log.hpp>

namespace firehose::client {

ClientContext::ClientContext()
    : ioc_{std::make_unique<boost::asio::io_context>()},
      ioc_work_{boost::asio::make_work_guard(*ioc_)},
      grpc_context_{std::make_unique<agrpc::GrpcContext>()},
      grpc_context_work_{boost::asio::make_work_guard(grpc_context_->get_executor())} {}

void ClientContext::execute_loop() {
    FIREHOSE_DEBUG << "ClientContext execution loop start [" << this << "]";
    agrpc::run(*grpc_context_, *ioc_, [&] { return ioc_->stopped(); });
    FIREHOSE_DEBUG << "ClientContext execution loop end [" << this << "]";
}

void ClientContext::stop() {
    ioc_->stop();
    FIREHOSE_DEBUG << "ClientContext::stop [" << this << "]";
}

}  // namespace firehose::client
