// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <agrpc/grpc_context.hpp>
#pragma GCC diagnostic pop
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace firehose::client {

//! \brief Single-threaded asynchronous scheduler for gRPC clients.
//! \details Coroutines run on the io_context, gRPC completions are collected by the GrpcContext: both are driven by the
//! same execution loop until stop() is called.
class ClientContext {
  public:
    ClientContext();

    ClientContext(const ClientContext&) = delete;
    ClientContext& operator=(const ClientContext&) = delete;

    boost::asio::io_context& ioc() noexcept { return *ioc_; }
    agrpc::GrpcContext& grpc_context() noexcept { return *grpc_context_; }

    //! Execute the scheduler loop until stopped
    void execute_loop();

    //! Stop the execution loop, callable from any coroutine running on this context
    void stop();

  private:
    std::unique_ptr<boost::asio::io_context> ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> ioc_work_;
    std::unique_ptr<agrpc::GrpcContext> grpc_context_;
    boost::asio::executor_work_guard<agrpc::GrpcContext::executor_type> grpc_context_work_;
};

}  // namespace firehose::client
