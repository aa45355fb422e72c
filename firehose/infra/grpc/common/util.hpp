// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <grpc/support/log.h>
#include <grpcpp/grpcpp.h>

namespace grpc {

// operator== overloading for grpc::Status is *NOT* present in gRPC library
inline bool operator==(const Status& lhs, const Status& rhs) {
    return lhs.error_code() == rhs.error_code() &&
           lhs.error_message() == rhs.error_message() &&
           lhs.error_details() == rhs.error_details();
}

// operator<< overloading for grpc::Status is *NOT* present in gRPC library
std::ostream& operator<<(std::ostream& out, const Status& status);

}  // namespace grpc

// The default gRPC logging function
void gpr_default_log(gpr_log_func_args* args);

namespace firehose::rpc {

//! Define a gRPC logging function delegating to our logging facility
void gpr_firehose_log(gpr_log_func_args* args);

//! Define an empty gRPC logging function
void gpr_no_log(gpr_log_func_args* args);

//! Utility template class using RAII to configure the gRPC logging function for an instance lifetime
template <void (*F)(gpr_log_func_args*)>
class GrpcLogGuard {
  public:
    explicit GrpcLogGuard() { gpr_set_log_function(F); }
    ~GrpcLogGuard() { gpr_set_log_function(gpr_default_log); }

    GrpcLogGuard(const GrpcLogGuard&) = delete;
    GrpcLogGuard& operator=(const GrpcLogGuard&) = delete;
};

//! Utility class to disable gRPC logging for an instance lifetime
using GrpcNoLogGuard = GrpcLogGuard<gpr_no_log>;

//! Utility class to map gRPC logging to our logging facility for an instance lifetime
using Grpc2FirehoseLogGuard = GrpcLogGuard<gpr_firehose_log>;

}  // namespace firehose::rpc
