// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <string>

#include <firehose/infra/common/log.hpp>

namespace grpc {

std::ostream& operator<<(std::ostream& out, const Status& status) {
    out << "status=" << (status.ok() ? "OK" : "KO");
    if (!status.ok()) {
        out << " error_code=" << status.error_code()
            << " error_message=" << status.error_message()
            << " error_details=" << status.error_details();
    }
    return out;
}

}  // namespace grpc

namespace firehose::rpc {

void gpr_firehose_log(gpr_log_func_args* args) {
    std::string log_message{"gRPC: "};
    log_message.append(args->message);
    if (args->severity == GPR_LOG_SEVERITY_ERROR) {
        log_message.append(" ");
        log_message.append(args->file);
        log_message.append(":");
        log_message.append(std::to_string(args->line));
        FIREHOSE_ERROR << log_message;
    } else if (args->severity == GPR_LOG_SEVERITY_INFO) {
        FIREHOSE_INFO << log_message;
    } else {  // args->severity == GPR_LOG_SEVERITY_DEBUG
        FIREHOSE_DEBUG << log_message;
    }
}

void gpr_no_log(gpr_log_func_args* /*args*/) {
}

}  // namespace firehose::rpc
