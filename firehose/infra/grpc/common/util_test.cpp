// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <sstream>

#include <catch2/catch.hpp>

#include <firehose/infra/common/log.hpp>
#include <firehose/infra/test_util/log.hpp>

namespace firehose::rpc {

TEST_CASE("grpc::Status operator<<", "[firehose][infra][grpc][util]") {
    SECTION("OK") {
        std::stringstream out;
        out << grpc::Status::OK;
        CHECK(out.str() == "status=OK");
    }
    SECTION("KO") {
        std::stringstream out;
        out << grpc::Status{grpc::StatusCode::NOT_FOUND, "block not found"};
        CHECK(out.str() == "status=KO error_code=5 error_message=block not found error_details=");
    }
}

TEST_CASE("grpc::Status operator==", "[firehose][infra][grpc][util]") {
    CHECK(grpc::Status::OK == grpc::Status{});
    CHECK_FALSE(grpc::Status{grpc::StatusCode::NOT_FOUND, "a"} == grpc::Status{grpc::StatusCode::NOT_FOUND, "b"});
}

TEST_CASE("GrpcLogGuard", "[firehose][infra][grpc][util]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    CHECK_NOTHROW(GrpcNoLogGuard{});
    CHECK_NOTHROW(Grpc2FirehoseLogGuard{});

    gpr_log_func_args args{.file = "file.cc", .line = 1, .severity = GPR_LOG_SEVERITY_ERROR, .message = "test message"};
    CHECK_NOTHROW(gpr_firehose_log(&args));
    args.severity = GPR_LOG_SEVERITY_DEBUG;
    CHECK_NOTHROW(gpr_firehose_log(&args));
}

}  // namespace firehose::rpc
