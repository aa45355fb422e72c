// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace firehose::test_util {

//! Unique directory under the OS temporary path, removed with its content on destruction
class TemporaryDirectory {
  public:
    TemporaryDirectory() : path_(unique_path()) {
        std::filesystem::create_directories(path_);
    }
    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    static std::filesystem::path unique_path() {
        static std::atomic_uint64_t counter{0};
        return std::filesystem::temp_directory_path() /
               ("firehose_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    }

    std::filesystem::path path_;
};

}  // namespace firehose::test_util
