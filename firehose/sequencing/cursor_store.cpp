// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "cursor_store.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <absl/strings/ascii.h>

#include <firehose/infra/common/log.hpp>

namespace firehose::sequencing {

FileCursorStore::FileCursorStore(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<std::string> FileCursorStore::load() {
    if (!std::filesystem::exists(path_)) {
        FIREHOSE_DEBUG << "FileCursorStore: no cursor file at " << path_.string();
        return std::nullopt;
    }
    std::ifstream in{path_, std::ios::in};
    if (!in.is_open()) {
        throw std::runtime_error{"cannot open cursor file " + path_.string()};
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    std::string cursor{absl::StripAsciiWhitespace(content)};
    if (cursor.empty()) {
        return std::nullopt;
    }
    FIREHOSE_DEBUG << "FileCursorStore: loaded cursor from " << path_.string();
    return cursor;
}

void FileCursorStore::save(const std::string& cursor) {
    std::filesystem::path tmp_path{path_};
    tmp_path += ".tmp";
    {
        std::ofstream out{tmp_path, std::ios::out | std::ios::trunc};
        if (!out.is_open()) {
            throw std::runtime_error{"cannot open cursor file " + tmp_path.string()};
        }
        out << cursor << '\n';
        out.flush();
        if (!out) {
            throw std::runtime_error{"cannot write cursor file " + tmp_path.string()};
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        throw std::runtime_error{"cannot rename " + tmp_path.string() + " to " + path_.string() + ": " + ec.message()};
    }
}

}  // namespace firehose::sequencing
