// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace firehose::sequencing {

//! Durable location of the last processed cursor
class CursorStore {
  public:
    virtual ~CursorStore() = default;

    //! The saved cursor, std::nullopt if nothing has been saved yet
    virtual std::optional<std::string> load() = 0;

    virtual void save(const std::string& cursor) = 0;
};

class InMemoryCursorStore : public CursorStore {
  public:
    InMemoryCursorStore() = default;
    explicit InMemoryCursorStore(std::string cursor) : cursor_(std::move(cursor)) {}

    std::optional<std::string> load() override { return cursor_; }
    void save(const std::string& cursor) override {
        cursor_ = cursor;
        ++saves_;
    }

    uint64_t saves() const { return saves_; }

  private:
    std::optional<std::string> cursor_;
    uint64_t saves_{0};
};

//! \brief Cursor kept in a text file.
//! \details Each save writes a temporary file beside the target and renames it over the target, so a crash never
//! leaves a truncated cursor behind.
//! \throws std::runtime_error when the file cannot be read or written
class FileCursorStore : public CursorStore {
  public:
    explicit FileCursorStore(std::filesystem::path path);

    std::optional<std::string> load() override;
    void save(const std::string& cursor) override;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

}  // namespace firehose::sequencing
