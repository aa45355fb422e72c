// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <unistd.h>

namespace firehose::log {

//! The fixed size for thread name in log traces
static constexpr size_t kThreadNameFixedSize = 11;

//! The fixed width of the message column when key/value arguments follow
static constexpr int kMessageWidth = 41;

// ANSI escape sequences
static constexpr std::string_view kColorReset{"\x1b[0m"};
static constexpr std::string_view kColorCoal{"\x1b[90m"};
static constexpr std::string_view kColorWhite{"\x1b[97m"};
static constexpr std::string_view kColorRed{"\x1b[91m"};
static constexpr std::string_view kColorGreen{"\x1b[32m"};
static constexpr std::string_view kColorOrangeHigh{"\x1b[1;33m"};
static constexpr std::string_view kBackgroundRed{"\x1b[101m"};
static constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

static Settings settings_{};
static bool use_colors_{false};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings_.log_file));
    }
    const bool is_tty = isatty(settings_.log_std_out ? STDOUT_FILENO : STDERR_FILENO) != 0;
    // Escape sequences must never reach the log file
    use_colors_ = !settings_.log_nocolor && settings_.log_file.empty() && is_tty;
}

void tee_file(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    file_ = std::move(file);
    use_colors_ = false;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = std::string(name);
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

namespace {

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    LevelStyle level_style(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kWarning:
                return {" WARN", kColorOrangeHigh};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            default:
                return {"     ", kColorReset};
        }
    }

    //! Write the text wrapped in the given color, or as is when colors are disabled
    void colored(std::ostream& out, std::string_view color, std::string_view text) {
        if (use_colors_) {
            out << color << text << kColorReset;
        } else {
            out << text;
        }
    }

}  // namespace

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    const auto [tag, color] = level_style(level);
    ss_ << " ";
    colored(ss_, color, tag);
    ss_ << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timestamp = "[" + absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) + " " + kTz.name() + "]";
    colored(ss_, kColorWhite, timestamp);
    ss_ << " ";

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(args.empty() ? 0 : kMessageWidth) << std::setfill(' ') << msg;
    append_args(args);
}

void BufferBase::append_args(const Args& args) {
    if (!should_print_) return;
    for (size_t i{0}; i < args.size(); i += 2) {
        colored(ss_, kColorGreen, args[i]);
        ss_ << "=";
        if (i + 1 < args.size()) {
            colored(ss_, kColorWhite, args[i + 1]);
        }
        ss_ << " ";
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_) {
        *file_ << line << '\n';
        file_->flush();
    }
}

}  // namespace firehose::log
