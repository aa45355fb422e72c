// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace firehose::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names (or ids) in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Tee all log lines to this file, colors are disabled when set
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
//! \note This function is not thread safe as it's meant to be used in tests
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void tee_file(const std::filesystem::path& path);

//! Alternating key/value pairs printed after the message
using Args = std::vector<std::string>;

//! \brief Accumulates one log line and writes it out on destruction.
//! \details Nothing is formatted when the level is filtered out by the current verbosity.
class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) { append_args(args); }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace firehose::log

#define FIREHOSE_LOGBUFFER(level_, ...)           \
    if (!firehose::log::test_verbosity(level_)) { \
    } else                                        \
        firehose::log::LogBuffer<level_>(__VA_ARGS__)

#define FIREHOSE_TRACE_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kTrace, __VA_ARGS__)
#define FIREHOSE_DEBUG_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kDebug, __VA_ARGS__)
#define FIREHOSE_INFO_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kInfo, __VA_ARGS__)
#define FIREHOSE_WARN_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kWarning, __VA_ARGS__)
#define FIREHOSE_ERROR_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kError, __VA_ARGS__)
#define FIREHOSE_CRIT_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kCritical, __VA_ARGS__)
#define FIREHOSE_LOG_M(...) FIREHOSE_LOGBUFFER(firehose::log::Level::kNone, __VA_ARGS__)

#define FIREHOSE_TRACE FIREHOSE_TRACE_M()
#define FIREHOSE_DEBUG FIREHOSE_DEBUG_M()
#define FIREHOSE_INFO FIREHOSE_INFO_M()
#define FIREHOSE_WARN FIREHOSE_WARN_M()
#define FIREHOSE_ERROR FIREHOSE_ERROR_M()
#define FIREHOSE_CRIT FIREHOSE_CRIT_M()
#define FIREHOSE_LOG FIREHOSE_LOG_M()
