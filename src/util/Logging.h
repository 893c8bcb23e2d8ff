#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <mutex>
#include <string>

// Provide support for fmt-strings formatting objects that have
// an overloaded operator<< defined on them.
#include <fmt/ostream.h>

// Must include this _before_ spdlog.h
#include "util/SpdlogTweaks.h"

#include <memory>
#include <spdlog/spdlog.h>

#define LOG_CHECK(logger, level, action) \
    do \
    { \
        auto lg = (logger); \
        if (lg->should_log(level) || lg->should_backtrace()) \
        { \
            action; \
        } \
    } while (false)

#define CLOG_TRACE(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::trace, \
              SPDLOG_LOGGER_TRACE(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_DEBUG(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::debug, \
              SPDLOG_LOGGER_DEBUG(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_INFO(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::info, \
              SPDLOG_LOGGER_INFO(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_WARNING(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::warn, \
              SPDLOG_LOGGER_WARN(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_ERROR(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::err, \
              SPDLOG_LOGGER_ERROR(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_FATAL(partition, f, ...) \
    LOG_CHECK(vaultcheck::Logging::get##partition##LogPtr(), \
              spdlog::level::critical, \
              SPDLOG_LOGGER_CRITICAL(lg, FMT_STRING(f), ##__VA_ARGS__))

namespace vaultcheck
{
typedef std::shared_ptr<spdlog::logger> LogPtr;

enum class LogLevel
{
    LVL_FATAL = 0,
    LVL_ERROR = 1,
    LVL_WARNING = 2,
    LVL_INFO = 3,
    LVL_DEBUG = 4,
    LVL_TRACE = 5
};

// Each partition in util/LogPartitions.def gets its own spdlog logger, all
// sharing the console sink and, once setLoggingToFile was called, a file.
class Logging
{
    static LogLevel mLogLevel;
    static std::recursive_mutex mLogMutex;
    static bool mInitialized;
    static bool mColor;
    static std::string mPattern;
    static std::string mFilename;
#define LOG_PARTITION(name) static LogPtr name##LogPtr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION

  public:
    static void init();
    static void deinit();
    static void setFmt(std::string const& tag);
    // throws std::runtime_error, logging to the console only, if the file
    // cannot be opened
    static void setLoggingToFile(std::string const& filename);
    static void setLoggingColor(bool color);
    static void setLogLevel(LogLevel level);
    // unknown names give LVL_INFO
    static LogLevel getLLfromString(std::string const& levelName);

#define LOG_PARTITION(name) static LogPtr get##name##LogPtr();
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};
}
