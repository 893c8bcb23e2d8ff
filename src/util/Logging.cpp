// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include "util/types.h"

#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace vaultcheck
{

LogLevel Logging::mLogLevel = LogLevel::LVL_INFO;
std::recursive_mutex Logging::mLogMutex;
bool Logging::mInitialized = false;
bool Logging::mColor = false;
std::string Logging::mPattern;
std::string Logging::mFilename;

static spdlog::level::level_enum
toSpdlogLevel(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return spdlog::level::critical;
    case LogLevel::LVL_ERROR:
        return spdlog::level::err;
    case LogLevel::LVL_WARNING:
        return spdlog::level::warn;
    case LogLevel::LVL_DEBUG:
        return spdlog::level::debug;
    case LogLevel::LVL_TRACE:
        return spdlog::level::trace;
    default:
        return spdlog::level::info;
    }
}

void
Logging::init()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized)
    {
        return;
    }

    using namespace spdlog::sinks;
    std::vector<std::shared_ptr<sink>> sinks;
    if (mColor)
    {
        sinks.emplace_back(std::make_shared<stdout_color_sink_mt>());
    }
    else
    {
        sinks.emplace_back(std::make_shared<stdout_sink_mt>());
    }

    if (!mFilename.empty())
    {
        std::ofstream out(mFilename, std::ios_base::out | std::ios_base::app);
        if (!out)
        {
            throw std::runtime_error(fmt::format(
                FMT_STRING("Could not open log file {}, check access rights"),
                mFilename));
        }
        out.close();
        sinks.emplace_back(
            std::make_shared<basic_file_sink_mt>(mFilename, false));
    }

    auto makeLogger = [&](std::string const& name) {
        auto logger =
            std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::register_logger(logger);
        return logger;
    };
    spdlog::set_default_logger(makeLogger("default"));
#define LOG_PARTITION(name) makeLogger(#name);
#include "util/LogPartitions.def"
#undef LOG_PARTITION

    if (mPattern.empty())
    {
        mPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%n %l%$] %v";
    }
    spdlog::set_pattern(mPattern);
    spdlog::set_level(toSpdlogLevel(mLogLevel));
    spdlog::flush_on(spdlog::level::err);
    mInitialized = true;
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mInitialized)
    {
        return;
    }
#define LOG_PARTITION(name) name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    spdlog::drop_all();
    mInitialized = false;
}

void
Logging::setFmt(std::string const& tag)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    init();
    mPattern = "%Y-%m-%dT%H:%M:%S.%e " + tag + " [%^%n %l%$] %v";
    spdlog::set_pattern(mPattern);
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mFilename = filename;
    deinit();
    try
    {
        init();
    }
    catch (std::runtime_error const&)
    {
        mFilename.clear();
        deinit();
        init();
        throw;
    }
}

void
Logging::setLoggingColor(bool color)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mColor = color;
    deinit();
    init();
}

void
Logging::setLogLevel(LogLevel level)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mLogLevel = level;
    init();
    spdlog::set_level(toSpdlogLevel(level));
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    static std::pair<char const*, LogLevel> const names[] = {
        {"fatal", LogLevel::LVL_FATAL},   {"error", LogLevel::LVL_ERROR},
        {"warning", LogLevel::LVL_WARNING}, {"info", LogLevel::LVL_INFO},
        {"debug", LogLevel::LVL_DEBUG},   {"trace", LogLevel::LVL_TRACE}};
    for (auto const& n : names)
    {
        if (iequals(levelName, n.first))
        {
            return n.second;
        }
    }
    return LogLevel::LVL_INFO;
}

// Loggers are fetched lazily so that code logging before init() still works.
#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            init(); \
            name##LogPtr = spdlog::get(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}
