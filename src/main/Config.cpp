// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "util/FixedPoint.h"

#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace vaultcheck
{

Config::Config()
{
    LOG_LEVEL = LogLevel::LVL_INFO;
    LOG_FILE_PATH = "";
    LOG_COLOR = false;
    INVARIANT_CHECKS = {".*"};

    SETTLEMENT_ABSOLUTE_TOLERANCE = 40000;
    SETTLEMENT_RELATIVE_TOLERANCE = FixedPoint::pow10(10);

    FuzzOptions defaults;
    FUZZ_RUNS = defaults.runs;
    FUZZ_SEED = defaults.seed;
    FUZZ_POOL_KIND = defaults.poolKind;
    FUZZ_MIN_BALANCE = defaults.minBalance;
    FUZZ_MAX_BALANCE = defaults.maxBalance;
    FUZZ_MAX_SKEW = defaults.maxSkew;
}

namespace
{

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::vector<T>
readArray(ConfigItem const& item)
{
    auto result = std::vector<T>{};
    if (!item.second->is_array())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' must be an array"), item.first));
    }
    for (auto v : item.second->as_array()->get())
    {
        if (!v->as<T>())
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("invalid element of '{}'"), item.first));
        }
        result.push_back(v->as<T>()->get());
    }
    return result;
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    auto v = item.second->as<int64_t>()->get();
    if (v < 0 || static_cast<uint64_t>(v) < min ||
        static_cast<uint64_t>(v) > max)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("bad '{}'"), item.first));
    }
    return static_cast<T>(v);
}

// Amounts do not fit in a TOML integer, so they are given as strings such
// as "1000e18"; small ones may also be plain integers.
uint256
readAmount(ConfigItem const& item)
{
    if (item.second->as<int64_t>())
    {
        return uint256(readInt<uint64_t>(item));
    }
    auto s = readString(item);
    try
    {
        return amountFromString(s);
    }
    catch (std::invalid_argument const&)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    catch (ArithmeticOverflow const&)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' does not fit in 256 bits"),
                        item.first));
    }
}

InvariantKind
readPoolKind(ConfigItem const& item)
{
    auto s = readString(item);
    if (s == "linear")
    {
        return InvariantKind::LINEAR;
    }
    if (s == "constant-product")
    {
        return InvariantKind::CONSTANT_PRODUCT;
    }
    throw std::invalid_argument(
        fmt::format(FMT_STRING("invalid '{}'"), item.first));
}
}

void
Config::load(std::string const& filename)
{
    CLOG_DEBUG(Test, "Loading config from: {}", filename);
    try
    {
        std::ifstream ifs(filename);
        if (!ifs)
        {
            throw std::runtime_error(
                fmt::format(FMT_STRING("Error opening file '{}'"), filename));
        }
        ifs.exceptions(std::ios::badbit);
        load(ifs);
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    try
    {
        cpptoml::parser p(in);
        t = p.parse();
    }
    catch (cpptoml::parse_exception const& ex)
    {
        throw std::invalid_argument(ex.what());
    }
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    if (!t)
    {
        throw std::invalid_argument("Could not parse toml");
    }

    for (auto& item : *t)
    {
        CLOG_DEBUG(Test, "Config item: {}", item.first);
        std::map<std::string, std::function<void()>> const confProcessor = {
            {"LOG_LEVEL",
             [&]() { LOG_LEVEL = Logging::getLLfromString(readString(item)); }},
            {"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
            {"LOG_COLOR", [&]() { LOG_COLOR = readBool(item); }},
            {"INVARIANT_CHECKS",
             [&]() { INVARIANT_CHECKS = readArray<std::string>(item); }},
            {"SETTLEMENT_ABSOLUTE_TOLERANCE",
             [&]() { SETTLEMENT_ABSOLUTE_TOLERANCE = readAmount(item); }},
            {"SETTLEMENT_RELATIVE_TOLERANCE",
             [&]() {
                 SETTLEMENT_RELATIVE_TOLERANCE = readAmount(item);
                 if (SETTLEMENT_RELATIVE_TOLERANCE > FixedPoint::ONE())
                 {
                     throw std::invalid_argument(
                         "SETTLEMENT_RELATIVE_TOLERANCE must be at most 1e18");
                 }
             }},
            {"FUZZ_RUNS", [&]() { FUZZ_RUNS = readInt<uint64_t>(item); }},
            {"FUZZ_SEED", [&]() { FUZZ_SEED = readInt<unsigned int>(item); }},
            {"FUZZ_POOL_KIND", [&]() { FUZZ_POOL_KIND = readPoolKind(item); }},
            {"FUZZ_MIN_BALANCE",
             [&]() { FUZZ_MIN_BALANCE = readAmount(item); }},
            {"FUZZ_MAX_BALANCE",
             [&]() { FUZZ_MAX_BALANCE = readAmount(item); }},
            {"FUZZ_MAX_SKEW",
             [&]() {
                 FUZZ_MAX_SKEW = readAmount(item);
                 if (FUZZ_MAX_SKEW.is_zero())
                 {
                     throw std::invalid_argument("bad 'FUZZ_MAX_SKEW'");
                 }
             }}};

        auto it = confProcessor.find(item.first);
        if (it == confProcessor.end())
        {
            std::string err("Unknown configuration entry: '");
            err += item.first;
            err += "'";
            throw std::invalid_argument(err);
        }
        it->second();
    }

    if (FUZZ_MIN_BALANCE > FUZZ_MAX_BALANCE)
    {
        throw std::invalid_argument(
            "FUZZ_MIN_BALANCE must not exceed FUZZ_MAX_BALANCE");
    }
}

Tolerance
Config::getSettlementTolerance() const
{
    return Tolerance{SETTLEMENT_ABSOLUTE_TOLERANCE,
                     SETTLEMENT_RELATIVE_TOLERANCE};
}

FuzzOptions
Config::getFuzzOptions() const
{
    FuzzOptions options;
    options.runs = FUZZ_RUNS;
    options.seed = FUZZ_SEED;
    options.poolKind = FUZZ_POOL_KIND;
    options.minBalance = FUZZ_MIN_BALANCE;
    options.maxBalance = FUZZ_MAX_BALANCE;
    options.maxSkew = FUZZ_MAX_SKEW;
    options.invariantChecks = INVARIANT_CHECKS;
    return options;
}

void
Config::configureLogging() const
{
    Logging::setLogLevel(LOG_LEVEL);
    Logging::setLoggingColor(LOG_COLOR);
    if (!LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(LOG_FILE_PATH);
    }
}
}
