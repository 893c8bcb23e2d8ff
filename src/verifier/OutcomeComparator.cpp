// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "verifier/OutcomeComparator.h"
#include "util/FixedPoint.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <set>

namespace vaultcheck
{

namespace
{
// |value| * pct / 1e18, saturating when the product does not fit
uint256
percentOf(uint256 const& value, uint256 const& pct)
{
    uint256 res;
    if (!bigDivide(res, value, pct, FixedPoint::ONE(), ROUND_DOWN))
    {
        return maxUint256();
    }
    return res;
}

std::string
withinRange(int256 const& actual, int256 const& expected,
            uint256 const& epsilon)
{
    auto distance = absValue(actual - expected);
    if (distance > epsilon)
    {
        return fmt::format(
            FMT_STRING("{} is not within {} of {} (off by {})"), actual,
            epsilon, expected, distance);
    }
    return {};
}
}

Tolerance
Tolerance::exact()
{
    return Tolerance{uint256(0), uint256(0)};
}

bool
Tolerance::accepts(int256 const& expected, int256 const& actual) const
{
    auto distance = absValue(actual - expected);
    return distance <= absolute ||
           distance <= percentOf(absValue(expected), relative);
}

std::string
compareDiffs(ExpectedDiffMap const& expected, BalanceDiff const& actual,
             Tolerance const& tolerance, bool unlistedMustBeZero)
{
    for (auto const& entry : expected.entries())
    {
        auto const& key = entry.first;
        auto it = actual.balances.find(key);
        if (it == actual.balances.end())
        {
            return fmt::format(
                FMT_STRING("expected change of {} in {} of {} is not covered "
                           "by the snapshot"),
                entry.second, key.second, key.first);
        }
        if (!tolerance.accepts(entry.second, it->second))
        {
            return fmt::format(
                FMT_STRING("{} of {}: expected change {}, actual {}"),
                key.second, key.first, entry.second, it->second);
        }
    }
    if (unlistedMustBeZero)
    {
        for (auto const& entry : actual.balances)
        {
            if (!expected.contains(entry.first.first, entry.first.second) &&
                !entry.second.is_zero())
            {
                return fmt::format(
                    FMT_STRING("{} of {} changed by {}, expected no change"),
                    entry.first.second, entry.first.first, entry.second);
            }
        }
    }
    return {};
}

std::string
comparePathAmounts(std::vector<uint256> const& expected,
                   std::vector<uint256> const& actual,
                   Tolerance const& tolerance)
{
    if (expected.size() != actual.size())
    {
        return fmt::format(FMT_STRING("expected {} path amounts, got {}"),
                           expected.size(), actual.size());
    }
    for (size_t i = 0; i < expected.size(); ++i)
    {
        if (!tolerance.accepts(toSigned(expected[i]), toSigned(actual[i])))
        {
            return fmt::format(FMT_STRING("path {}: expected {}, actual {}"),
                               i, expected[i], actual[i]);
        }
    }
    return {};
}

std::string
compareTokenTotals(std::map<TokenID, uint256> const& expected,
                   std::vector<TokenID> const& tokens,
                   std::vector<uint256> const& amounts,
                   Tolerance const& tolerance)
{
    if (tokens.size() != amounts.size())
    {
        return fmt::format(
            FMT_STRING("{} settlement tokens but {} settlement amounts"),
            tokens.size(), amounts.size());
    }
    std::map<TokenID, uint256> actual;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        auto res = actual.emplace(tokens[i], amounts[i]);
        if (!res.second)
        {
            res.first->second = add(res.first->second, amounts[i]);
        }
    }
    for (auto const& entry : actual)
    {
        if (expected.find(entry.first) == expected.end())
        {
            return fmt::format(FMT_STRING("unexpected settlement of {} {}"),
                               entry.second, entry.first);
        }
    }
    for (auto const& entry : expected)
    {
        auto it = actual.find(entry.first);
        if (it == actual.end())
        {
            return fmt::format(FMT_STRING("no settlement in {}, expected {}"),
                               entry.first, entry.second);
        }
        if (!tolerance.accepts(toSigned(entry.second), toSigned(it->second)))
        {
            return fmt::format(
                FMT_STRING("settlement in {}: expected {}, actual {}"),
                entry.first, entry.second, it->second);
        }
    }
    return {};
}

std::string
toString(ChangeMode mode)
{
    switch (mode)
    {
    case ChangeMode::EQUAL:
        return "EQUAL";
    case ChangeMode::GT:
        return "GT";
    case ChangeMode::GTE:
        return "GTE";
    case ChangeMode::LT:
        return "LT";
    case ChangeMode::LTE:
        return "LTE";
    case ChangeMode::NEAR:
        return "NEAR";
    case ChangeMode::VERY_NEAR:
        return "VERY_NEAR";
    }
    throw std::invalid_argument("unknown change mode");
}

static std::string
checkChange(int256 const& actual, BalanceChange const& change)
{
    bool ok = false;
    switch (change.mode)
    {
    case ChangeMode::EQUAL:
        ok = actual == change.value;
        break;
    case ChangeMode::GT:
        ok = actual > change.value;
        break;
    case ChangeMode::GTE:
        ok = actual >= change.value;
        break;
    case ChangeMode::LT:
        ok = actual < change.value;
        break;
    case ChangeMode::LTE:
        ok = actual <= change.value;
        break;
    case ChangeMode::NEAR:
        return withinRange(actual, change.value, absValue(change.value) / 10);
    case ChangeMode::VERY_NEAR:
        return withinRange(actual, change.value,
                           absValue(change.value) / 100000);
    }
    if (!ok)
    {
        return fmt::format(FMT_STRING("change {} is not {} {}"), actual,
                           toString(change.mode), change.value);
    }
    return {};
}

std::string
checkBalanceChanges(BalanceDiff const& actual,
                    std::vector<BalanceChange> const& changes)
{
    std::set<BalanceKey> listed;
    std::set<AccountID> accounts;
    for (auto const& change : changes)
    {
        auto it = actual.balances.find({change.account, change.token});
        if (it == actual.balances.end())
        {
            return fmt::format(
                FMT_STRING("{} of {} is not covered by the snapshot"),
                change.token, change.account);
        }
        auto err = checkChange(it->second, change);
        if (!err.empty())
        {
            return fmt::format(FMT_STRING("{} of {}: {}"), change.token,
                               change.account, err);
        }
        listed.emplace(change.account, change.token);
        accounts.emplace(change.account);
    }

    for (auto const& entry : actual.balances)
    {
        if (accounts.find(entry.first.first) != accounts.end() &&
            listed.find(entry.first) == listed.end() &&
            !entry.second.is_zero())
        {
            return fmt::format(
                FMT_STRING("{} of {} changed by {}, expected no change"),
                entry.first.second, entry.first.first, entry.second);
        }
    }
    return {};
}

uint256 const&
DEFAULT_PCT_ERROR()
{
    // 0.1%
    static uint256 const pct = FixedPoint::pow10(15);
    return pct;
}

std::string
expectEqualWithError(uint256 const& actual, uint256 const& expected,
                     uint256 const& pctError)
{
    auto acceptedError = percentOf(expected, pctError);
    auto err = withinRange(toSigned(actual), toSigned(expected), acceptedError);
    if (!err.empty())
    {
        CLOG_DEBUG(Verifier, "expectEqualWithError: {}", err);
    }
    return err;
}

std::string
expectLessThanOrEqualWithError(uint256 const& actual, uint256 const& expected,
                               uint256 const& pctError)
{
    if (actual > expected)
    {
        return fmt::format(FMT_STRING("{} is greater than {}"), actual,
                           expected);
    }
    return expectEqualWithError(actual, expected, pctError);
}
}
