#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "verifier/BalanceSnapshot.h"
#include "verifier/ExpectedOutcome.h"

#include <map>
#include <string>
#include <vector>

// Comparisons between predicted and observed amounts. Every function returns
// an empty string when the observation is acceptable and a description of
// the first mismatch otherwise, so that callers can both REQUIRE on it and
// log it.

namespace vaultcheck
{

// A value passes when it is within `absolute` minor units of the expected
// one, or within `relative` of it, where 1e18 is 100%.
struct Tolerance
{
    uint256 absolute;
    uint256 relative;

    static Tolerance exact();
    bool accepts(int256 const& expected, int256 const& actual) const;
};

std::string compareDiffs(ExpectedDiffMap const& expected,
                         BalanceDiff const& actual, Tolerance const& tolerance,
                         bool unlistedMustBeZero);

std::string comparePathAmounts(std::vector<uint256> const& expected,
                               std::vector<uint256> const& actual,
                               Tolerance const& tolerance);

// tokens and amounts are parallel, as returned by a batch swap
std::string compareTokenTotals(std::map<TokenID, uint256> const& expected,
                               std::vector<TokenID> const& tokens,
                               std::vector<uint256> const& amounts,
                               Tolerance const& tolerance);

enum class ChangeMode
{
    EQUAL,
    GT,
    GTE,
    LT,
    LTE,
    // within |value|/10, inclusive
    NEAR,
    // within |value|/100000, inclusive
    VERY_NEAR
};

std::string toString(ChangeMode mode);

struct BalanceChange
{
    AccountID account;
    TokenID token;
    ChangeMode mode{ChangeMode::EQUAL};
    int256 value;
};

// Checks each listed change against the diff. Any other token the diff
// covers for an account named in `changes` must not have moved.
std::string checkBalanceChanges(BalanceDiff const& actual,
                                std::vector<BalanceChange> const& changes);

uint256 const& DEFAULT_PCT_ERROR();

// passes when actual is within expected * pctError / 1e18 of expected
std::string expectEqualWithError(uint256 const& actual,
                                 uint256 const& expected,
                                 uint256 const& pctError = DEFAULT_PCT_ERROR());

// passes when actual <= expected and actual is within the same error
std::string
expectLessThanOrEqualWithError(uint256 const& actual, uint256 const& expected,
                               uint256 const& pctError = DEFAULT_PCT_ERROR());
}
