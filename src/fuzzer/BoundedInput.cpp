// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/BoundedInput.h"
#include "util/FixedPoint.h"
#include "vault/VaultImpl.h"

#include <algorithm>
#include <fmt/format.h>

namespace vaultcheck
{

uint256
bound(uint256 const& x, uint256 const& min, uint256 const& max)
{
    if (min > max)
    {
        throw UnboundableInput(fmt::format(
            FMT_STRING("cannot bound into [{}, {}]"), min, max));
    }
    if (x >= min && x <= max)
    {
        return x;
    }

    // min == 0 && max == MAX returned above, so size cannot wrap
    uint256 size = max - min + 1;
    auto const& MAX = maxUint256();

    if (x <= 3 && size > x)
    {
        return min + x;
    }
    if (x >= MAX - 3 && size > MAX - x)
    {
        return max - (MAX - x);
    }

    if (x > max)
    {
        uint256 rem = (x - max) % size;
        return rem.is_zero() ? max : min + rem - 1;
    }
    uint256 rem = (min - x) % size;
    return rem.is_zero() ? min : max - rem + 1;
}

std::vector<uint256>
boundBalances(std::vector<uint256> const& raw, uint256 const& min,
              uint256 const& max, uint256 const& maxSkew)
{
    if (maxSkew.is_zero())
    {
        throw UnboundableInput("balance skew must be positive");
    }
    std::vector<uint256> res;
    res.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
    {
        if (i == 0)
        {
            res.emplace_back(bound(raw[i], min, max));
        }
        else
        {
            auto floor = std::max(min, res[0] / maxSkew);
            res.emplace_back(bound(raw[i], floor, max));
        }
    }
    return res;
}

uint256
boundSwapFee(uint256 const& raw, uint256 const& poolMinFee,
             uint256 const& poolMaxFee)
{
    return bound(raw, poolMinFee, poolMaxFee);
}

namespace
{
// the largest amount that keeps value * ratio within limits, or ceiling
uint256
ratioCap(uint256 const& value, uint256 const& minRatio,
         uint256 const& maxRatio, uint256 const& ceiling)
{
    uint256 addCap = ceiling;
    uint256 grown;
    if (bigDivide(grown, value, maxRatio, FixedPoint::ONE(), ROUND_DOWN))
    {
        uint256 headroom;
        if (subUnsigned(headroom, grown, value))
        {
            addCap = std::min(headroom, ceiling);
        }
        else
        {
            addCap = 0;
        }
    }

    uint256 shrunk;
    uint256 removeCap = 0;
    if (bigDivide(shrunk, value, minRatio, FixedPoint::ONE(), ROUND_UP))
    {
        if (!subUnsigned(removeCap, value, shrunk))
        {
            removeCap = 0;
        }
    }
    return std::min(addCap, removeCap);
}
}

uint256
boundAmountForInvariantRatio(uint256 const& raw, uint256 const& currentBalance,
                             uint256 const& minRatio, uint256 const& maxRatio,
                             uint256 const& minAmount)
{
    auto ceiling = saturatingMultiply(currentBalance, 100, maxUint256());
    auto cap = ratioCap(currentBalance, minRatio, maxRatio, ceiling);
    if (cap < minAmount)
    {
        throw UnboundableInput(fmt::format(
            FMT_STRING("balance {} leaves no amount in [{}, {}]"),
            currentBalance, minAmount, cap));
    }
    return bound(raw, minAmount, cap);
}

uint256
boundBptAmount(uint256 const& raw, uint256 const& totalSupply,
               uint256 const& minRatio, uint256 const& maxRatio)
{
    return boundAmountForInvariantRatio(raw, totalSupply, minRatio, maxRatio,
                                        MINIMUM_TRADE_AMOUNT);
}

uint256
boundSwapAmount(uint256 const& raw, uint256 const& balanceOut)
{
    return bound(raw, MINIMUM_TRADE_AMOUNT, balanceOut / 2);
}
}
