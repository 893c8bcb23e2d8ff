// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/BasePoolMath.h"
#include "util/FixedPoint.h"

#include <fmt/format.h>

namespace vaultcheck
{

using namespace FixedPoint;

InvariantRatioOutOfRange::InvariantRatioOutOfRange(bool aboveMax,
                                                   uint256 const& ratio,
                                                   uint256 const& bound)
    : std::runtime_error(
          fmt::format(FMT_STRING("invariant ratio {} {} {}"), ratio,
                      aboveMax ? "above maximum" : "below minimum", bound))
    , mAboveMax(aboveMax)
    , mRatio(ratio)
    , mBound(bound)
{
}

namespace BasePoolMath
{

static void
ensureMaxRatio(uint256 const& ratio, uint256 const& maxRatio)
{
    if (ratio > maxRatio)
    {
        throw InvariantRatioOutOfRange(true, ratio, maxRatio);
    }
}

static void
ensureMinRatio(uint256 const& ratio, uint256 const& minRatio)
{
    if (ratio < minRatio)
    {
        throw InvariantRatioOutOfRange(false, ratio, minRatio);
    }
}

std::vector<uint256>
computeProportionalAmountsIn(std::vector<uint256> const& balances,
                             uint256 const& totalSupply,
                             uint256 const& bptAmountOut)
{
    std::vector<uint256> amountsIn;
    amountsIn.reserve(balances.size());
    for (auto const& b : balances)
    {
        amountsIn.emplace_back(mulDivUp(b, bptAmountOut, totalSupply));
    }
    return amountsIn;
}

std::vector<uint256>
computeProportionalAmountsOut(std::vector<uint256> const& balances,
                              uint256 const& totalSupply,
                              uint256 const& bptAmountIn)
{
    std::vector<uint256> amountsOut;
    amountsOut.reserve(balances.size());
    for (auto const& b : balances)
    {
        amountsOut.emplace_back(mulDivDown(b, bptAmountIn, totalSupply));
    }
    return amountsOut;
}

LiquidityResult
computeAddLiquidityUnbalanced(PoolInvariant const& pool,
                              std::vector<uint256> const& currentBalances,
                              std::vector<uint256> const& exactAmounts,
                              uint256 const& totalSupply,
                              uint256 const& swapFee,
                              uint256 const& maxInvariantRatio)
{
    size_t n = currentBalances.size();
    if (exactAmounts.size() != n)
    {
        throw std::invalid_argument("amounts do not match pool tokens");
    }

    LiquidityResult res;
    res.swapFeeAmounts.assign(n, 0);

    // one wei less per token so that rounding inside the invariant can
    // never mint more than was paid
    std::vector<uint256> newBalances(n);
    for (size_t i = 0; i < n; ++i)
    {
        newBalances[i] = sub(add(currentBalances[i], exactAmounts[i]), 1);
    }

    auto currentInvariant = pool.computeInvariant(currentBalances, ROUND_UP);
    auto newInvariant = pool.computeInvariant(newBalances, ROUND_DOWN);
    auto invariantRatio = divDown(newInvariant, currentInvariant);
    ensureMaxRatio(invariantRatio, maxInvariantRatio);

    // Amounts above the proportional share behave like a swap and pay the
    // swap fee.
    for (size_t i = 0; i < n; ++i)
    {
        auto proportional = mulDown(invariantRatio, currentBalances[i]);
        if (newBalances[i] > proportional)
        {
            auto taxable = newBalances[i] - proportional;
            res.swapFeeAmounts[i] = mulUp(taxable, swapFee);
            newBalances[i] = sub(newBalances[i], res.swapFeeAmounts[i]);
        }
    }

    auto invariantWithFees = pool.computeInvariant(newBalances, ROUND_DOWN);
    if (invariantWithFees > currentInvariant)
    {
        res.amount = mulDivDown(totalSupply,
                                invariantWithFees - currentInvariant,
                                currentInvariant);
    }
    return res;
}

LiquidityResult
computeAddLiquiditySingleTokenExactOut(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenInIndex, uint256 const& exactBptAmountOut,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& maxInvariantRatio)
{
    LiquidityResult res;
    res.swapFeeAmounts.assign(currentBalances.size(), 0);

    auto newSupply = add(exactBptAmountOut, totalSupply);
    auto invariantRatio = divUp(newSupply, totalSupply);
    ensureMaxRatio(invariantRatio, maxInvariantRatio);

    auto const& current = currentBalances.at(tokenInIndex);
    auto newBalance =
        pool.computeBalance(currentBalances, tokenInIndex, invariantRatio);
    auto amountIn = sub(newBalance, current);

    // the part of the new balance beyond the proportional one is taxed as a
    // swap, the fee grossed up so that it is charged on the gross amount
    auto nonTaxable = mulDivUp(newSupply, current, totalSupply);
    uint256 taxable =
        newBalance > nonTaxable ? newBalance - nonTaxable : uint256(0);
    auto fee = sub(divUp(taxable, complement(swapFee)), taxable);

    res.swapFeeAmounts[tokenInIndex] = fee;
    res.amount = add(amountIn, fee);
    return res;
}

LiquidityResult
computeRemoveLiquiditySingleTokenExactIn(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenOutIndex, uint256 const& exactBptAmountIn,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& minInvariantRatio)
{
    LiquidityResult res;
    res.swapFeeAmounts.assign(currentBalances.size(), 0);

    auto newSupply = sub(totalSupply, exactBptAmountIn);
    auto invariantRatio = divUp(newSupply, totalSupply);
    ensureMinRatio(invariantRatio, minInvariantRatio);

    auto const& current = currentBalances.at(tokenOutIndex);
    auto newBalance =
        pool.computeBalance(currentBalances, tokenOutIndex, invariantRatio);
    if (newBalance > current)
    {
        throw PoolMathError("bpt amount in is too small to price");
    }
    auto amountOut = current - newBalance;

    auto newBalanceBeforeTax = mulDivUp(newSupply, current, totalSupply);
    uint256 taxable = newBalanceBeforeTax > newBalance
                          ? newBalanceBeforeTax - newBalance
                          : uint256(0);
    auto fee = mulUp(taxable, swapFee);

    res.swapFeeAmounts[tokenOutIndex] = fee;
    res.amount = sub(amountOut, fee);
    return res;
}

LiquidityResult
computeRemoveLiquiditySingleTokenExactOut(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenOutIndex, uint256 const& exactAmountOut,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& minInvariantRatio)
{
    LiquidityResult res;
    res.swapFeeAmounts.assign(currentBalances.size(), 0);

    auto newBalances = currentBalances;
    newBalances.at(tokenOutIndex) =
        sub(newBalances[tokenOutIndex], exactAmountOut);

    auto currentInvariant = pool.computeInvariant(currentBalances, ROUND_UP);
    auto invariantRatio =
        divUp(pool.computeInvariant(newBalances, ROUND_UP), currentInvariant);
    ensureMinRatio(invariantRatio, minInvariantRatio);

    auto taxable = sub(mulUp(invariantRatio, currentBalances[tokenOutIndex]),
                       newBalances[tokenOutIndex]);
    auto fee = sub(divUp(taxable, complement(swapFee)), taxable);
    newBalances[tokenOutIndex] = sub(newBalances[tokenOutIndex], fee);

    auto invariantWithFees = pool.computeInvariant(newBalances, ROUND_DOWN);

    res.swapFeeAmounts[tokenOutIndex] = fee;
    res.amount = mulDivUp(totalSupply, sub(currentInvariant, invariantWithFees),
                          currentInvariant);
    return res;
}
}
}
