// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/ConstantProductPool.h"
#include "util/FixedPoint.h"

namespace vaultcheck
{

static void
checkTwoTokens(std::vector<uint256> const& balances)
{
    if (balances.size() != 2)
    {
        throw PoolMathError("constant product pools hold exactly two tokens");
    }
}

uint256
ConstantProductPool::computeInvariant(std::vector<uint256> const& balances,
                                      Rounding rounding) const
{
    checkTwoTokens(balances);
    return bigSquareRoot(balances[0], balances[1], rounding);
}

uint256
ConstantProductPool::computeBalance(std::vector<uint256> const& balances,
                                    size_t tokenIndex,
                                    uint256 const& invariantRatio) const
{
    checkTwoTokens(balances);
    auto const& other = balances.at(1 - tokenIndex);
    if (other == 0)
    {
        throw PoolMathError("cannot compute balance against an empty token");
    }
    auto newInvariant = FixedPoint::mulUp(
        computeInvariant(balances, ROUND_UP), invariantRatio);
    // newBalance * other >= newInvariant^2
    return bigDivideOrThrow(newInvariant, newInvariant, other, ROUND_UP);
}

uint256
ConstantProductPool::onSwap(SwapKind kind, std::vector<uint256> const& balances,
                            size_t indexIn, size_t indexOut,
                            uint256 const& amountGiven) const
{
    checkTwoTokens(balances);
    if (indexIn > 1 || indexOut > 1 || indexIn == indexOut)
    {
        throw std::out_of_range("swap token index out of range");
    }
    auto const& balanceIn = balances[indexIn];
    auto const& balanceOut = balances[indexOut];
    if (kind == SwapKind::EXACT_IN)
    {
        // out = y * dx / (x + dx)
        return bigDivideOrThrow(balanceOut, amountGiven,
                                add(balanceIn, amountGiven), ROUND_DOWN);
    }
    if (amountGiven >= balanceOut)
    {
        throw PoolMathError("exact out swap drains the pool");
    }
    // in = x * dy / (y - dy)
    return bigDivideOrThrow(balanceIn, amountGiven, balanceOut - amountGiven,
                            ROUND_UP);
}

uint256
ConstantProductPool::getMinimumInvariantRatio() const
{
    return FixedPoint::ONE() * 7 / 10;
}

uint256
ConstantProductPool::getMaximumInvariantRatio() const
{
    return FixedPoint::ONE() * 3;
}

InvariantKind
ConstantProductPool::getKind() const
{
    return InvariantKind::CONSTANT_PRODUCT;
}
}
