// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/LinearPool.h"
#include "util/FixedPoint.h"

namespace vaultcheck
{

uint256
LinearPool::computeInvariant(std::vector<uint256> const& balances,
                             Rounding) const
{
    uint256 sum = 0;
    for (auto const& b : balances)
    {
        sum = add(sum, b);
    }
    return sum;
}

uint256
LinearPool::computeBalance(std::vector<uint256> const& balances,
                           size_t tokenIndex,
                           uint256 const& invariantRatio) const
{
    auto invariant = computeInvariant(balances, ROUND_UP);
    auto newInvariant = FixedPoint::mulUp(invariant, invariantRatio);
    auto const& balance = balances.at(tokenIndex);
    auto raised = add(balance, newInvariant);
    if (raised < invariant)
    {
        throw InsufficientTokenBalance(balance, invariant - newInvariant);
    }
    return raised - invariant;
}

uint256
LinearPool::onSwap(SwapKind, std::vector<uint256> const& balances,
                   size_t indexIn, size_t indexOut,
                   uint256 const& amountGiven) const
{
    if (indexIn >= balances.size() || indexOut >= balances.size())
    {
        throw std::out_of_range("swap token index out of range");
    }
    return amountGiven;
}

uint256
LinearPool::getMinimumInvariantRatio() const
{
    return 0;
}

uint256
LinearPool::getMaximumInvariantRatio() const
{
    return maxUint256();
}

InvariantKind
LinearPool::getKind() const
{
    return InvariantKind::LINEAR;
}
}
