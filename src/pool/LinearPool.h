#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolInvariant.h"

namespace vaultcheck
{

// Invariant is the plain sum of balances and every swap is 1:1. Rounding
// never changes the invariant, which makes this pool the reference for exact
// accounting checks.
class LinearPool : public PoolInvariant
{
  public:
    uint256 computeInvariant(std::vector<uint256> const& balances,
                             Rounding rounding) const override;
    uint256 computeBalance(std::vector<uint256> const& balances,
                           size_t tokenIndex,
                           uint256 const& invariantRatio) const override;
    uint256 onSwap(SwapKind kind, std::vector<uint256> const& balances,
                   size_t indexIn, size_t indexOut,
                   uint256 const& amountGiven) const override;
    uint256 getMinimumInvariantRatio() const override;
    uint256 getMaximumInvariantRatio() const override;
    InvariantKind getKind() const override;
};
}
