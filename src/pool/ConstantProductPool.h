#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolInvariant.h"

namespace vaultcheck
{

// Two token x*y=k pool. The invariant is sqrt(x*y) so that it scales
// linearly with the balances, like a share price.
class ConstantProductPool : public PoolInvariant
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
