#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolInvariant.h"

namespace vaultcheck
{

class InvariantRatioOutOfRange : public std::runtime_error
{
    bool mAboveMax;
    uint256 mRatio;
    uint256 mBound;

  public:
    InvariantRatioOutOfRange(bool aboveMax, uint256 const& ratio,
                             uint256 const& bound);

    bool
    isAboveMax() const
    {
        return mAboveMax;
    }
    uint256 const&
    getRatio() const
    {
        return mRatio;
    }
    uint256 const&
    getBound() const
    {
        return mBound;
    }
};

// Liquidity math shared by every pool type, expressed in terms of the
// pool's invariant. Rounding always favors the pool: amounts the user pays
// round up, amounts the user receives round down.
namespace BasePoolMath
{

struct LiquidityResult
{
    // BPT out, token amount in, token amount out or BPT in, depending on the
    // operation
    uint256 amount;
    std::vector<uint256> swapFeeAmounts;
};

std::vector<uint256>
computeProportionalAmountsIn(std::vector<uint256> const& balances,
                             uint256 const& totalSupply,
                             uint256 const& bptAmountOut);

std::vector<uint256>
computeProportionalAmountsOut(std::vector<uint256> const& balances,
                              uint256 const& totalSupply,
                              uint256 const& bptAmountIn);

// amount is the BPT out
LiquidityResult computeAddLiquidityUnbalanced(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    std::vector<uint256> const& exactAmounts, uint256 const& totalSupply,
    uint256 const& swapFee, uint256 const& maxInvariantRatio);

// amount is the token amount in, fee included
LiquidityResult computeAddLiquiditySingleTokenExactOut(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenInIndex, uint256 const& exactBptAmountOut,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& maxInvariantRatio);

// amount is the token amount out, fee deducted
LiquidityResult computeRemoveLiquiditySingleTokenExactIn(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenOutIndex, uint256 const& exactBptAmountIn,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& minInvariantRatio);

// amount is the BPT in
LiquidityResult computeRemoveLiquiditySingleTokenExactOut(
    PoolInvariant const& pool, std::vector<uint256> const& currentBalances,
    size_t tokenOutIndex, uint256 const& exactAmountOut,
    uint256 const& totalSupply, uint256 const& swapFee,
    uint256 const& minInvariantRatio);
}
}
