#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/Vault.h"

#include <vector>

namespace vaultcheck
{

// One hop of a swap path. For a buffer step, pool is the wrapped token and
// the step wraps when tokenOut is the wrapped token, unwraps otherwise.
struct SwapPathStep
{
    PoolID pool;
    TokenID tokenOut;
    bool isBuffer{false};
};

// For EXACT_IN paths givenAmount is the exact amount of tokenIn and limit the
// minimum out of the last step; for EXACT_OUT paths givenAmount is the exact
// amount out of the last step and limit the maximum of tokenIn.
struct SwapPath
{
    TokenID tokenIn;
    std::vector<SwapPathStep> steps;
    uint256 givenAmount;
    uint256 limit;
};

struct BatchSwapResult
{
    // amount out (EXACT_IN) or in (EXACT_OUT) of every path, in path order
    std::vector<uint256> pathAmounts;
    // the same amounts summed per settlement token, in first-seen order
    std::vector<TokenID> tokens;
    std::vector<uint256> amounts;
};

// Runs multi-hop swap paths through a Vault as a single batch, so that only
// the net token movement is settled with the sender. A step whose tokenIn
// is the pool's BPT removes liquidity for a single token; a step whose
// tokenOut is the BPT adds single token liquidity.
class BatchRouter
{
    Vault& mVault;

    VaultResult<BatchSwapResult> run(SwapKind kind,
                                     std::vector<SwapPath> const& paths,
                                     AccountID const& sender, bool wethIsEth,
                                     bool query);

    VaultResult<uint256> runPathExactIn(SwapPath const& path,
                                        AccountID const& sender,
                                        bool wethIsEth);
    VaultResult<uint256> runPathExactOut(SwapPath const& path,
                                         AccountID const& sender,
                                         bool wethIsEth);

    VaultResult<uint256> runStep(SwapKind kind, SwapPathStep const& step,
                                 TokenID const& tokenIn,
                                 uint256 const& amountGiven,
                                 AccountID const& sender, bool wethIsEth);

  public:
    explicit BatchRouter(Vault& vault);

    VaultResult<BatchSwapResult>
    swapExactIn(std::vector<SwapPath> const& paths, AccountID const& sender,
                bool wethIsEth = false);
    VaultResult<BatchSwapResult>
    swapExactOut(std::vector<SwapPath> const& paths, AccountID const& sender,
                 bool wethIsEth = false);

    VaultResult<BatchSwapResult>
    querySwapExactIn(std::vector<SwapPath> const& paths,
                     AccountID const& sender);
    VaultResult<BatchSwapResult>
    querySwapExactOut(std::vector<SwapPath> const& paths,
                      AccountID const& sender);
};
}
