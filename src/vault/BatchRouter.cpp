// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/BatchRouter.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace vaultcheck
{

namespace
{
VaultResult<size_t>
tokenIndex(VaultStateReader const& state, PoolID const& pool,
           TokenID const& token)
{
    if (!state.hasPool(pool))
    {
        return VaultError::make(
            VaultErrorCode::POOL_NOT_REGISTERED,
            fmt::format(FMT_STRING("pool {} is not registered"), pool));
    }
    auto tokens = state.getPoolTokenInfo(pool).tokens;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        if (tokens[i] == token)
        {
            return i;
        }
    }
    return VaultError::make(
        VaultErrorCode::TOKEN_NOT_REGISTERED,
        fmt::format(FMT_STRING("token {} is not in pool {}"), token, pool));
}

void
addTotal(BatchSwapResult& result, TokenID const& token, uint256 const& amount)
{
    for (size_t i = 0; i < result.tokens.size(); ++i)
    {
        if (result.tokens[i] == token)
        {
            result.amounts[i] = add(result.amounts[i], amount);
            return;
        }
    }
    result.tokens.emplace_back(token);
    result.amounts.emplace_back(amount);
}
}

BatchRouter::BatchRouter(Vault& vault) : mVault(vault)
{
}

VaultResult<uint256>
BatchRouter::runStep(SwapKind kind, SwapPathStep const& step,
                     TokenID const& tokenIn, uint256 const& amountGiven,
                     AccountID const& sender, bool wethIsEth)
{
    bool exactIn = kind == SwapKind::EXACT_IN;
    if (step.isBuffer)
    {
        BufferWrapOrUnwrapParams params;
        params.kind = kind;
        params.direction = step.tokenOut == step.pool
                               ? WrappingDirection::WRAP
                               : WrappingDirection::UNWRAP;
        params.wrappedToken = step.pool;
        params.amountGivenRaw = amountGiven;
        params.limitRaw = exactIn ? uint256(0) : maxUint256();
        params.sender = sender;
        auto res = mVault.erc4626BufferWrapOrUnwrap(params);
        if (!res)
        {
            return res.error();
        }
        return res.value().amountCalculated;
    }

    auto const& state = mVault.getState();
    if (tokenIn == step.pool)
    {
        auto index = tokenIndex(state, step.pool, step.tokenOut);
        if (!index)
        {
            return index.error();
        }
        RemoveLiquidityParams params;
        params.pool = step.pool;
        params.from = sender;
        params.minAmountsOut.assign(
            state.getPoolTokenInfo(step.pool).tokens.size(), 0);
        params.wethIsEth = wethIsEth;
        if (exactIn)
        {
            params.kind = RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN;
            params.maxBptAmountIn = amountGiven;
            // marks the token; the path limit is checked at the end
            params.minAmountsOut[index.value()] = 1;
        }
        else
        {
            params.kind = RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT;
            params.maxBptAmountIn = maxUint256();
            params.minAmountsOut[index.value()] = amountGiven;
        }
        auto res = mVault.removeLiquidity(params);
        if (!res)
        {
            return res.error();
        }
        return exactIn ? res.value().amountsOut[index.value()]
                       : res.value().bptAmountIn;
    }

    if (step.tokenOut == step.pool)
    {
        auto index = tokenIndex(state, step.pool, tokenIn);
        if (!index)
        {
            return index.error();
        }
        AddLiquidityParams params;
        params.pool = step.pool;
        params.to = sender;
        params.maxAmountsIn.assign(
            state.getPoolTokenInfo(step.pool).tokens.size(), 0);
        params.wethIsEth = wethIsEth;
        if (exactIn)
        {
            params.kind = AddLiquidityKind::SINGLE_TOKEN_EXACT_IN;
            params.maxAmountsIn[index.value()] = amountGiven;
            params.minBptAmountOut = 0;
        }
        else
        {
            params.kind = AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT;
            params.maxAmountsIn[index.value()] = maxUint256();
            params.minBptAmountOut = amountGiven;
        }
        auto res = mVault.addLiquidity(params);
        if (!res)
        {
            return res.error();
        }
        return exactIn ? res.value().bptAmountOut
                       : res.value().amountsIn[index.value()];
    }

    SwapParams params;
    params.kind = kind;
    params.pool = step.pool;
    params.tokenIn = tokenIn;
    params.tokenOut = step.tokenOut;
    params.amountGivenRaw = amountGiven;
    params.limitRaw = exactIn ? uint256(0) : maxUint256();
    params.sender = sender;
    params.wethIsEth = wethIsEth;
    auto res = mVault.swap(params);
    if (!res)
    {
        return res.error();
    }
    return res.value().amountCalculated;
}

VaultResult<uint256>
BatchRouter::runPathExactIn(SwapPath const& path, AccountID const& sender,
                            bool wethIsEth)
{
    uint256 amount = path.givenAmount;
    TokenID tokenIn = path.tokenIn;
    for (auto const& step : path.steps)
    {
        auto res = runStep(SwapKind::EXACT_IN, step, tokenIn, amount, sender,
                           wethIsEth);
        if (!res)
        {
            return res;
        }
        amount = res.value();
        tokenIn = step.tokenOut;
    }
    if (amount < path.limit)
    {
        return VaultError::insufficient(VaultErrorCode::SWAP_LIMIT, "",
                                        tokenIn, amount, path.limit);
    }
    return amount;
}

VaultResult<uint256>
BatchRouter::runPathExactOut(SwapPath const& path, AccountID const& sender,
                             bool wethIsEth)
{
    // last step first: each step is asked for what the next one consumes
    uint256 amount = path.givenAmount;
    for (size_t i = path.steps.size(); i-- > 0;)
    {
        auto const& tokenIn = i == 0 ? path.tokenIn : path.steps[i - 1].tokenOut;
        auto res = runStep(SwapKind::EXACT_OUT, path.steps[i], tokenIn, amount,
                           sender, wethIsEth);
        if (!res)
        {
            return res;
        }
        amount = res.value();
    }
    if (amount > path.limit)
    {
        return VaultError::insufficient(VaultErrorCode::SWAP_LIMIT, "",
                                        path.tokenIn, path.limit, amount);
    }
    return amount;
}

VaultResult<BatchSwapResult>
BatchRouter::run(SwapKind kind, std::vector<SwapPath> const& paths,
                 AccountID const& sender, bool wethIsEth, bool query)
{
    BatchSwapResult result;
    auto body = [&]() -> VaultStatus {
        result = BatchSwapResult{};
        for (auto const& path : paths)
        {
            if (path.steps.empty())
            {
                return VaultError::make(VaultErrorCode::INVALID_INPUT,
                                        "swap path has no steps");
            }
            auto res = kind == SwapKind::EXACT_IN
                           ? runPathExactIn(path, sender, wethIsEth)
                           : runPathExactOut(path, sender, wethIsEth);
            if (!res)
            {
                return res.error();
            }
            result.pathAmounts.emplace_back(res.value());
            addTotal(result,
                     kind == SwapKind::EXACT_IN ? path.steps.back().tokenOut
                                                : path.tokenIn,
                     res.value());
        }
        return vaultOk();
    };

    auto status =
        query ? mVault.queryBatch(sender, body) : mVault.batch(sender, body);
    if (!status)
    {
        CLOG_DEBUG(Vault, "batch swap {} of {} paths failed: {}",
                   toString(kind), paths.size(), status.error().toString());
        return status.error();
    }
    return result;
}

VaultResult<BatchSwapResult>
BatchRouter::swapExactIn(std::vector<SwapPath> const& paths,
                         AccountID const& sender, bool wethIsEth)
{
    return run(SwapKind::EXACT_IN, paths, sender, wethIsEth, false);
}

VaultResult<BatchSwapResult>
BatchRouter::swapExactOut(std::vector<SwapPath> const& paths,
                          AccountID const& sender, bool wethIsEth)
{
    return run(SwapKind::EXACT_OUT, paths, sender, wethIsEth, false);
}

VaultResult<BatchSwapResult>
BatchRouter::querySwapExactIn(std::vector<SwapPath> const& paths,
                              AccountID const& sender)
{
    return run(SwapKind::EXACT_IN, paths, sender, false, true);
}

VaultResult<BatchSwapResult>
BatchRouter::querySwapExactOut(std::vector<SwapPath> const& paths,
                               AccountID const& sender)
{
    return run(SwapKind::EXACT_OUT, paths, sender, false, true);
}
}
