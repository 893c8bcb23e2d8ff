#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultEntries.h"
#include "pool/PoolInvariant.h"

#include <optional>
#include <string>
#include <vector>

namespace vaultcheck
{

enum class AddLiquidityKind
{
    PROPORTIONAL,
    UNBALANCED,
    SINGLE_TOKEN_EXACT_IN,
    SINGLE_TOKEN_EXACT_OUT
};

enum class RemoveLiquidityKind
{
    PROPORTIONAL,
    SINGLE_TOKEN_EXACT_IN,
    SINGLE_TOKEN_EXACT_OUT
};

enum class WrappingDirection
{
    WRAP,
    UNWRAP
};

std::string toString(AddLiquidityKind kind);
std::string toString(RemoveLiquidityKind kind);
std::string toString(WrappingDirection direction);

struct PoolConfig
{
    PoolID id;
    InvariantKind kind{InvariantKind::LINEAR};
    std::vector<TokenID> tokens;
    uint256 swapFee;
    uint256 minSwapFee;
    uint256 maxSwapFee;
    // default to the bounds of the invariant kind
    std::optional<uint256> minInvariantRatio;
    std::optional<uint256> maxInvariantRatio;
};

struct InitializeParams
{
    PoolID pool;
    AccountID sender;
    std::vector<uint256> exactAmountsIn;
    uint256 minBptAmountOut;
    bool wethIsEth{false};
};

// PROPORTIONAL and SINGLE_TOKEN_EXACT_OUT: minBptAmountOut is the exact BPT
// minted and maxAmountsIn the limits. UNBALANCED and SINGLE_TOKEN_EXACT_IN:
// maxAmountsIn are the exact amounts paid and minBptAmountOut the limit.
// Single token kinds take exactly one non-zero entry in maxAmountsIn.
struct AddLiquidityParams
{
    PoolID pool;
    AccountID to;
    std::vector<uint256> maxAmountsIn;
    uint256 minBptAmountOut;
    AddLiquidityKind kind{AddLiquidityKind::PROPORTIONAL};
    bool wethIsEth{false};
};

struct AddLiquidityResult
{
    std::vector<uint256> amountsIn;
    uint256 bptAmountOut;
};

// PROPORTIONAL and SINGLE_TOKEN_EXACT_IN: maxBptAmountIn is the exact BPT
// burned and minAmountsOut the limits. SINGLE_TOKEN_EXACT_OUT: the single
// non-zero entry of minAmountsOut is the exact amount received and
// maxBptAmountIn the limit.
struct RemoveLiquidityParams
{
    PoolID pool;
    AccountID from;
    uint256 maxBptAmountIn;
    std::vector<uint256> minAmountsOut;
    RemoveLiquidityKind kind{RemoveLiquidityKind::PROPORTIONAL};
    bool wethIsEth{false};
};

struct RemoveLiquidityResult
{
    uint256 bptAmountIn;
    std::vector<uint256> amountsOut;
};

struct SwapParams
{
    SwapKind kind{SwapKind::EXACT_IN};
    PoolID pool;
    TokenID tokenIn;
    TokenID tokenOut;
    uint256 amountGivenRaw;
    // minimum out for EXACT_IN, maximum in for EXACT_OUT
    uint256 limitRaw;
    AccountID sender;
    bool wethIsEth{false};
};

struct SwapResult
{
    uint256 amountCalculated;
    uint256 amountIn;
    uint256 amountOut;
};

struct BufferWrapOrUnwrapParams
{
    SwapKind kind{SwapKind::EXACT_IN};
    WrappingDirection direction{WrappingDirection::WRAP};
    TokenID wrappedToken;
    uint256 amountGivenRaw;
    uint256 limitRaw;
    AccountID sender;
};

typedef SwapResult BufferWrapOrUnwrapResult;

struct BufferLiquidityResult
{
    uint256 underlyingAmount;
    uint256 wrappedAmount;
    uint256 shares;
};

struct BufferBalance
{
    uint256 underlying;
    uint256 wrapped;
};

enum class VaultOperationType
{
    INITIALIZE,
    ADD_LIQUIDITY,
    REMOVE_LIQUIDITY,
    SWAP,
    BUFFER_LIQUIDITY,
    BUFFER_WRAP_UNWRAP,
    BATCH
};

// What the invariant manager is told about a committed operation.
struct VaultOperation
{
    VaultOperationType type;
    // pool id, or wrapped token id for buffer operations; empty for batches
    std::string target;
    AccountID sender;

    std::string toString() const;
};
}
