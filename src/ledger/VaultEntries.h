#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vaultcheck
{
typedef std::string TokenID;
typedef std::string AccountID;
typedef std::string PoolID;

// Account holding the reserves of every pool and buffer.
extern AccountID const VAULT_ACCOUNT;
// Receives the minimum BPT supply locked on pool initialization.
extern AccountID const ZERO_ACCOUNT;

enum class InvariantKind
{
    LINEAR,
    CONSTANT_PRODUCT
};

struct TokenEntry
{
    TokenID id;
    uint32_t decimals{18};
};

// ERC4626 style vault share. The wrapper's own account (named after the
// token) holds the underlying assets it was given.
struct WrappedTokenEntry
{
    TokenID id;
    TokenID underlying;
    uint256 totalAssets;
    uint256 totalShares;
};

struct AccountEntry
{
    AccountID id;
    std::map<TokenID, uint256> balances;
    uint256 nativeBalance;
};

struct PoolEntry
{
    PoolID id;
    InvariantKind kind{InvariantKind::LINEAR};
    std::vector<TokenID> tokens;
    std::vector<uint256> balancesRaw;
    uint256 totalSupply;
    uint256 swapFee;
    uint256 minSwapFee;
    uint256 maxSwapFee;
    uint256 minInvariantRatio;
    uint256 maxInvariantRatio;
    bool initialized{false};
};

struct BufferEntry
{
    TokenID wrapped;
    TokenID underlying;
    uint256 underlyingBalance;
    uint256 wrappedBalance;
    uint256 totalShares;
    std::map<AccountID, uint256> shares;
    bool initialized{false};
};

// tokens, raw balances and balances scaled to 18 decimals at the current
// token rates (rounded down)
struct PoolTokenInfo
{
    std::vector<TokenID> tokens;
    std::vector<uint256> balancesRaw;
    std::vector<uint256> balancesLiveScaled18;
    std::vector<uint256> scalingFactors;
    std::vector<uint256> tokenRates;
};

std::string toString(InvariantKind kind);
}
