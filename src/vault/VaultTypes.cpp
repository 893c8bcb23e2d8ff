// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/VaultTypes.h"

#include <fmt/format.h>

namespace vaultcheck
{

std::string
toString(AddLiquidityKind kind)
{
    switch (kind)
    {
    case AddLiquidityKind::PROPORTIONAL:
        return "PROPORTIONAL";
    case AddLiquidityKind::UNBALANCED:
        return "UNBALANCED";
    case AddLiquidityKind::SINGLE_TOKEN_EXACT_IN:
        return "SINGLE_TOKEN_EXACT_IN";
    case AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT:
        return "SINGLE_TOKEN_EXACT_OUT";
    }
    return "UNKNOWN";
}

std::string
toString(RemoveLiquidityKind kind)
{
    switch (kind)
    {
    case RemoveLiquidityKind::PROPORTIONAL:
        return "PROPORTIONAL";
    case RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN:
        return "SINGLE_TOKEN_EXACT_IN";
    case RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT:
        return "SINGLE_TOKEN_EXACT_OUT";
    }
    return "UNKNOWN";
}

std::string
toString(WrappingDirection direction)
{
    return direction == WrappingDirection::WRAP ? "WRAP" : "UNWRAP";
}

static char const*
operationTypeName(VaultOperationType type)
{
    switch (type)
    {
    case VaultOperationType::INITIALIZE:
        return "initialize";
    case VaultOperationType::ADD_LIQUIDITY:
        return "addLiquidity";
    case VaultOperationType::REMOVE_LIQUIDITY:
        return "removeLiquidity";
    case VaultOperationType::SWAP:
        return "swap";
    case VaultOperationType::BUFFER_LIQUIDITY:
        return "bufferLiquidity";
    case VaultOperationType::BUFFER_WRAP_UNWRAP:
        return "bufferWrapOrUnwrap";
    case VaultOperationType::BATCH:
        return "batch";
    }
    return "unknown";
}

std::string
VaultOperation::toString() const
{
    if (target.empty())
    {
        return fmt::format(FMT_STRING("{} by {}"), operationTypeName(type),
                           sender);
    }
    return fmt::format(FMT_STRING("{}({}) by {}"), operationTypeName(type),
                       target, sender);
}
}
