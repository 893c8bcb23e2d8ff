// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolInvariant.h"
#include "pool/ConstantProductPool.h"
#include "pool/LinearPool.h"

#include <fmt/format.h>

namespace vaultcheck
{

InsufficientTokenBalance::InsufficientTokenBalance(uint256 const& balance,
                                                   uint256 const& required)
    : PoolMathError(fmt::format(
          FMT_STRING("token balance {} cannot cover {}"), balance, required))
    , mBalance(balance)
    , mRequired(required)
{
}

std::unique_ptr<PoolInvariant>
makePoolInvariant(InvariantKind kind)
{
    switch (kind)
    {
    case InvariantKind::LINEAR:
        return std::make_unique<LinearPool>();
    case InvariantKind::CONSTANT_PRODUCT:
        return std::make_unique<ConstantProductPool>();
    }
    throw std::invalid_argument("unknown invariant kind");
}

std::string
toString(SwapKind kind)
{
    return kind == SwapKind::EXACT_IN ? "exact-in" : "exact-out";
}
}
