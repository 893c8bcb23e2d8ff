#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultEntries.h"
#include "util/numeric.h"

#include <memory>
#include <stdexcept>
#include <vector>

namespace vaultcheck
{

enum class SwapKind
{
    EXACT_IN,
    EXACT_OUT
};

std::string toString(SwapKind kind);

// The pool cannot price the request, e.g. an exact out swap asking for the
// whole balance. Distinct from arithmetic overflow.
class PoolMathError : public std::runtime_error
{
  public:
    explicit PoolMathError(std::string const& msg) : std::runtime_error(msg)
    {
    }
};

// A single token cannot supply the amount an invariant change asks of it.
class InsufficientTokenBalance : public PoolMathError
{
    uint256 mBalance;
    uint256 mRequired;

  public:
    InsufficientTokenBalance(uint256 const& balance, uint256 const& required);

    uint256 const&
    getBalance() const
    {
        return mBalance;
    }
    uint256 const&
    getRequired() const
    {
        return mRequired;
    }
};

// The pricing function of a pool. All balances and amounts are live balances
// scaled to 18 decimals.
class PoolInvariant
{
  public:
    virtual ~PoolInvariant()
    {
    }

    virtual uint256 computeInvariant(std::vector<uint256> const& balances,
                                     Rounding rounding) const = 0;

    // The balance token tokenIndex must reach so that the invariant is
    // multiplied by invariantRatio, the other balances unchanged. Rounds up.
    virtual uint256 computeBalance(std::vector<uint256> const& balances,
                                   size_t tokenIndex,
                                   uint256 const& invariantRatio) const = 0;

    // amount out for EXACT_IN, amount in for EXACT_OUT; the amount given
    // is net of swap fees
    virtual uint256 onSwap(SwapKind kind, std::vector<uint256> const& balances,
                           size_t indexIn, size_t indexOut,
                           uint256 const& amountGiven) const = 0;

    virtual uint256 getMinimumInvariantRatio() const = 0;
    virtual uint256 getMaximumInvariantRatio() const = 0;

    virtual InvariantKind getKind() const = 0;
};

std::unique_ptr<PoolInvariant> makePoolInvariant(InvariantKind kind);
}
