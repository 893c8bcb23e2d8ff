#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"

#include <stdexcept>
#include <vector>

// Maps raw fuzzer words onto amounts an operation can accept. Every function
// is pure: the same raw input always gives the same bounded output.

namespace vaultcheck
{

class UnboundableInput : public std::invalid_argument
{
  public:
    explicit UnboundableInput(std::string const& msg)
        : std::invalid_argument(msg)
    {
    }
};

// x itself when it is in [min, max]. Small values (<= 3) map to min + x and
// values within 3 of the maximum word map to max - (MAX - x), so that edge
// inputs land on edges of the range; everything else wraps modulo its size.
// Throws UnboundableInput when min > max.
uint256 bound(uint256 const& x, uint256 const& min, uint256 const& max);

// Bounds each balance into [min, max]. balance[i] for i >= 1 is also kept at
// or above balance[0] / maxSkew.
std::vector<uint256> boundBalances(std::vector<uint256> const& raw,
                                   uint256 const& min, uint256 const& max,
                                   uint256 const& maxSkew);

uint256 boundSwapFee(uint256 const& raw, uint256 const& poolMinFee,
                     uint256 const& poolMaxFee);

// An amount of one token that can be added to or removed from a balance of
// currentBalance without leaving [minRatio, maxRatio], and at most 100 times
// the balance. Caps that overflow saturate to that ceiling.
uint256 boundAmountForInvariantRatio(uint256 const& raw,
                                     uint256 const& currentBalance,
                                     uint256 const& minRatio,
                                     uint256 const& maxRatio,
                                     uint256 const& minAmount);

// BPT for a proportional add or remove, within the same ratio limits
// applied to totalSupply.
uint256 boundBptAmount(uint256 const& raw, uint256 const& totalSupply,
                       uint256 const& minRatio, uint256 const& maxRatio);

// [MINIMUM_TRADE_AMOUNT, balanceOut / 2]
uint256 boundSwapAmount(uint256 const& raw, uint256 const& balanceOut);
}
