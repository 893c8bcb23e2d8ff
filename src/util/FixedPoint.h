#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"

#include <cstdint>

namespace vaultcheck
{
// 18-decimal fixed point helpers. Every function throws ArithmeticOverflow if
// the result does not fit in 256 bits and std::domain_error on a zero
// divisor.
namespace FixedPoint
{
uint256 const& ONE();

uint256 mulDown(uint256 const& a, uint256 const& b);
uint256 mulUp(uint256 const& a, uint256 const& b);
uint256 divDown(uint256 const& a, uint256 const& b);
uint256 divUp(uint256 const& a, uint256 const& b);

uint256 mulDivDown(uint256 const& a, uint256 const& b, uint256 const& c);
// 0 if a*b is 0, otherwise (a*b - 1)/c + 1
uint256 mulDivUp(uint256 const& a, uint256 const& b, uint256 const& c);

// ONE - x, clamped at 0
uint256 complement(uint256 const& x);

// x^n rounded down at every step
uint256 powDown(uint256 const& x, unsigned n);

// units * 10^decimals, e.g. fp(1000) == 1000e18
uint256 fp(uint64_t units, unsigned decimals = 18);
uint256 pow10(unsigned exponent);
}
}
