// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/FixedPoint.h"

namespace vaultcheck
{
namespace FixedPoint
{

uint256 const&
ONE()
{
    static uint256 const one = pow10(18);
    return one;
}

uint256
mulDown(uint256 const& a, uint256 const& b)
{
    return bigDivideOrThrow(a, b, ONE(), ROUND_DOWN);
}

uint256
mulUp(uint256 const& a, uint256 const& b)
{
    return mulDivUp(a, b, ONE());
}

uint256
divDown(uint256 const& a, uint256 const& b)
{
    return bigDivideOrThrow(a, ONE(), b, ROUND_DOWN);
}

uint256
divUp(uint256 const& a, uint256 const& b)
{
    return mulDivUp(a, ONE(), b);
}

uint256
mulDivDown(uint256 const& a, uint256 const& b, uint256 const& c)
{
    return bigDivideOrThrow(a, b, c, ROUND_DOWN);
}

uint256
mulDivUp(uint256 const& a, uint256 const& b, uint256 const& c)
{
    if (c == 0)
    {
        throw std::domain_error("division by zero in mulDivUp");
    }
    if (a == 0 || b == 0)
    {
        return 0;
    }
    return bigDivideOrThrow(a, b, c, ROUND_UP);
}

uint256
complement(uint256 const& x)
{
    return x < ONE() ? ONE() - x : uint256(0);
}

uint256
powDown(uint256 const& x, unsigned n)
{
    uint256 res = ONE();
    for (unsigned i = 0; i < n; ++i)
    {
        res = mulDown(res, x);
    }
    return res;
}

uint256
pow10(unsigned exponent)
{
    uint256 res = 1;
    for (unsigned i = 0; i < exponent; ++i)
    {
        res = mul(res, 10);
    }
    return res;
}

uint256
fp(uint64_t units, unsigned decimals)
{
    return mul(uint256(units), pow10(decimals));
}
}
}
