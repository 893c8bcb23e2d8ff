// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"

#include <cctype>

namespace vaultcheck
{

namespace
{
uint512 const&
maxUint256Wide()
{
    static uint512 const m = uint512(maxUint256());
    return m;
}
}

uint256 const&
maxUint256()
{
    static uint256 const m = ~uint256(0);
    return m;
}

bool
addUnsigned(uint256& result, uint256 const& a, uint256 const& b)
{
    uint256 sum = a + b;
    if (sum < a)
    {
        return false;
    }
    result = sum;
    return true;
}

bool
subUnsigned(uint256& result, uint256 const& a, uint256 const& b)
{
    if (b > a)
    {
        return false;
    }
    result = a - b;
    return true;
}

bool
bigMultiply(uint256& result, uint256 const& a, uint256 const& b)
{
    uint512 x = uint512(a) * uint512(b);
    result = static_cast<uint256>(x);
    return x <= maxUint256Wide();
}

uint256
add(uint256 const& a, uint256 const& b)
{
    uint256 res;
    if (!addUnsigned(res, a, b))
    {
        throw ArithmeticOverflow(
            fmt::format(FMT_STRING("overflow while adding {} and {}"), a, b));
    }
    return res;
}

uint256
sub(uint256 const& a, uint256 const& b)
{
    uint256 res;
    if (!subUnsigned(res, a, b))
    {
        throw ArithmeticUnderflow(fmt::format(
            FMT_STRING("underflow while subtracting {} from {}"), b, a));
    }
    return res;
}

uint256
mul(uint256 const& a, uint256 const& b)
{
    uint256 res;
    if (!bigMultiply(res, a, b))
    {
        throw ArithmeticOverflow(fmt::format(
            FMT_STRING("overflow while multiplying {} by {}"), a, b));
    }
    return res;
}

uint256
saturatingMultiply(uint256 const& a, uint256 const& b, uint256 const& cap)
{
    uint256 res;
    if (!bigMultiply(res, a, b) || res > cap)
    {
        return cap;
    }
    return res;
}

bool
bigDivide(uint256& result, uint256 const& A, uint256 const& B,
          uint256 const& C, Rounding rounding)
{
    if (C == 0)
    {
        return false;
    }
    uint512 a(A);
    uint512 b(B);
    uint512 c(C);
    uint512 x = rounding == ROUND_DOWN ? (a * b) / c : (a * b + c - 1u) / c;

    result = static_cast<uint256>(x);
    return x <= maxUint256Wide();
}

uint256
bigDivideOrThrow(uint256 const& A, uint256 const& B, uint256 const& C,
                 Rounding rounding)
{
    uint256 res;
    if (C == 0)
    {
        throw std::domain_error("division by zero while performing bigDivide");
    }
    if (!bigDivide(res, A, B, C, rounding))
    {
        throw ArithmeticOverflow("overflow while performing bigDivide");
    }
    return res;
}

uint256
bigSquareRoot(uint256 const& a, uint256 const& b, Rounding rounding)
{
    uint512 p = uint512(a) * uint512(b);
    uint512 r = mp::sqrt(p);
    if (rounding == ROUND_UP && r * r < p)
    {
        ++r;
    }
    // sqrt of a 512-bit value always fits in 256 bits
    return static_cast<uint256>(r);
}

int256
toSigned(uint256 const& v)
{
    return int256(v);
}

int256
delta(uint256 const& before, uint256 const& after)
{
    if (after >= before)
    {
        return int256(after - before);
    }
    return -int256(before - after);
}

uint256
absValue(int256 const& v)
{
    return static_cast<uint256>(v < 0 ? int256(-v) : v);
}

uint256
amountFromString(std::string const& s)
{
    auto bad = [&]() {
        return std::invalid_argument(
            fmt::format(FMT_STRING("invalid amount '{}'"), s));
    };

    std::string mantissa = s;
    unsigned exponent = 0;
    auto e = s.find_first_of("eE");
    if (e != std::string::npos)
    {
        mantissa = s.substr(0, e);
        auto exp = s.substr(e + 1);
        if (exp.empty() || exp.size() > 2)
        {
            throw bad();
        }
        for (char c : exp)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                throw bad();
            }
        }
        exponent = static_cast<unsigned>(std::stoul(exp));
    }

    std::string digits;
    size_t fractional = 0;
    bool seenDot = false;
    for (char c : mantissa)
    {
        if (c == '.' && !seenDot)
        {
            seenDot = true;
        }
        else if (c == '_')
        {
            continue;
        }
        else if (std::isdigit(static_cast<unsigned char>(c)))
        {
            digits.push_back(c);
            if (seenDot)
            {
                ++fractional;
            }
        }
        else
        {
            throw bad();
        }
    }
    if (digits.empty() || fractional > exponent)
    {
        throw bad();
    }

    uint256 res = 0;
    for (char c : digits)
    {
        uint256 next;
        if (!bigMultiply(next, res, 10) ||
            !addUnsigned(next, next, static_cast<unsigned>(c - '0')))
        {
            throw ArithmeticOverflow(
                fmt::format(FMT_STRING("amount '{}' exceeds 256 bits"), s));
        }
        res = next;
    }
    for (size_t i = fractional; i < exponent; ++i)
    {
        res = mul(res, 10);
    }
    return res;
}
}
