#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <stdexcept>
#include <string>

namespace vaultcheck
{
namespace mp = boost::multiprecision;

// Token amounts are unsigned 256-bit integers in a token's minor units.
// Intermediate products use 512 bits so that A*B/C never loses precision.
// int256 is sign-magnitude, it holds the difference of any two uint256.
typedef mp::number<mp::cpp_int_backend<256, 256, mp::unsigned_magnitude,
                                       mp::unchecked, void>,
                   mp::et_off>
    uint256;
typedef mp::number<mp::cpp_int_backend<512, 512, mp::unsigned_magnitude,
                                       mp::unchecked, void>,
                   mp::et_off>
    uint512;
typedef mp::number<mp::cpp_int_backend<256, 256, mp::signed_magnitude,
                                       mp::unchecked, void>,
                   mp::et_off>
    int256;

enum Rounding
{
    ROUND_DOWN,
    ROUND_UP
};

class ArithmeticOverflow : public std::overflow_error
{
  public:
    explicit ArithmeticOverflow(std::string const& msg)
        : std::overflow_error(msg)
    {
    }
};

class ArithmeticUnderflow : public std::underflow_error
{
  public:
    explicit ArithmeticUnderflow(std::string const& msg)
        : std::underflow_error(msg)
    {
    }
};

uint256 const& maxUint256();

// no throw versions, return true if result is valid; addUnsigned and
// subUnsigned leave result untouched otherwise
bool addUnsigned(uint256& result, uint256 const& a, uint256 const& b);
bool subUnsigned(uint256& result, uint256 const& a, uint256 const& b);
bool bigMultiply(uint256& result, uint256 const& a, uint256 const& b);

// throw ArithmeticOverflow / ArithmeticUnderflow
uint256 add(uint256 const& a, uint256 const& b);
uint256 sub(uint256 const& a, uint256 const& b);
uint256 mul(uint256 const& a, uint256 const& b);

// a*b, or cap when the product does not fit in 256 bits
uint256 saturatingMultiply(uint256 const& a, uint256 const& b,
                           uint256 const& cap);

// calculates A*B/C with a 512-bit intermediate
bool bigDivide(uint256& result, uint256 const& A, uint256 const& B,
               uint256 const& C, Rounding rounding);
uint256 bigDivideOrThrow(uint256 const& A, uint256 const& B, uint256 const& C,
                         Rounding rounding);

// floor or ceil of sqrt(a*b)
uint256 bigSquareRoot(uint256 const& a, uint256 const& b, Rounding rounding);

// after - before, never wraps
int256 delta(uint256 const& before, uint256 const& after);
uint256 absValue(int256 const& v);
int256 toSigned(uint256 const& v);

// Accepts plain decimal ("1500") or mantissa/exponent ("1.5e18", "1000e18").
// Throws std::invalid_argument on malformed input or a fractional result.
uint256 amountFromString(std::string const& s);
}

template <> struct fmt::formatter<vaultcheck::uint256> : fmt::ostream_formatter
{
};
template <> struct fmt::formatter<vaultcheck::int256> : fmt::ostream_formatter
{
};
