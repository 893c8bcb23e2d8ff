// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "util/FixedPoint.h"
#include "util/Math.h"
#include "util/numeric.h"

using namespace vaultcheck;

TEST_CASE("checked arithmetic", "[numeric]")
{
    auto const& MAX = maxUint256();

    SECTION("add")
    {
        REQUIRE(add(2, 3) == 5);
        REQUIRE(add(MAX - 1, 1) == MAX);
        REQUIRE_THROWS_AS(add(MAX, 1), ArithmeticOverflow);

        uint256 res = 7;
        REQUIRE(!addUnsigned(res, MAX, 2));
        REQUIRE(res == 7);
    }

    SECTION("sub")
    {
        REQUIRE(sub(5, 3) == 2);
        REQUIRE(sub(MAX, MAX) == 0);
        REQUIRE_THROWS_AS(sub(1, 2), ArithmeticUnderflow);

        uint256 res = 7;
        REQUIRE(!subUnsigned(res, 0, 1));
        REQUIRE(res == 7);
    }

    SECTION("mul")
    {
        REQUIRE(mul(6, 7) == 42);
        REQUIRE(mul(MAX, 1) == MAX);
        REQUIRE(mul(MAX, 0) == 0);
        REQUIRE_THROWS_AS(mul(MAX, 2), ArithmeticOverflow);
        REQUIRE_THROWS_AS(mul(MAX / 2 + 1, 2), ArithmeticOverflow);
    }

    SECTION("saturating multiply")
    {
        REQUIRE(saturatingMultiply(3, 4, 100) == 12);
        REQUIRE(saturatingMultiply(30, 4, 100) == 100);
        REQUIRE(saturatingMultiply(MAX, 2, 100) == 100);
        REQUIRE(saturatingMultiply(MAX, 2, MAX) == MAX);
    }
}

TEST_CASE("big divide", "[numeric][bigDivide]")
{
    auto verify = [](uint256 const& a, uint256 const& b, uint256 const& c,
                     uint256 const& expectedDown,
                     uint256 const& expectedUp) {
        uint256 res;
        REQUIRE(bigDivide(res, a, b, c, ROUND_DOWN));
        REQUIRE(res == expectedDown);
        REQUIRE(bigDivide(res, a, b, c, ROUND_UP));
        REQUIRE(res == expectedUp);
        REQUIRE(bigDivideOrThrow(a, b, c, ROUND_DOWN) == expectedDown);
        REQUIRE(bigDivideOrThrow(a, b, c, ROUND_UP) == expectedUp);
    };

    auto const& MAX = maxUint256();

    SECTION("exact")
    {
        verify(6, 4, 3, 8, 8);
        verify(0, MAX, 1, 0, 0);
        verify(MAX, 1, 1, MAX, MAX);
    }

    SECTION("rounding")
    {
        verify(7, 3, 2, 10, 11);
        verify(1, 1, 3, 0, 1);
        verify(MAX, 2, 7, MAX / 7 * 2, MAX / 7 * 2 + 1);
    }

    SECTION("intermediate product wider than 256 bits")
    {
        verify(MAX, MAX, MAX, MAX, MAX);
        verify(MAX, 10, 100, MAX / 10, MAX / 10 + 1);
    }

    SECTION("overflowing result")
    {
        uint256 res;
        REQUIRE(!bigDivide(res, MAX, 2, 1, ROUND_DOWN));
        REQUIRE_THROWS_AS(bigDivideOrThrow(MAX, 2, 1, ROUND_DOWN),
                          ArithmeticOverflow);
        REQUIRE(bigDivide(res, MAX, 1, 1, ROUND_UP));
        REQUIRE(res == MAX);
    }

    SECTION("division by zero")
    {
        uint256 res = 7;
        REQUIRE(!bigDivide(res, 1, 1, 0, ROUND_DOWN));
        REQUIRE(res == 7);
        REQUIRE_THROWS_AS(bigDivideOrThrow(1, 1, 0, ROUND_UP),
                          std::domain_error);
    }
}

TEST_CASE("big square root", "[numeric]")
{
    REQUIRE(bigSquareRoot(4, 9, ROUND_DOWN) == 6);
    REQUIRE(bigSquareRoot(4, 9, ROUND_UP) == 6);
    REQUIRE(bigSquareRoot(2, 1, ROUND_DOWN) == 1);
    REQUIRE(bigSquareRoot(2, 1, ROUND_UP) == 2);
    REQUIRE(bigSquareRoot(0, 5, ROUND_UP) == 0);

    auto const& MAX = maxUint256();
    REQUIRE(bigSquareRoot(MAX, MAX, ROUND_DOWN) == MAX);
    REQUIRE(bigSquareRoot(MAX, MAX, ROUND_UP) == MAX);

    auto one = FixedPoint::ONE();
    REQUIRE(bigSquareRoot(4 * one, 9 * one, ROUND_DOWN) == 6 * one);
}

TEST_CASE("signed deltas", "[numeric]")
{
    REQUIRE(delta(3, 5) == 2);
    REQUIRE(delta(5, 3) == -2);
    REQUIRE(delta(5, 5) == 0);
    REQUIRE(absValue(int256(-2)) == 2);
    REQUIRE(absValue(int256(2)) == 2);

    auto const& MAX = maxUint256();
    REQUIRE(delta(0, MAX) == toSigned(MAX));
    REQUIRE(delta(MAX, 0) == -toSigned(MAX));
    REQUIRE(absValue(delta(MAX, 0)) == MAX);
}

TEST_CASE("amounts from strings", "[numeric]")
{
    SECTION("plain integers")
    {
        REQUIRE(amountFromString("0") == 0);
        REQUIRE(amountFromString("42") == 42);
        REQUIRE(amountFromString("1_000_000") == 1000000);
    }

    SECTION("exponents")
    {
        REQUIRE(amountFromString("1000e18") == FixedPoint::fp(1000));
        REQUIRE(amountFromString("1.5e18") == FixedPoint::fp(15, 17));
        REQUIRE(amountFromString("4E4") == 40000);
        REQUIRE(amountFromString("0.000001e6") == 1);
    }

    SECTION("malformed")
    {
        for (auto s : {"", "abc", "1.5", "1e", "1e100", "1.2.3e5", "-1",
                       "0x10", "1e1e1"})
        {
            INFO(s);
            REQUIRE_THROWS_AS(amountFromString(s), std::invalid_argument);
        }
    }

    SECTION("too large")
    {
        REQUIRE_THROWS_AS(amountFromString("1e78"), ArithmeticOverflow);
        REQUIRE_NOTHROW(amountFromString("1e77"));
    }
}

TEST_CASE("random words are reproducible", "[numeric]")
{
    vaultcheck_default_random_engine a(17);
    vaultcheck_default_random_engine b(17);
    for (int i = 0; i < 16; ++i)
    {
        REQUIRE(rand_uint256(a) == rand_uint256(b));
    }

    vaultcheck_default_random_engine c(18);
    bool differs = false;
    for (int i = 0; i < 16; ++i)
    {
        differs = differs || rand_uint256(a) != rand_uint256(c);
    }
    REQUIRE(differs);
}
