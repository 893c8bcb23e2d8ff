// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/BoundedInput.h"
#include "test/Catch2.h"
#include "util/FixedPoint.h"
#include "util/Math.h"
#include "vault/VaultImpl.h"

using namespace vaultcheck;
using FixedPoint::fp;

TEST_CASE("bound", "[bound]")
{
    auto const& MAX = maxUint256();

    SECTION("values in range are kept")
    {
        REQUIRE(bound(5, 1, 10) == 5);
        REQUIRE(bound(1, 1, 10) == 1);
        REQUIRE(bound(10, 1, 10) == 10);
        REQUIRE(bound(MAX - 7, 0, MAX) == MAX - 7);
    }

    SECTION("small and large values map to the edges")
    {
        REQUIRE(bound(0, 5, 10) == 5);
        REQUIRE(bound(2, 5, 10) == 7);
        REQUIRE(bound(MAX, 5, 10) == 10);
        REQUIRE(bound(MAX - 1, 5, 10) == 9);
    }

    SECTION("other values wrap")
    {
        REQUIRE(bound(20, 5, 10) == 8);
        REQUIRE(bound(16, 5, 10) == 10);
        REQUIRE(bound(4, 5, 10) == 10);
        REQUIRE(bound(fp(1000), 1, 100) >= 1);
        REQUIRE(bound(fp(1000), 1, 100) <= 100);
        REQUIRE(bound(7, 3, 3) == 3);
    }

    REQUIRE_THROWS_AS(bound(5, 10, 1), UnboundableInput);
}

TEST_CASE("bound balances", "[bound]")
{
    REQUIRE(boundBalances({0, 0}, fp(1), fp(1000), 10) ==
            std::vector<uint256>{fp(1), fp(1)});
    REQUIRE(boundBalances({fp(1000), 0}, fp(1), fp(1000), 10) ==
            std::vector<uint256>{fp(1000), fp(100)});

    auto balances =
        boundBalances({maxUint256(), 12345}, fp(1), fp(1000000), 1000);
    REQUIRE(balances[0] == fp(1000000));
    REQUIRE(balances[1] >= fp(1000));
    REQUIRE(balances[1] <= fp(1000000));

    REQUIRE_THROWS_AS(boundBalances({1, 2}, fp(1), fp(1000), 0),
                      UnboundableInput);
}

TEST_CASE("bound amounts", "[bound]")
{
    SECTION("swap fee")
    {
        REQUIRE(boundSwapFee(2, 1, 3) == 2);
        REQUIRE(boundSwapFee(0, FixedPoint::pow10(12), FixedPoint::pow10(17)) ==
                FixedPoint::pow10(12));
    }

    SECTION("invariant ratio")
    {
        auto minRatio = fp(1) / 2;
        auto maxRatio = fp(2);
        REQUIRE(boundAmountForInvariantRatio(maxUint256(), fp(100), minRatio,
                                             maxRatio, 1) == fp(50));
        REQUIRE(boundAmountForInvariantRatio(0, fp(100), minRatio, maxRatio,
                                             1) == 1);
        REQUIRE_THROWS_AS(boundAmountForInvariantRatio(0, 1, minRatio,
                                                       maxRatio, 1000000),
                          UnboundableInput);

        auto bpt = boundBptAmount(0, fp(100), minRatio, maxRatio);
        REQUIRE(bpt == MINIMUM_TRADE_AMOUNT);
    }

    SECTION("swap")
    {
        REQUIRE(boundSwapAmount(0, fp(100)) == MINIMUM_TRADE_AMOUNT);
        REQUIRE(boundSwapAmount(maxUint256(), fp(100)) == fp(50));
        REQUIRE_THROWS_AS(boundSwapAmount(0, 10), UnboundableInput);
    }
}

TEST_CASE("bounding is deterministic", "[bound]")
{
    for (int i = 0; i < 200; ++i)
    {
        std::vector<uint256> raw{rand_uint256(gRandomEngine),
                                 rand_uint256(gRandomEngine)};
        auto min = fp(rand_uniform<uint64_t>(1, 1000));
        auto max = min * rand_uniform<uint64_t>(1, 1000000);
        auto skew = uint256(rand_uniform<uint64_t>(1, 1000));

        auto balances = boundBalances(raw, min, max, skew);
        REQUIRE(balances == boundBalances(raw, min, max, skew));
        for (auto const& b : balances)
        {
            REQUIRE(b >= min);
            REQUIRE(b <= max);
        }
        REQUIRE(balances[1] >= balances[0] / skew);
    }
}
