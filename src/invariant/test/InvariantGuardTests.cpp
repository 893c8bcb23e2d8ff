// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantGuard.h"
#include "test/Catch2.h"
#include "test/TestHarness.h"
#include "util/FixedPoint.h"

using namespace vaultcheck;
using FixedPoint::fp;

namespace
{
SwapParams
daiToUsdc(uint256 const& amount)
{
    SwapParams params;
    params.pool = "pool";
    params.tokenIn = TestHarness::DAI;
    params.tokenOut = TestHarness::USDC;
    params.amountGivenRaw = amount;
    params.sender = TestHarness::ALICE;
    return params;
}

RemoveLiquidityParams
proportionalRemove(uint256 const& bpt)
{
    RemoveLiquidityParams params;
    params.pool = "pool";
    params.from = TestHarness::LP;
    params.maxBptAmountIn = bpt;
    params.minAmountsOut = {0, 0};
    return params;
}
}

TEST_CASE("invariant guard", "[invariant]")
{
    TestHarness h;
    auto& vault = h.getVault();
    h.createPool("pool", InvariantKind::CONSTANT_PRODUCT,
                 {TestHarness::DAI, TestHarness::WETH},
                 FixedPoint::pow10(16));
    h.initializePool("pool", {fp(1000), fp(1000)});
    auto& checker = h.getChecker();
    REQUIRE(checker.getState() == InvariantChecker::State::IDLE);
    REQUIRE(checker.getRounding() == ROUND_UP);

    auto swap = daiToUsdc(fp(10));
    swap.tokenOut = TestHarness::WETH;

    SECTION("a swap keeps the invariant")
    {
        auto guard = checker.begin("pool");
        REQUIRE(checker.getState() == InvariantChecker::State::ARMED);
        REQUIRE(guard.getBefore() == vault.computeInvariant("pool", ROUND_UP));
        REQUIRE(vault.swap(swap).isOk());
        guard.verify();
        REQUIRE(checker.getState() == InvariantChecker::State::VERIFIED);
        REQUIRE_THROWS_AS(guard.verify(), std::logic_error);
    }

    SECTION("only one guard at a time")
    {
        auto guard = checker.begin("pool");
        REQUIRE_THROWS_AS(checker.begin("pool"), NestedInvariantCheck);
        auto moved = std::move(guard);
        moved.verify();
        auto again = checker.begin("pool");
        again.verify();
    }

    SECTION("a removal decreases the total but not the share price")
    {
        auto remove = proportionalRemove(fp(100));
        auto guard = checker.begin("pool");
        REQUIRE(vault.removeLiquidity(remove).isOk());
        try
        {
            guard.verify();
            FAIL("decrease went unnoticed");
        }
        catch (InvariantDecreased const& e)
        {
            REQUIRE(e.pool == "pool");
            REQUIRE(e.after < e.before);
        }

        auto perShare =
            checker.begin("pool", InvariantChecker::Measure::PER_SHARE);
        REQUIRE(vault.removeLiquidity(remove).isOk());
        perShare.verify();
    }

    SECTION("per share needs a supply")
    {
        h.createPool("empty", InvariantKind::LINEAR,
                     {TestHarness::DAI, TestHarness::USDC});
        REQUIRE_THROWS_AS(
            checker.begin("empty", InvariantChecker::Measure::PER_SHARE),
            std::invalid_argument);
        REQUIRE(checker.getState() == InvariantChecker::State::IDLE);
    }
}

TEST_CASE("invariant checked scopes", "[invariant]")
{
    TestHarness h;
    auto& vault = h.getVault();
    h.createPool("pool", InvariantKind::LINEAR,
                 {TestHarness::DAI, TestHarness::USDC});
    h.initializePool("pool", {fp(1000), fp(1000, 6)});
    auto& checker = h.getChecker();

    SECTION("the result is passed through")
    {
        auto res = checker.check(
            "pool", [&]() { return vault.swap(daiToUsdc(fp(10))).value(); });
        REQUIRE(res.amountOut == fp(10, 6));
        REQUIRE(checker.getState() == InvariantChecker::State::VERIFIED);
    }

    SECTION("exceptions are rethrown after verification")
    {
        REQUIRE_THROWS_AS(checker.check("pool",
                                        [&]() {
                                            vault.swap(daiToUsdc(0)).value();
                                        }),
                          UnexpectedVaultError);
        REQUIRE(checker.getState() == InvariantChecker::State::VERIFIED);
    }

    SECTION("a decrease is reported")
    {
        REQUIRE_THROWS_AS(checker.check("pool",
                                        [&]() {
                                            return vault
                                                .removeLiquidity(
                                                    proportionalRemove(fp(1)))
                                                .value();
                                        }),
                          InvariantDecreased);

        auto res = checker.check(
            "pool",
            [&]() {
                return vault.removeLiquidity(proportionalRemove(fp(1)))
                    .value();
            },
            InvariantChecker::Measure::PER_SHARE);
        REQUIRE(res.bptAmountIn == fp(1));
    }
}

TEST_CASE("per share accepts proportional removes", "[invariant]")
{
    TestHarness h;
    auto& vault = h.getVault();
    h.createPool("pool", InvariantKind::CONSTANT_PRODUCT,
                 {TestHarness::DAI, TestHarness::WETH},
                 FixedPoint::pow10(16));
    h.initializePool("pool", {fp(1000), fp(1000)});
    auto& checker = h.getChecker();

    for (uint64_t round = 1; round <= 6; ++round)
    {
        auto swap = daiToUsdc(fp(round * 3) + round * 7919);
        swap.tokenOut = TestHarness::WETH;
        REQUIRE(vault.swap(swap).isOk());

        // odd amounts so that every amount out rounds
        auto remove = proportionalRemove(fp(round * 5) + round * 104729);
        auto supplyBefore = vault.getState().getTotalSupply("pool");
        auto guard =
            checker.begin("pool", InvariantChecker::Measure::PER_SHARE);
        auto res = vault.removeLiquidity(remove);
        REQUIRE(res.isOk());
        REQUIRE(vault.getState().getTotalSupply("pool") ==
                supplyBefore - remove.maxBptAmountIn);
        REQUIRE_NOTHROW(guard.verify());
    }

    SECTION("rounding down the invariant accepts them too")
    {
        InvariantChecker down(vault, ROUND_DOWN);
        auto guard = down.begin("pool", InvariantChecker::Measure::PER_SHARE);
        REQUIRE(vault.removeLiquidity(proportionalRemove(fp(3) + 1)).isOk());
        REQUIRE_NOTHROW(guard.verify());
    }
}
