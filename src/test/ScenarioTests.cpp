// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "test/TestHarness.h"
#include "util/FixedPoint.h"
#include "util/Logging.h"
#include "verifier/ExpectedOutcome.h"
#include "verifier/OutcomeComparator.h"
#include "verifier/ScenarioFailure.h"

using namespace vaultcheck;
using FixedPoint::fp;

namespace
{
TokenID const& DAI = TestHarness::DAI;
TokenID const& WETH = TestHarness::WETH;
TokenID const& USDC = TestHarness::USDC;
TokenID const& WA_DAI = TestHarness::WA_DAI;
AccountID const& LP = TestHarness::LP;
AccountID const& ALICE = TestHarness::ALICE;

AddLiquidityParams
proportionalAdd(ScenarioContext const& ctx, AccountID const& to,
                uint256 const& bpt)
{
    AddLiquidityParams params;
    params.pool = ctx.pool;
    params.to = to;
    params.kind = AddLiquidityKind::PROPORTIONAL;
    params.maxAmountsIn.assign(ctx.tokens.size(), maxUint256());
    params.minBptAmountOut = bpt;
    return params;
}

RemoveLiquidityParams
proportionalRemove(ScenarioContext const& ctx, AccountID const& from,
                   uint256 const& bpt)
{
    RemoveLiquidityParams params;
    params.pool = ctx.pool;
    params.from = from;
    params.kind = RemoveLiquidityKind::PROPORTIONAL;
    params.maxBptAmountIn = bpt;
    params.minAmountsOut.assign(ctx.tokens.size(), uint256(0));
    return params;
}

SwapParams
exactIn(ScenarioContext const& ctx, TokenID const& tokenIn,
        TokenID const& tokenOut, uint256 const& amount)
{
    SwapParams params;
    params.kind = SwapKind::EXACT_IN;
    params.pool = ctx.pool;
    params.tokenIn = tokenIn;
    params.tokenOut = tokenOut;
    params.amountGivenRaw = amount;
    params.limitRaw = 0;
    params.sender = ALICE;
    return params;
}

// Reports a scenario error with the pool's state attached.
void
expectOk(ScenarioContext const& ctx, std::string const& operation,
         std::string const& err)
{
    if (!err.empty())
    {
        ScenarioFailure failure(operation, err,
                                describePool(ctx.vault.getState(), ctx.pool));
        FAIL(failure.what());
    }
}

// Every token the vault holds covers what its pools and buffers claim.
void
checkReserves(TestHarness& h)
{
    auto& vault = h.getVault();
    auto const& ledger = vault.getLedger();
    std::map<TokenID, uint256> claims;
    for (auto const& entry : ledger.getPools())
    {
        auto const& pool = entry.second;
        for (size_t i = 0; i < pool.tokens.size(); ++i)
        {
            claims[pool.tokens[i]] += pool.balancesRaw[i];
        }
    }
    auto buffer = vault.getBufferBalance(WA_DAI);
    claims[DAI] += buffer.underlying;
    claims[WA_DAI] += buffer.wrapped;
    for (auto const& claim : claims)
    {
        INFO(claim.first);
        REQUIRE(h.balanceOf(VAULT_ACCOUNT, claim.first) >= claim.second);
    }
}
}

TEST_CASE("proportional add then remove", "[scenario]")
{
    TestHarness h;
    InvariantKind kind = InvariantKind::LINEAR;
    SECTION("linear")
    {
        kind = InvariantKind::LINEAR;
    }
    SECTION("constant product")
    {
        kind = InvariantKind::CONSTANT_PRODUCT;
    }
    auto ctx = makePoolScenario(h, "pool", kind, {fp(1000), fp(1000)},
                                {DAI, WETH});

    auto before = ctx.snapshot();
    auto added = ctx.vault.addLiquidity(proportionalAdd(ctx, LP, fp(500)))
                     .value();
    REQUIRE(added.bptAmountOut == fp(500));
    REQUIRE(absValue(toSigned(added.amountsIn[0]) -
                     toSigned(added.amountsIn[1])) <= 2);

    auto afterAdd = ctx.snapshot();
    expectOk(ctx, "addLiquidity",
             checkBalanceChanges(
                 diff(before, afterAdd),
                 {{LP, DAI, ChangeMode::EQUAL, -toSigned(added.amountsIn[0])},
                  {LP, WETH, ChangeMode::EQUAL, -toSigned(added.amountsIn[1])},
                  {LP, ctx.pool, ChangeMode::EQUAL, toSigned(fp(500))}}));

    auto removed =
        ctx.vault.removeLiquidity(proportionalRemove(ctx, LP, fp(500)))
            .value();
    REQUIRE(removed.bptAmountIn == added.bptAmountOut);
    for (size_t i = 0; i < ctx.tokens.size(); ++i)
    {
        REQUIRE(removed.amountsOut[i] <= added.amountsIn[i]);
    }

    auto total = diff(before, ctx.snapshot());
    REQUIRE(total.totalSupply == 0);
    REQUIRE(total.get(LP, ctx.pool) == 0);
    REQUIRE(total.get(LP, DAI) <= 0);
    REQUIRE(total.get(LP, WETH) <= 0);
}

TEST_CASE("single token exact out add then remove", "[scenario]")
{
    TestHarness h;
    auto ctx = makePoolScenario(h, "pool", InvariantKind::LINEAR,
                                {fp(1000), fp(1000)}, {DAI, WETH});
    auto bptAmountOut = fp(1000);

    AddLiquidityParams add;
    add.pool = ctx.pool;
    add.to = ALICE;
    add.kind = AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT;
    add.maxAmountsIn = {0, maxUint256()};
    add.minBptAmountOut = bptAmountOut;
    auto added = ctx.vault.addLiquidity(add).value();
    REQUIRE(added.bptAmountOut == bptAmountOut);
    REQUIRE(added.amountsIn[0] == 0);
    REQUIRE(h.balanceOf(ALICE, ctx.pool) == bptAmountOut);

    RemoveLiquidityParams remove;
    remove.pool = ctx.pool;
    remove.from = ALICE;
    remove.kind = RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT;
    remove.minAmountsOut = {0, added.amountsIn[1]};
    remove.maxBptAmountIn = maxUint256();

    auto query = ctx.vault.queryRemoveLiquidity(remove).value();
    auto res = ctx.vault.removeLiquidity(remove);
    if (query.bptAmountIn > bptAmountOut)
    {
        REQUIRE(res.failedWith(VaultErrorCode::INSUFFICIENT_BALANCE));
        REQUIRE(res.error().need >= bptAmountOut);
        REQUIRE(res.error().have == bptAmountOut);
    }
    else
    {
        REQUIRE(res.value().amountsOut == added.amountsIn);
        REQUIRE(res.value().bptAmountIn == query.bptAmountIn);
    }
}

TEST_CASE("queries match execution", "[scenario]")
{
    TestHarness h;
    auto ctx =
        makePoolScenario(h, "pool", InvariantKind::CONSTANT_PRODUCT,
                         {fp(1000), fp(400)}, {DAI, WETH}, FixedPoint::pow10(16));
    auto const& state = ctx.vault.getState();

    SECTION("unbalanced add")
    {
        AddLiquidityParams params;
        params.pool = ctx.pool;
        params.to = ALICE;
        params.kind = AddLiquidityKind::UNBALANCED;
        params.maxAmountsIn = {fp(30), fp(7)};
        auto version = state.getStateVersion();
        auto queried = ctx.vault.queryAddLiquidity(params).value();
        REQUIRE(state.getStateVersion() == version);
        auto executed = ctx.vault.addLiquidity(params).value();
        REQUIRE(queried.amountsIn == executed.amountsIn);
        REQUIRE(queried.bptAmountOut == executed.bptAmountOut);
    }

    SECTION("single token exact in remove")
    {
        RemoveLiquidityParams params;
        params.pool = ctx.pool;
        params.from = LP;
        params.kind = RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN;
        params.maxBptAmountIn = fp(25);
        params.minAmountsOut = {0, 1};
        auto version = state.getStateVersion();
        auto queried = ctx.vault.queryRemoveLiquidity(params).value();
        REQUIRE(state.getStateVersion() == version);
        auto executed = ctx.vault.removeLiquidity(params).value();
        REQUIRE(queried.amountsOut == executed.amountsOut);
        REQUIRE(queried.bptAmountIn == executed.bptAmountIn);
    }

    SECTION("exact out swap")
    {
        auto params = exactIn(ctx, DAI, WETH, fp(3));
        params.kind = SwapKind::EXACT_OUT;
        params.limitRaw = maxUint256();
        auto version = state.getStateVersion();
        auto queried = ctx.vault.querySwap(params).value();
        REQUIRE(state.getStateVersion() == version);
        auto executed = ctx.vault.swap(params).value();
        REQUIRE(queried.amountIn == executed.amountIn);
        REQUIRE(queried.amountOut == executed.amountOut);
        REQUIRE(executed.amountOut == fp(3));
    }
}

TEST_CASE("batch settlement agrees with the accumulator", "[scenario]")
{
    TestHarness h;
    auto ctx = makePoolScenario(h, "pool", InvariantKind::CONSTANT_PRODUCT,
                                {fp(1000), fp(1000)}, {DAI, WETH},
                                FixedPoint::pow10(15));
    h.createPool("pool2", InvariantKind::LINEAR, {WETH, USDC});
    h.initializePool("pool2", {fp(1000), fp(1000, 6)});
    ctx.tokens = {DAI, WETH, USDC};

    std::vector<SwapPath> paths{
        {DAI, {{"pool", WETH}}, fp(12), 0},
        {DAI, {{"pool", WETH}, {"pool2", USDC}}, fp(20), 0},
        {WETH, {{"pool", DAI}}, fp(5), 0},
    };

    SECTION("exact in")
    {
        auto queried = ctx.router.querySwapExactIn(paths, ALICE).value();
        // predict slightly less than the query returns
        for (size_t i = 0; i < paths.size(); ++i)
        {
            paths[i].limit = queried.pathAmounts[i] - 10000;
        }

        ExpectedOutcomeAccumulator acc(ALICE);
        acc.accumulate(paths, SwapKind::EXACT_IN);

        auto before = ctx.snapshot();
        auto res = ctx.router.swapExactIn(paths, ALICE).value();
        auto actual = diff(before, ctx.snapshot());

        REQUIRE(res.pathAmounts == queried.pathAmounts);
        expectOk(ctx, "swapExactIn",
                 comparePathAmounts(acc.pathAmounts(), res.pathAmounts,
                                    ctx.tolerance));
        expectOk(ctx, "swapExactIn",
                 compareTokenTotals(acc.tokenTotals(), res.tokens,
                                    res.amounts, ctx.tolerance));
        expectOk(ctx, "swapExactIn",
                 compareDiffs(acc.diffs(), actual, ctx.tolerance, true));
        REQUIRE(!compareDiffs(acc.diffs(), actual, Tolerance::exact(), true)
                     .empty());
    }

    SECTION("exact out")
    {
        for (auto& path : paths)
        {
            path.givenAmount = path.steps.back().tokenOut == USDC
                                   ? fp(15, 6)
                                   : path.givenAmount / 2;
            path.limit = maxUint256();
        }
        auto queried = ctx.router.querySwapExactOut(paths, ALICE).value();
        for (size_t i = 0; i < paths.size(); ++i)
        {
            paths[i].limit = queried.pathAmounts[i] + 10000;
        }

        ExpectedOutcomeAccumulator acc(ALICE);
        acc.accumulate(paths, SwapKind::EXACT_OUT);

        auto before = ctx.snapshot();
        auto res = ctx.router.swapExactOut(paths, ALICE).value();
        auto actual = diff(before, ctx.snapshot());

        REQUIRE(res.tokens == std::vector<TokenID>{DAI, WETH});
        expectOk(ctx, "swapExactOut",
                 compareTokenTotals(acc.tokenTotals(), res.tokens,
                                    res.amounts, ctx.tolerance));
        expectOk(ctx, "swapExactOut",
                 compareDiffs(acc.diffs(), actual, ctx.tolerance, true));
    }
}

TEST_CASE("buffer operations keep the reserves", "[scenario]")
{
    TestHarness h;
    auto& vault = h.getVault();
    h.createPool("pool", InvariantKind::LINEAR, {DAI, WA_DAI});
    h.initializePool("pool", {fp(500), fp(500)});
    h.initializeBuffer(WA_DAI, fp(100), fp(100));
    checkReserves(h);

    REQUIRE(vault.initializeBuffer(WA_DAI, fp(1), fp(1), 0, LP)
                .failedWith(VaultErrorCode::BUFFER_ALREADY_INITIALIZED));

    BufferWrapOrUnwrapParams params;
    params.wrappedToken = WA_DAI;
    params.sender = ALICE;

    // larger than the buffer holds, so it has to rebalance
    params.kind = SwapKind::EXACT_IN;
    params.direction = WrappingDirection::WRAP;
    params.amountGivenRaw = fp(150);
    params.limitRaw = 0;
    REQUIRE(vault.erc4626BufferWrapOrUnwrap(params).isOk());
    checkReserves(h);

    vault.donateYield(WA_DAI, fp(40));
    checkReserves(h);

    params.kind = SwapKind::EXACT_OUT;
    params.direction = WrappingDirection::UNWRAP;
    params.amountGivenRaw = fp(320);
    params.limitRaw = maxUint256();
    auto unwrapped = vault.erc4626BufferWrapOrUnwrap(params).value();
    REQUIRE(unwrapped.amountOut == fp(320));
    checkReserves(h);

    // a swap through the pool after the rate moved
    SwapParams swap;
    swap.pool = "pool";
    swap.tokenIn = DAI;
    swap.tokenOut = WA_DAI;
    swap.amountGivenRaw = fp(10);
    swap.sender = ALICE;
    REQUIRE(vault.swap(swap).isOk());
    checkReserves(h);
}

TEST_CASE("round trip swaps are bounded", "[scenario]")
{
    TestHarness h;
    InvariantKind kind = InvariantKind::LINEAR;
    uint256 fee = 0;
    SECTION("linear without fee")
    {
    }
    SECTION("constant product with fee")
    {
        kind = InvariantKind::CONSTANT_PRODUCT;
        fee = FixedPoint::pow10(15);
    }
    SECTION("constant product without fee")
    {
        kind = InvariantKind::CONSTANT_PRODUCT;
    }
    auto ctx =
        makePoolScenario(h, "pool", kind, {fp(1000), fp(700)}, {DAI, WETH}, fee);

    for (auto x : {FixedPoint::pow10(15), fp(1), fp(37), fp(250)})
    {
        INFO(x);
        auto there = ctx.checker.check(ctx.pool, [&]() {
            return ctx.vault.swap(exactIn(ctx, DAI, WETH, x)).value();
        });
        auto back = ctx.checker.check(ctx.pool, [&]() {
            return ctx.vault.swap(exactIn(ctx, WETH, DAI, there.amountOut))
                .value();
        });
        REQUIRE(back.amountOut <= x);
    }
}

TEST_CASE("no value extraction", "[scenario]")
{
    for (auto kind : {InvariantKind::LINEAR, InvariantKind::CONSTANT_PRODUCT})
    {
        for (auto const& balances :
             {std::vector<uint256>{fp(1000), fp(1000)},
              std::vector<uint256>{fp(1), fp(1000000)},
              std::vector<uint256>{fp(123456), fp(7)}})
        {
            for (auto bpt : {uint256(1000000), FixedPoint::pow10(15), fp(1),
                             fp(3)})
            {
                TestHarness h;
                auto ctx = makePoolScenario(h, "pool", kind, balances,
                                            {DAI, WETH});
                auto added = ctx.checker.check(ctx.pool, [&]() {
                    return ctx.vault
                        .addLiquidity(proportionalAdd(ctx, ALICE, bpt))
                        .value();
                });
                auto removed = ctx.checker.check(
                    ctx.pool,
                    [&]() {
                        return ctx.vault
                            .removeLiquidity(
                                proportionalRemove(ctx, ALICE, bpt))
                            .value();
                    },
                    InvariantChecker::Measure::PER_SHARE);

                INFO(toString(kind) << " " << bpt);
                REQUIRE(removed.bptAmountIn == added.bptAmountOut);
                for (size_t i = 0; i < balances.size(); ++i)
                {
                    REQUIRE(removed.amountsOut[i] <= added.amountsIn[i]);
                }
            }
        }
    }
}

TEST_CASE("invariant is non decreasing across operations", "[scenario]")
{
    TestHarness h;
    auto ctx = makePoolScenario(h, "pool", InvariantKind::CONSTANT_PRODUCT,
                                {fp(800), fp(1200)}, {DAI, WETH},
                                FixedPoint::pow10(16));
    auto& checker = ctx.checker;
    auto& vault = ctx.vault;

    auto start = vault.computeInvariant(ctx.pool, ROUND_DOWN);
    for (int round = 0; round < 5; ++round)
    {
        checker.check(ctx.pool, [&]() {
            return vault.swap(exactIn(ctx, DAI, WETH, fp(17))).value();
        });
        checker.check(ctx.pool, [&]() {
            return vault.swap(exactIn(ctx, WETH, DAI, fp(11))).value();
        });
        checker.check(ctx.pool, [&]() {
            return vault.addLiquidity(proportionalAdd(ctx, ALICE, fp(20)))
                .value();
        });
        checker.check(
            ctx.pool,
            [&]() {
                return vault
                    .removeLiquidity(proportionalRemove(ctx, ALICE, fp(10)))
                    .value();
            },
            InvariantChecker::Measure::PER_SHARE);
    }
    CLOG_DEBUG(Test, "invariant moved from {} to {}", start,
               vault.computeInvariant(ctx.pool, ROUND_DOWN));
    REQUIRE(vault.computeInvariant(ctx.pool, ROUND_DOWN) >= start);
}
