// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "test/TestHarness.h"
#include "util/FixedPoint.h"
#include "verifier/OutcomeComparator.h"
#include "verifier/ScenarioFailure.h"

using namespace vaultcheck;
using FixedPoint::fp;

TEST_CASE("tolerance", "[comparator]")
{
    auto exact = Tolerance::exact();
    REQUIRE(exact.accepts(5, 5));
    REQUIRE(!exact.accepts(5, 6));
    REQUIRE(!exact.accepts(-5, 5));

    Tolerance absolute{2, 0};
    REQUIRE(absolute.accepts(100, 102));
    REQUIRE(absolute.accepts(100, 98));
    REQUIRE(!absolute.accepts(100, 103));

    // 1%
    Tolerance relative{0, FixedPoint::pow10(16)};
    REQUIRE(relative.accepts(1000, 1010));
    REQUIRE(relative.accepts(-1000, -990));
    REQUIRE(!relative.accepts(1000, 1011));
    REQUIRE(!relative.accepts(0, 1));
}

TEST_CASE("compare diffs", "[comparator]")
{
    BalanceDiff actual;
    actual.balances[{"alice", "DAI"}] = -100;
    actual.balances[{"alice", "USDC"}] = 99;
    actual.balances[{"bob", "DAI"}] = 0;

    ExpectedDiffMap expected;
    expected.add("alice", "DAI", -100);
    expected.add("alice", "USDC", 100);

    REQUIRE(!compareDiffs(expected, actual, Tolerance::exact(), false)
                 .empty());
    REQUIRE(compareDiffs(expected, actual, Tolerance{1, 0}, true).empty());

    SECTION("unlisted changes")
    {
        actual.balances[{"bob", "DAI"}] = 1;
        REQUIRE(compareDiffs(expected, actual, Tolerance{1, 0}, false)
                    .empty());
        REQUIRE(!compareDiffs(expected, actual, Tolerance{1, 0}, true)
                     .empty());
    }

    SECTION("expectations the snapshot does not cover")
    {
        expected.add("carol", "DAI", 0);
        REQUIRE(!compareDiffs(expected, actual, Tolerance{1, 0}, false)
                     .empty());
    }
}

TEST_CASE("compare settlement amounts", "[comparator]")
{
    SECTION("per path")
    {
        std::vector<uint256> expected{100, 200};
        REQUIRE(comparePathAmounts(expected, {100, 200}, Tolerance::exact())
                    .empty());
        REQUIRE(!comparePathAmounts(expected, {100, 201}, Tolerance::exact())
                     .empty());
        REQUIRE(comparePathAmounts(expected, {100, 201}, Tolerance{1, 0})
                    .empty());
        REQUIRE(!comparePathAmounts(expected, {100}, Tolerance{1, 0}).empty());
    }

    SECTION("per token")
    {
        std::map<TokenID, uint256> expected{{"DAI", 30}, {"WETH", 5}};
        REQUIRE(compareTokenTotals(expected, {"DAI", "WETH", "DAI"},
                                   {10, 5, 20}, Tolerance::exact())
                    .empty());
        REQUIRE(!compareTokenTotals(expected, {"DAI", "WETH"}, {29, 5},
                                    Tolerance::exact())
                     .empty());
        REQUIRE(!compareTokenTotals(expected, {"DAI"}, {30},
                                    Tolerance::exact())
                     .empty());
        REQUIRE(!compareTokenTotals(expected, {"DAI", "WETH", "USDC"},
                                    {30, 5, 1}, Tolerance::exact())
                     .empty());
        REQUIRE(!compareTokenTotals(expected, {"DAI", "WETH"}, {30},
                                    Tolerance::exact())
                     .empty());
    }
}

TEST_CASE("balance change modes", "[comparator]")
{
    BalanceDiff actual;
    actual.balances[{"alice", "DAI"}] = -100;
    actual.balances[{"alice", "USDC"}] = 0;
    actual.balances[{"bob", "DAI"}] = 7;

    auto check = [&](ChangeMode mode, int256 const& value) {
        return checkBalanceChanges(actual,
                                   {BalanceChange{"alice", "DAI", mode, value}})
            .empty();
    };

    REQUIRE(check(ChangeMode::EQUAL, -100));
    REQUIRE(!check(ChangeMode::EQUAL, -99));
    REQUIRE(check(ChangeMode::LT, -99));
    REQUIRE(!check(ChangeMode::LT, -100));
    REQUIRE(check(ChangeMode::LTE, -100));
    REQUIRE(check(ChangeMode::GT, -101));
    REQUIRE(!check(ChangeMode::GT, -100));
    REQUIRE(check(ChangeMode::GTE, -100));

    // within |value| / 10
    REQUIRE(check(ChangeMode::NEAR, -110));
    REQUIRE(check(ChangeMode::NEAR, -91));
    REQUIRE(!check(ChangeMode::NEAR, -89));

    // within |value| / 100000
    actual.balances[{"alice", "DAI"}] = 1000010;
    REQUIRE(check(ChangeMode::VERY_NEAR, 1000000));
    REQUIRE(!check(ChangeMode::VERY_NEAR, 999990));

    SECTION("other tokens of a listed account must not move")
    {
        actual.balances[{"alice", "DAI"}] = -100;
        actual.balances[{"alice", "USDC"}] = 1;
        REQUIRE(!check(ChangeMode::EQUAL, -100));
        REQUIRE(checkBalanceChanges(
                    actual,
                    {BalanceChange{"alice", "DAI", ChangeMode::EQUAL, -100},
                     BalanceChange{"alice", "USDC", ChangeMode::GT, 0}})
                    .empty());
    }

    SECTION("uncovered balances")
    {
        REQUIRE(!checkBalanceChanges(actual, {BalanceChange{"carol", "DAI",
                                                            ChangeMode::EQUAL,
                                                            0}})
                     .empty());
    }

    REQUIRE(toString(ChangeMode::VERY_NEAR) == "VERY_NEAR");
}

TEST_CASE("expectations with error", "[comparator]")
{
    // default is 0.1%
    REQUIRE(expectEqualWithError(1001, 1000).empty());
    REQUIRE(expectEqualWithError(999, 1000).empty());
    REQUIRE(!expectEqualWithError(1002, 1000).empty());
    REQUIRE(expectEqualWithError(1010, 1000, FixedPoint::pow10(16)).empty());

    REQUIRE(expectLessThanOrEqualWithError(999, 1000).empty());
    REQUIRE(!expectLessThanOrEqualWithError(1001, 1000).empty());
    REQUIRE(!expectLessThanOrEqualWithError(998, 1000).empty());
}

TEST_CASE("scenario failures", "[comparator]")
{
    TestHarness h;
    h.createPool("pool", InvariantKind::LINEAR,
                 {TestHarness::DAI, TestHarness::USDC});
    h.initializePool("pool", {fp(1000), fp(1000, 6)});
    auto const& state = h.getVault().getState();

    auto desc = describePool(state, "pool");
    REQUIRE(desc.find("DAI") != std::string::npos);
    REQUIRE(desc.find("supply") != std::string::npos);
    REQUIRE(describePool(state, "nope") == "pool nope: not registered");

    ScenarioFailure failure("swap", "limit exceeded", desc);
    REQUIRE(failure.operation == "swap");
    REQUIRE(failure.reason == "limit exceeded");
    std::string what = failure.what();
    REQUIRE(what.find("swap failed: limit exceeded") == 0);
    REQUIRE(what.find(desc) != std::string::npos);
}
