// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "util/FixedPoint.h"
#include "verifier/ExpectedOutcome.h"

using namespace vaultcheck;
using FixedPoint::fp;

namespace
{
OperationPath
makePath(TokenID const& tokenIn, std::vector<SwapPathStep> steps,
         uint256 const& given, uint256 const& limit)
{
    return OperationPath{tokenIn, std::move(steps), given, limit};
}
}

TEST_CASE("expected diff map", "[accumulator]")
{
    ExpectedDiffMap map;
    REQUIRE(map.empty());
    REQUIRE(map.get("alice", "DAI") == 0);

    map.add("alice", "DAI", 5);
    map.add("alice", "DAI", -2);
    map.add("bob", "DAI", -3);
    REQUIRE(map.size() == 2);
    REQUIRE(map.get("alice", "DAI") == 3);
    REQUIRE(map.contains("bob", "DAI"));
    REQUIRE(!map.contains("bob", "USDC"));

    SECTION("entries that cancel out are kept")
    {
        map.add("bob", "DAI", 3);
        REQUIRE(map.contains("bob", "DAI"));
        REQUIRE(map.get("bob", "DAI") == 0);
    }

    SECTION("merge")
    {
        ExpectedDiffMap other;
        other.add("alice", "DAI", 7);
        other.add("alice", "USDC", 1);
        map.merge(other);
        REQUIRE(map.size() == 3);
        REQUIRE(map.get("alice", "DAI") == 10);
        REQUIRE(map.get("alice", "USDC") == 1);
        REQUIRE(other.size() == 2);
    }
}

TEST_CASE("settlement token", "[accumulator]")
{
    auto path = makePath("DAI", {{"pool", "USDC"}, {"pool2", "WETH"}}, fp(10),
                         fp(9));
    REQUIRE(settlementToken(path, SwapKind::EXACT_IN) == "WETH");
    REQUIRE(settlementToken(path, SwapKind::EXACT_OUT) == "DAI");
    REQUIRE_THROWS_AS(
        settlementToken(makePath("DAI", {}, fp(1), 0), SwapKind::EXACT_IN),
        EmptyPath);
}

TEST_CASE("expected outcome accumulator", "[accumulator]")
{
    ExpectedOutcomeAccumulator acc("alice");

    SECTION("exact in")
    {
        acc.accumulate(
            {makePath("DAI", {{"pool", "USDC"}, {"pool2", "WETH"}}, fp(10),
                      fp(9)),
             makePath("USDC", {{"pool2", "WETH"}}, fp(5, 6), fp(4))},
            SwapKind::EXACT_IN);

        REQUIRE(acc.pathAmounts() == std::vector<uint256>{fp(9), fp(4)});
        REQUIRE(acc.tokenTotals().size() == 1);
        REQUIRE(acc.tokenTotals().at("WETH") == fp(13));

        auto const& diffs = acc.diffs();
        REQUIRE(diffs.get("alice", "DAI") == -toSigned(fp(10)));
        REQUIRE(diffs.get(VAULT_ACCOUNT, "DAI") == toSigned(fp(10)));
        REQUIRE(diffs.get("alice", "USDC") == -toSigned(fp(5, 6)));
        REQUIRE(diffs.get("alice", "WETH") == toSigned(fp(13)));
        REQUIRE(diffs.get(VAULT_ACCOUNT, "WETH") == -toSigned(fp(13)));
    }

    SECTION("exact out")
    {
        acc.accumulate({makePath("DAI", {{"pool", "USDC"}}, fp(10, 6), fp(11)),
                        makePath("WETH", {{"pool2", "USDC"}}, fp(1, 6), fp(2))},
                       SwapKind::EXACT_OUT);

        REQUIRE(acc.pathAmounts() == std::vector<uint256>{fp(11), fp(2)});
        REQUIRE(acc.tokenTotals().size() == 2);
        REQUIRE(acc.tokenTotals().at("DAI") == fp(11));
        REQUIRE(acc.tokenTotals().at("WETH") == fp(2));

        auto const& diffs = acc.diffs();
        REQUIRE(diffs.get("alice", "DAI") == -toSigned(fp(11)));
        REQUIRE(diffs.get("alice", "USDC") == toSigned(fp(11, 6)));
        REQUIRE(diffs.get(VAULT_ACCOUNT, "USDC") == -toSigned(fp(11, 6)));
    }

    SECTION("a custom counterparty")
    {
        ExpectedOutcomeAccumulator other("alice", "bob");
        other.accumulate({makePath("DAI", {{"pool", "USDC"}}, fp(1), fp(1, 6))},
                         SwapKind::EXACT_IN);
        REQUIRE(other.diffs().get("bob", "DAI") == toSigned(fp(1)));
        REQUIRE(!other.diffs().contains(VAULT_ACCOUNT, "DAI"));
    }

    SECTION("an empty path leaves the accumulator untouched")
    {
        REQUIRE_THROWS_AS(
            acc.accumulate({makePath("DAI", {{"pool", "USDC"}}, fp(1), 0),
                            makePath("DAI", {}, fp(1), 0)},
                           SwapKind::EXACT_IN),
            EmptyPath);
        REQUIRE(acc.pathAmounts().empty());
        REQUIRE(acc.tokenTotals().empty());
        REQUIRE(acc.diffs().empty());
    }

    SECTION("an overflowing total leaves the accumulator untouched")
    {
        acc.accumulate({makePath("DAI", {{"pool", "WETH"}}, fp(1), fp(2))},
                       SwapKind::EXACT_IN);
        auto diffsBefore = acc.diffs().entries();

        REQUIRE_THROWS_AS(
            acc.accumulate(
                {makePath("USDC", {{"pool2", "WETH"}}, fp(1, 6),
                          maxUint256() - fp(3)),
                 makePath("DAI", {{"pool", "WETH"}}, fp(1), fp(2))},
                SwapKind::EXACT_IN),
            ArithmeticOverflow);
        REQUIRE(acc.pathAmounts() == std::vector<uint256>{fp(2)});
        REQUIRE(acc.tokenTotals().at("WETH") == fp(2));
        REQUIRE((acc.diffs().entries() == diffsBefore));
        REQUIRE(!acc.diffs().contains("alice", "USDC"));
    }
}
