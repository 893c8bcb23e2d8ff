// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "test/TestHarness.h"
#include "util/FixedPoint.h"
#include "verifier/BalanceSnapshot.h"

using namespace vaultcheck;
using FixedPoint::fp;

TEST_CASE("balance snapshots", "[snapshot]")
{
    TestHarness h;
    auto& vault = h.getVault();
    h.createPool("pool", InvariantKind::LINEAR,
                 {TestHarness::DAI, TestHarness::USDC});
    h.initializePool("pool", {fp(1000), fp(1000, 6)});

    std::set<AccountID> accounts{TestHarness::ALICE, VAULT_ACCOUNT};
    std::vector<TokenID> tokens{TestHarness::DAI, TestHarness::USDC};

    SwapParams swap;
    swap.pool = "pool";
    swap.tokenIn = TestHarness::DAI;
    swap.tokenOut = TestHarness::USDC;
    swap.amountGivenRaw = fp(10);
    swap.sender = TestHarness::ALICE;

    SECTION("capture")
    {
        auto snap = BalanceSnapshot::capture(vault.getState(), accounts,
                                             tokens, "pool", true);
        REQUIRE(snap.getStateVersion() == vault.getState().getStateVersion());
        REQUIRE(snap.getBalance(TestHarness::ALICE, TestHarness::DAI) ==
                TestHarness::DEFAULT_FUNDING);
        REQUIRE(snap.getBalance(VAULT_ACCOUNT, TestHarness::USDC) ==
                fp(1000, 6));
        REQUIRE(snap.getBalance(TestHarness::ALICE, "pool") == 0);
        REQUIRE(snap.getNativeBalance(TestHarness::ALICE) ==
                TestHarness::DEFAULT_FUNDING);
        REQUIRE(snap.getPoolTokens() == tokens);
        REQUIRE(snap.getPoolBalancesRaw() ==
                std::vector<uint256>{fp(1000), fp(1000, 6)});
        REQUIRE(snap.getPoolBalancesScaled18() ==
                std::vector<uint256>{fp(1000), fp(1000)});
        REQUIRE(snap.getTotalSupply() == fp(2000));

        REQUIRE_THROWS_AS(snap.getBalance(TestHarness::BOB, TestHarness::DAI),
                          StateReadError);
        REQUIRE_THROWS_AS(snap.getBalance(TestHarness::ALICE, TestHarness::WETH),
                          StateReadError);
    }

    SECTION("native balances are only captured on request")
    {
        auto snap = BalanceSnapshot::capture(vault.getState(), accounts,
                                             tokens, "pool");
        REQUIRE(!snap.includesNative());
        REQUIRE_THROWS_AS(snap.getNativeBalance(TestHarness::ALICE),
                          StateReadError);
    }

    SECTION("unknown entities")
    {
        REQUIRE_THROWS_AS(BalanceSnapshot::capture(vault.getState(),
                                                   {"carol"}, tokens, "pool"),
                          StateReadError);
        REQUIRE_THROWS_AS(BalanceSnapshot::capture(vault.getState(), accounts,
                                                   {"XYZ"}, "pool"),
                          StateReadError);
        REQUIRE_THROWS_AS(BalanceSnapshot::capture(vault.getState(), accounts,
                                                   tokens, "nope"),
                          StateReadError);
    }

    SECTION("diff of a swap")
    {
        auto before = BalanceSnapshot::capture(vault.getState(), accounts,
                                               tokens, "pool", true);
        REQUIRE(vault.swap(swap).isOk());
        auto after = BalanceSnapshot::capture(vault.getState(), accounts,
                                              tokens, "pool", true);
        REQUIRE(after.getStateVersion() > before.getStateVersion());

        auto d = diff(before, after);
        REQUIRE(d.get(TestHarness::ALICE, TestHarness::DAI) ==
                -toSigned(fp(10)));
        REQUIRE(d.get(TestHarness::ALICE, TestHarness::USDC) ==
                toSigned(fp(10, 6)));
        REQUIRE(d.get(VAULT_ACCOUNT, TestHarness::DAI) == toSigned(fp(10)));
        REQUIRE(d.get(VAULT_ACCOUNT, TestHarness::USDC) ==
                -toSigned(fp(10, 6)));
        REQUIRE(d.get(TestHarness::ALICE, "pool") == 0);
        REQUIRE(d.getNative(TestHarness::ALICE) == 0);
        REQUIRE(d.poolBalancesRaw ==
                std::vector<int256>{toSigned(fp(10)), -toSigned(fp(10, 6))});
        REQUIRE(d.poolBalancesScaled18 ==
                std::vector<int256>{toSigned(fp(10)), -toSigned(fp(10))});
        REQUIRE(d.totalSupply == 0);

        REQUIRE_THROWS_AS(d.get(TestHarness::BOB, TestHarness::DAI),
                          std::out_of_range);
        REQUIRE_THROWS_AS(d.getNative(TestHarness::BOB), std::out_of_range);
    }

    SECTION("snapshots of different scopes do not diff")
    {
        auto a = BalanceSnapshot::capture(vault.getState(), accounts, tokens,
                                          "pool");
        auto b = BalanceSnapshot::capture(
            vault.getState(), {TestHarness::ALICE}, tokens, "pool");
        auto c = BalanceSnapshot::capture(vault.getState(), accounts, tokens,
                                          "pool", true);
        REQUIRE_THROWS_AS(diff(a, b), SnapshotMismatch);
        REQUIRE_THROWS_AS(diff(a, c), SnapshotMismatch);
    }
}
