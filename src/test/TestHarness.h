#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantGuard.h"
#include "util/NonCopyable.h"
#include "vault/BatchRouter.h"
#include "vault/VaultImpl.h"
#include "verifier/BalanceSnapshot.h"
#include "verifier/OutcomeComparator.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace vaultcheck
{

// Owns one vault and everything registered in it: the standard tokens, a
// few funded accounts, and whatever pools and buffers a test adds. Each test
// creates its own harness; nothing is shared between harnesses.
class TestHarness : public NonMovableOrCopyable
{
    std::unique_ptr<VaultImpl> mVault;
    std::unique_ptr<BatchRouter> mRouter;
    std::unique_ptr<InvariantChecker> mChecker;

  public:
    static TokenID const DAI;
    static TokenID const USDC;
    static TokenID const WETH;
    static TokenID const WA_DAI;
    static TokenID const WA_USDC;

    static AccountID const LP;
    static AccountID const ALICE;
    static AccountID const BOB;

    // of each 18 decimal token, per account
    static uint256 const DEFAULT_FUNDING;

    explicit TestHarness(std::vector<std::string> const& invariantChecks);
    TestHarness();

    VaultImpl& getVault();
    BatchRouter& getRouter();
    InvariantChecker& getChecker();

    // registers a pool with a fee range of [0, 10%]
    void createPool(PoolID const& pool, InvariantKind kind,
                    std::vector<TokenID> const& tokens,
                    uint256 const& swapFee = 0);
    // returns the BPT LP received
    uint256 initializePool(PoolID const& pool,
                           std::vector<uint256> const& amounts,
                           AccountID const& from = LP);
    void initializeBuffer(TokenID const& wrapped, uint256 const& underlying,
                          uint256 const& wrappedAmount,
                          AccountID const& from = LP);

    // raw amount of token for `units` whole tokens
    uint256 amount(TokenID const& token, uint64_t units) const;
    uint256 balanceOf(AccountID const& account, TokenID const& token) const;
};

// What a scenario needs to act on one pool and observe the result.
struct ScenarioContext
{
    TestHarness& harness;
    VaultImpl& vault;
    BatchRouter& router;
    InvariantChecker& checker;
    PoolID pool;
    std::set<AccountID> accounts;
    std::vector<TokenID> tokens;
    Tolerance tolerance;

    BalanceSnapshot snapshot(bool includeNative = false) const;
};

// Covers the pool's tokens and BPT for the given accounts and the vault.
ScenarioContext makeScenario(TestHarness& harness, PoolID const& pool,
                             std::set<AccountID> accounts);

// A two token pool of the given kind over DAI and USDC, or over the tokens
// given, initialized by TestHarness::LP.
ScenarioContext makePoolScenario(TestHarness& harness, PoolID const& pool,
                                 InvariantKind kind,
                                 std::vector<uint256> const& amounts,
                                 std::vector<TokenID> const& tokens = {},
                                 uint256 const& swapFee = 0);
}
