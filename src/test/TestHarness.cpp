// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestHarness.h"
#include "test/test.h"
#include "util/FixedPoint.h"
#include "util/Logging.h"

namespace vaultcheck
{

TokenID const TestHarness::DAI = "DAI";
TokenID const TestHarness::USDC = "USDC";
TokenID const TestHarness::WETH = "WETH";
TokenID const TestHarness::WA_DAI = "waDAI";
TokenID const TestHarness::WA_USDC = "waUSDC";

AccountID const TestHarness::LP = "lp";
AccountID const TestHarness::ALICE = "alice";
AccountID const TestHarness::BOB = "bob";

uint256 const TestHarness::DEFAULT_FUNDING = FixedPoint::fp(1000000000);

TestHarness::TestHarness(std::vector<std::string> const& invariantChecks)
    : mVault(std::make_unique<VaultImpl>(invariantChecks))
    , mRouter(std::make_unique<BatchRouter>(*mVault))
    , mChecker(std::make_unique<InvariantChecker>(*mVault))
{
    auto& vault = *mVault;
    vault.registerToken(DAI, 18);
    vault.registerToken(USDC, 6);
    vault.registerToken(WETH, 18);
    vault.setWethToken(WETH);
    vault.registerWrappedToken(WA_DAI, DAI, 18);
    vault.registerWrappedToken(WA_USDC, USDC, 6);

    for (auto const& account : {LP, ALICE, BOB})
    {
        vault.createAccount(account);
        vault.mint(account, DAI, DEFAULT_FUNDING);
        vault.mint(account, USDC, DEFAULT_FUNDING / FixedPoint::pow10(12));
        vault.mint(account, WETH, DEFAULT_FUNDING);
        vault.mint(account, WA_DAI, DEFAULT_FUNDING / 10);
        vault.mint(account, WA_USDC,
                   DEFAULT_FUNDING / 10 / FixedPoint::pow10(12));
        vault.mintNative(account, DEFAULT_FUNDING);
    }
}

TestHarness::TestHarness() : TestHarness(getTestConfig().INVARIANT_CHECKS)
{
}

VaultImpl&
TestHarness::getVault()
{
    return *mVault;
}

BatchRouter&
TestHarness::getRouter()
{
    return *mRouter;
}

InvariantChecker&
TestHarness::getChecker()
{
    return *mChecker;
}

void
TestHarness::createPool(PoolID const& pool, InvariantKind kind,
                        std::vector<TokenID> const& tokens,
                        uint256 const& swapFee)
{
    PoolConfig config;
    config.id = pool;
    config.kind = kind;
    config.tokens = tokens;
    config.swapFee = swapFee;
    config.minSwapFee = 0;
    config.maxSwapFee = FixedPoint::pow10(17);
    mVault->registerPool(config).value();
}

uint256
TestHarness::initializePool(PoolID const& pool,
                            std::vector<uint256> const& amounts,
                            AccountID const& from)
{
    InitializeParams params;
    params.pool = pool;
    params.sender = from;
    params.exactAmountsIn = amounts;
    return mVault->initialize(params).value();
}

void
TestHarness::initializeBuffer(TokenID const& wrapped,
                              uint256 const& underlying,
                              uint256 const& wrappedAmount,
                              AccountID const& from)
{
    mVault->initializeBuffer(wrapped, underlying, wrappedAmount, 0, from)
        .value();
}

uint256
TestHarness::amount(TokenID const& token, uint64_t units) const
{
    auto const& ledger = mVault->getLedger();
    return FixedPoint::fp(units, ledger.getToken(token).decimals);
}

uint256
TestHarness::balanceOf(AccountID const& account, TokenID const& token) const
{
    return mVault->getState().getBalance(account, token);
}

BalanceSnapshot
ScenarioContext::snapshot(bool includeNative) const
{
    return BalanceSnapshot::capture(vault.getState(), accounts, tokens, pool,
                                    includeNative);
}

ScenarioContext
makeScenario(TestHarness& harness, PoolID const& pool,
             std::set<AccountID> accounts)
{
    accounts.insert(VAULT_ACCOUNT);
    auto& vault = harness.getVault();
    auto tokens = vault.getPoolTokenInfo(pool).tokens;
    return ScenarioContext{harness,
                           vault,
                           harness.getRouter(),
                           harness.getChecker(),
                           pool,
                           std::move(accounts),
                           std::move(tokens),
                           getTestConfig().getSettlementTolerance()};
}

ScenarioContext
makePoolScenario(TestHarness& harness, PoolID const& pool, InvariantKind kind,
                 std::vector<uint256> const& amounts,
                 std::vector<TokenID> const& tokens, uint256 const& swapFee)
{
    auto poolTokens = tokens.empty()
                          ? std::vector<TokenID>{TestHarness::DAI,
                                                 TestHarness::USDC}
                          : tokens;
    harness.createPool(pool, kind, poolTokens, swapFee);
    auto bpt = harness.initializePool(pool, amounts);
    CLOG_DEBUG(Test, "initialized {} with {} BPT to {}", pool, bpt,
               TestHarness::LP);
    return makeScenario(harness, pool,
                        {TestHarness::LP, TestHarness::ALICE, TestHarness::BOB});
}
}
