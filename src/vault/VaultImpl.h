#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantManager.h"
#include "ledger/StateStore.h"
#include "vault/Vault.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vaultcheck
{

// Minimum BPT supply, minted to ZERO_ACCOUNT when a pool is initialized.
extern uint256 const POOL_MINIMUM_TOTAL_SUPPLY;
// Minimum amount, in scaled18 units, of either leg of a swap.
extern uint256 const MINIMUM_TRADE_AMOUNT;
// Buffer shares locked to ZERO_ACCOUNT on buffer initialization.
extern uint256 const BUFFER_MINIMUM_TOTAL_SUPPLY;
extern uint256 const MINIMUM_WRAP_AMOUNT;
// Token id used in errors about native balances.
extern TokenID const NATIVE_TOKEN;

class VaultImpl : public Vault, public NonMovableOrCopyable
{
    // Open while an operation runs. Token legs accumulate here, negative
    // amounts are owed by the sender, and are netted against the sender's
    // balances once the outermost operation completes.
    struct Session
    {
        AccountID mSender;
        std::map<TokenID, int256> mDeltas;
        int256 mNativeDelta;
        bool mQuery{false};
    };

    class SessionScope;

    StateStore mStore;
    std::unique_ptr<InvariantManager> mInvariantManager;
    std::optional<Session> mSession;
    std::map<InvariantKind, std::unique_ptr<PoolInvariant>> mPoolMath;

    template <typename T, typename F>
    VaultResult<T> runOperation(VaultOperation const& op, F&& body);
    template <typename T, typename F>
    VaultResult<T> runQuery(AccountID const& sender, F&& body);
    template <typename T, typename F> VaultResult<T> captureErrors(F&& body);

    void checkInvariants(VaultOperation const& op,
                         VaultLedger const& previous);

    void takeIn(TokenID const& token, uint256 const& amount, bool wethIsEth);
    void sendOut(TokenID const& token, uint256 const& amount, bool wethIsEth);
    void settle();

    void mintBpt(PoolID const& pool, AccountID const& to,
                 uint256 const& amount);
    void burnBpt(PoolID const& pool, AccountID const& from,
                 uint256 const& amount);

    PoolEntry const& loadInitializedPool(PoolID const& pool) const;
    PoolInvariant const& getPoolMath(InvariantKind kind) const;
    size_t findTokenIndex(PoolEntry const& pool, TokenID const& token) const;

    AddLiquidityResult doAddLiquidity(AddLiquidityParams const& params);
    RemoveLiquidityResult
    doRemoveLiquidity(RemoveLiquidityParams const& params);
    SwapResult doSwap(SwapParams const& params);
    BufferWrapOrUnwrapResult
    doWrapOrUnwrap(BufferWrapOrUnwrapParams const& params);

  public:
    // invariantChecks are regexes of invariant names to enable
    explicit VaultImpl(std::vector<std::string> const& invariantChecks);
    ~VaultImpl() override;

    // Setup. Ledger level duplicates throw std::invalid_argument.
    void registerToken(TokenID const& token, uint32_t decimals = 18);
    void registerWrappedToken(TokenID const& wrapped,
                              TokenID const& underlying,
                              uint32_t decimals = 18);
    void createAccount(AccountID const& account);
    void mint(AccountID const& account, TokenID const& token,
              uint256 const& amount);
    void mintNative(AccountID const& account, uint256 const& amount);
    void setWethToken(TokenID const& token);
    void donateYield(TokenID const& wrapped, uint256 const& assets);

    VaultStatus registerPool(PoolConfig const& config);
    VaultStatus setSwapFee(PoolID const& pool, uint256 const& swapFee);

    VaultResult<uint256> initialize(InitializeParams const& params) override;

    VaultResult<AddLiquidityResult>
    addLiquidity(AddLiquidityParams const& params) override;
    VaultResult<RemoveLiquidityResult>
    removeLiquidity(RemoveLiquidityParams const& params) override;
    VaultResult<SwapResult> swap(SwapParams const& params) override;

    VaultResult<AddLiquidityResult>
    queryAddLiquidity(AddLiquidityParams const& params) override;
    VaultResult<RemoveLiquidityResult>
    queryRemoveLiquidity(RemoveLiquidityParams const& params) override;
    VaultResult<SwapResult> querySwap(SwapParams const& params) override;

    VaultResult<BufferLiquidityResult>
    initializeBuffer(TokenID const& wrappedToken,
                     uint256 const& exactUnderlyingIn,
                     uint256 const& exactWrappedIn,
                     uint256 const& minIssuedShares,
                     AccountID const& sender) override;
    VaultResult<BufferLiquidityResult>
    addLiquidityToBuffer(TokenID const& wrappedToken,
                         uint256 const& maxUnderlyingIn,
                         uint256 const& maxWrappedIn,
                         uint256 const& exactSharesToIssue,
                         AccountID const& sender) override;
    VaultResult<BufferLiquidityResult>
    removeLiquidityFromBuffer(TokenID const& wrappedToken,
                              uint256 const& sharesToRemove,
                              uint256 const& minUnderlyingOut,
                              uint256 const& minWrappedOut,
                              AccountID const& sender) override;
    VaultResult<BufferWrapOrUnwrapResult>
    erc4626BufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params) override;
    VaultResult<BufferWrapOrUnwrapResult>
    queryBufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params) override;

    VaultStatus batch(AccountID const& sender, BatchBody const& body) override;
    VaultStatus queryBatch(AccountID const& sender,
                           BatchBody const& body) override;

    uint256 computeInvariant(PoolID const& pool,
                             Rounding rounding) const override;
    uint256 computeInvariant(PoolID const& pool,
                             std::vector<uint256> const& balances,
                             Rounding rounding) const override;
    PoolTokenInfo getPoolTokenInfo(PoolID const& pool) const override;
    uint256 getMinimumInvariantRatio(PoolID const& pool) const override;
    uint256 getMaximumInvariantRatio(PoolID const& pool) const override;
    BufferBalance getBufferBalance(TokenID const& wrapped) const override;
    uint256 getBufferShares(TokenID const& wrapped,
                            AccountID const& account) const;

    VaultStateReader const& getState() const override;
    VaultLedger const& getLedger() const;
    StateStore& getStateStore();
    InvariantManager& getInvariantManager();
};
}
