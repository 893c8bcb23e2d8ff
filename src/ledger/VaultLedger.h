#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultStateReader.h"

#include <map>
#include <optional>

namespace vaultcheck
{

// The complete vault state graph: tokens, accounts, pools and buffers.
// VaultLedger is a value type, copying it yields an independent state which
// is what StateStore checkpoints rely on. Every mutating call bumps the state
// version.
class VaultLedger : public VaultStateReader
{
    std::map<TokenID, TokenEntry> mTokens;
    std::map<TokenID, WrappedTokenEntry> mWrappedTokens;
    std::map<AccountID, AccountEntry> mAccounts;
    std::map<PoolID, PoolEntry> mPools;
    std::map<TokenID, BufferEntry> mBuffers;
    std::optional<TokenID> mWethToken;
    uint64_t mVersion{0};

    AccountEntry& loadAccount(AccountID const& account);
    AccountEntry const& getAccount(AccountID const& account) const;

  public:
    VaultLedger();

    // Registration. These throw std::invalid_argument on duplicates.
    void registerToken(TokenEntry const& token);
    void registerWrappedToken(WrappedTokenEntry const& wrapped,
                              uint32_t decimals);
    void createAccount(AccountID const& account);
    void addPool(PoolEntry const& pool);
    void setWethToken(TokenID const& token);

    // Balance movements return false (leaving state untouched) when the
    // account cannot cover a debit or a credit would overflow.
    bool credit(AccountID const& account, TokenID const& token,
                uint256 const& amount);
    bool debit(AccountID const& account, TokenID const& token,
               uint256 const& amount);
    bool creditNative(AccountID const& account, uint256 const& amount);
    bool debitNative(AccountID const& account, uint256 const& amount);

    TokenEntry const& getToken(TokenID const& token) const;
    bool isWrappedToken(TokenID const& token) const;
    WrappedTokenEntry const& getWrappedToken(TokenID const& token) const;
    WrappedTokenEntry& loadWrappedToken(TokenID const& token);
    std::optional<TokenID> const& getWethToken() const;

    PoolEntry const& getPool(PoolID const& pool) const;
    PoolEntry& loadPool(PoolID const& pool);
    std::map<PoolID, PoolEntry> const& getPools() const;

    bool hasBuffer(TokenID const& wrapped) const;
    BufferEntry const& getBuffer(TokenID const& wrapped) const;
    // creates an empty buffer entry on first use
    BufferEntry& loadBuffer(TokenID const& wrapped);
    std::map<TokenID, BufferEntry> const& getBuffers() const;

    std::map<AccountID, AccountEntry> const& getAccounts() const;

    // 10^(18 - decimals)
    uint256 getScalingFactor(TokenID const& token) const;
    // 18-decimal rate of a token: the share price of a wrapped token,
    // otherwise ONE
    uint256 getTokenRate(TokenID const& token) const;

    // VaultStateReader
    bool hasAccount(AccountID const& account) const override;
    bool hasPool(PoolID const& pool) const override;
    bool hasToken(TokenID const& token) const override;
    uint256 getBalance(AccountID const& account,
                       TokenID const& token) const override;
    uint256 getNativeBalance(AccountID const& account) const override;
    PoolTokenInfo getPoolTokenInfo(PoolID const& pool) const override;
    uint256 getTotalSupply(PoolID const& pool) const override;
    uint64_t getStateVersion() const override;
};
}
