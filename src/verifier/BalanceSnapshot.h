#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultStateReader.h"

#include <map>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace vaultcheck
{

class StateReadError : public std::runtime_error
{
  public:
    explicit StateReadError(std::string const& msg) : std::runtime_error(msg)
    {
    }
};

class SnapshotMismatch : public std::runtime_error
{
  public:
    explicit SnapshotMismatch(std::string const& msg)
        : std::runtime_error(msg)
    {
    }
};

typedef std::pair<AccountID, TokenID> BalanceKey;

/*
An immutable record of balances for a set of accounts and an ordered set of
tokens, together with the state of one pool. Every account's holding of the
pool's BPT is recorded alongside the tokens. All reads are made under one
state version; capture() throws StateReadError if the version moves or an
entity is unknown.
*/
class BalanceSnapshot
{
    std::set<AccountID> mAccounts;
    std::vector<TokenID> mTokens;
    PoolID mPool;
    bool mIncludeNative{false};
    uint64_t mStateVersion{0};

    std::map<BalanceKey, uint256> mBalances;
    std::map<AccountID, uint256> mNativeBalances;
    std::vector<TokenID> mPoolTokens;
    std::vector<uint256> mPoolBalancesRaw;
    std::vector<uint256> mPoolBalancesScaled18;
    uint256 mTotalSupply;

    BalanceSnapshot() = default;

  public:
    // pool may be empty for snapshots of plain token balances
    static BalanceSnapshot capture(VaultStateReader const& reader,
                                   std::set<AccountID> const& accounts,
                                   std::vector<TokenID> const& tokens,
                                   PoolID const& pool,
                                   bool includeNative = false);

    std::set<AccountID> const& getAccounts() const;
    std::vector<TokenID> const& getTokens() const;
    PoolID const& getPool() const;
    bool includesNative() const;
    uint64_t getStateVersion() const;

    // throw StateReadError for entries the snapshot does not cover
    uint256 const& getBalance(AccountID const& account,
                              TokenID const& token) const;
    uint256 const& getNativeBalance(AccountID const& account) const;

    std::map<BalanceKey, uint256> const& getBalances() const;
    std::vector<TokenID> const& getPoolTokens() const;
    std::vector<uint256> const& getPoolBalancesRaw() const;
    std::vector<uint256> const& getPoolBalancesScaled18() const;
    uint256 const& getTotalSupply() const;
};

// Signed per-entry changes between two snapshots of the same entities.
struct BalanceDiff
{
    std::map<BalanceKey, int256> balances;
    std::map<AccountID, int256> nativeBalances;
    std::vector<int256> poolBalancesRaw;
    std::vector<int256> poolBalancesScaled18;
    int256 totalSupply;

    // throws std::out_of_range for an entry the diff does not cover
    int256 const& get(AccountID const& account, TokenID const& token) const;
    int256 const& getNative(AccountID const& account) const;
};

BalanceDiff diff(BalanceSnapshot const& before, BalanceSnapshot const& after);
}
