#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultEntries.h"

namespace vaultcheck
{

// Read-only view of vault state. Every read made between two mutations sees
// the same getStateVersion().
class VaultStateReader
{
  public:
    virtual ~VaultStateReader()
    {
    }

    virtual bool hasAccount(AccountID const& account) const = 0;
    virtual bool hasPool(PoolID const& pool) const = 0;
    // true for registered tokens and for pool share tokens
    virtual bool hasToken(TokenID const& token) const = 0;

    // throws std::out_of_range for an unknown account
    virtual uint256 getBalance(AccountID const& account,
                               TokenID const& token) const = 0;
    virtual uint256 getNativeBalance(AccountID const& account) const = 0;

    // throw std::out_of_range for an unknown pool
    virtual PoolTokenInfo getPoolTokenInfo(PoolID const& pool) const = 0;
    virtual uint256 getTotalSupply(PoolID const& pool) const = 0;

    virtual uint64_t getStateVersion() const = 0;
};
}
