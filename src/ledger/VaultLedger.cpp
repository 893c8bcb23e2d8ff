// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultLedger.h"
#include "util/FixedPoint.h"

#include <fmt/format.h>
#include <stdexcept>

namespace vaultcheck
{

AccountID const VAULT_ACCOUNT = "vault";
AccountID const ZERO_ACCOUNT = "0x0";

std::string
toString(InvariantKind kind)
{
    switch (kind)
    {
    case InvariantKind::LINEAR:
        return "linear";
    case InvariantKind::CONSTANT_PRODUCT:
        return "constant-product";
    }
    return "unknown";
}

VaultLedger::VaultLedger()
{
    createAccount(VAULT_ACCOUNT);
    createAccount(ZERO_ACCOUNT);
}

void
VaultLedger::registerToken(TokenEntry const& token)
{
    if (token.decimals > 18)
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("token {} has more than 18 decimals"), token.id));
    }
    if (hasToken(token.id) || mAccounts.count(token.id) != 0)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("token {} already registered"), token.id));
    }
    mTokens.emplace(token.id, token);
    ++mVersion;
}

void
VaultLedger::registerWrappedToken(WrappedTokenEntry const& wrapped,
                                  uint32_t decimals)
{
    if (mTokens.count(wrapped.underlying) == 0)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("unknown underlying token {}"),
                        wrapped.underlying));
    }
    registerToken(TokenEntry{wrapped.id, decimals});
    mWrappedTokens.emplace(wrapped.id, wrapped);
    // the wrapper holds its underlying assets in an account of its own
    createAccount(wrapped.id);
}

void
VaultLedger::createAccount(AccountID const& account)
{
    if (mAccounts.count(account) != 0)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("account {} already exists"), account));
    }
    AccountEntry entry;
    entry.id = account;
    mAccounts.emplace(account, entry);
    ++mVersion;
}

void
VaultLedger::addPool(PoolEntry const& pool)
{
    if (hasPool(pool.id) || hasToken(pool.id))
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("pool {} already registered"), pool.id));
    }
    mPools.emplace(pool.id, pool);
    ++mVersion;
}

void
VaultLedger::setWethToken(TokenID const& token)
{
    getToken(token);
    mWethToken = token;
    ++mVersion;
}

AccountEntry&
VaultLedger::loadAccount(AccountID const& account)
{
    auto it = mAccounts.find(account);
    if (it == mAccounts.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown account {}"), account));
    }
    ++mVersion;
    return it->second;
}

AccountEntry const&
VaultLedger::getAccount(AccountID const& account) const
{
    auto it = mAccounts.find(account);
    if (it == mAccounts.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown account {}"), account));
    }
    return it->second;
}

bool
VaultLedger::credit(AccountID const& account, TokenID const& token,
                    uint256 const& amount)
{
    auto& acc = loadAccount(account);
    uint256 res;
    if (!addUnsigned(res, acc.balances[token], amount))
    {
        return false;
    }
    acc.balances[token] = res;
    return true;
}

bool
VaultLedger::debit(AccountID const& account, TokenID const& token,
                   uint256 const& amount)
{
    auto& acc = loadAccount(account);
    auto it = acc.balances.find(token);
    uint256 res;
    if (it == acc.balances.end())
    {
        return amount == 0;
    }
    if (!subUnsigned(res, it->second, amount))
    {
        return false;
    }
    it->second = res;
    return true;
}

bool
VaultLedger::creditNative(AccountID const& account, uint256 const& amount)
{
    auto& acc = loadAccount(account);
    return addUnsigned(acc.nativeBalance, acc.nativeBalance, amount);
}

bool
VaultLedger::debitNative(AccountID const& account, uint256 const& amount)
{
    auto& acc = loadAccount(account);
    return subUnsigned(acc.nativeBalance, acc.nativeBalance, amount);
}

TokenEntry const&
VaultLedger::getToken(TokenID const& token) const
{
    auto it = mTokens.find(token);
    if (it == mTokens.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown token {}"), token));
    }
    return it->second;
}

bool
VaultLedger::isWrappedToken(TokenID const& token) const
{
    return mWrappedTokens.count(token) != 0;
}

WrappedTokenEntry const&
VaultLedger::getWrappedToken(TokenID const& token) const
{
    auto it = mWrappedTokens.find(token);
    if (it == mWrappedTokens.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown wrapped token {}"), token));
    }
    return it->second;
}

WrappedTokenEntry&
VaultLedger::loadWrappedToken(TokenID const& token)
{
    auto it = mWrappedTokens.find(token);
    if (it == mWrappedTokens.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown wrapped token {}"), token));
    }
    ++mVersion;
    return it->second;
}

std::optional<TokenID> const&
VaultLedger::getWethToken() const
{
    return mWethToken;
}

PoolEntry const&
VaultLedger::getPool(PoolID const& pool) const
{
    auto it = mPools.find(pool);
    if (it == mPools.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown pool {}"), pool));
    }
    return it->second;
}

PoolEntry&
VaultLedger::loadPool(PoolID const& pool)
{
    auto it = mPools.find(pool);
    if (it == mPools.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown pool {}"), pool));
    }
    ++mVersion;
    return it->second;
}

std::map<PoolID, PoolEntry> const&
VaultLedger::getPools() const
{
    return mPools;
}

bool
VaultLedger::hasBuffer(TokenID const& wrapped) const
{
    auto it = mBuffers.find(wrapped);
    return it != mBuffers.end() && it->second.initialized;
}

BufferEntry const&
VaultLedger::getBuffer(TokenID const& wrapped) const
{
    auto it = mBuffers.find(wrapped);
    if (it == mBuffers.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("no buffer for {}"), wrapped));
    }
    return it->second;
}

BufferEntry&
VaultLedger::loadBuffer(TokenID const& wrapped)
{
    auto const& w = getWrappedToken(wrapped);
    ++mVersion;
    auto it = mBuffers.find(wrapped);
    if (it == mBuffers.end())
    {
        BufferEntry entry;
        entry.wrapped = wrapped;
        entry.underlying = w.underlying;
        it = mBuffers.emplace(wrapped, entry).first;
    }
    return it->second;
}

std::map<TokenID, BufferEntry> const&
VaultLedger::getBuffers() const
{
    return mBuffers;
}

std::map<AccountID, AccountEntry> const&
VaultLedger::getAccounts() const
{
    return mAccounts;
}

uint256
VaultLedger::getScalingFactor(TokenID const& token) const
{
    return FixedPoint::pow10(18 - getToken(token).decimals);
}

uint256
VaultLedger::getTokenRate(TokenID const& token) const
{
    auto it = mWrappedTokens.find(token);
    if (it == mWrappedTokens.end() || it->second.totalShares == 0)
    {
        return FixedPoint::ONE();
    }
    return FixedPoint::mulDivDown(it->second.totalAssets, FixedPoint::ONE(),
                                  it->second.totalShares);
}

bool
VaultLedger::hasAccount(AccountID const& account) const
{
    return mAccounts.count(account) != 0;
}

bool
VaultLedger::hasPool(PoolID const& pool) const
{
    return mPools.count(pool) != 0;
}

bool
VaultLedger::hasToken(TokenID const& token) const
{
    return mTokens.count(token) != 0 || mPools.count(token) != 0;
}

uint256
VaultLedger::getBalance(AccountID const& account, TokenID const& token) const
{
    auto const& acc = getAccount(account);
    auto it = acc.balances.find(token);
    return it == acc.balances.end() ? uint256(0) : it->second;
}

uint256
VaultLedger::getNativeBalance(AccountID const& account) const
{
    return getAccount(account).nativeBalance;
}

PoolTokenInfo
VaultLedger::getPoolTokenInfo(PoolID const& pool) const
{
    auto const& p = getPool(pool);
    PoolTokenInfo info;
    info.tokens = p.tokens;
    info.balancesRaw = p.balancesRaw;
    for (size_t i = 0; i < p.tokens.size(); ++i)
    {
        auto sf = getScalingFactor(p.tokens[i]);
        auto rate = getTokenRate(p.tokens[i]);
        info.scalingFactors.emplace_back(sf);
        info.tokenRates.emplace_back(rate);
        info.balancesLiveScaled18.emplace_back(
            FixedPoint::mulDown(mul(p.balancesRaw[i], sf), rate));
    }
    return info;
}

uint256
VaultLedger::getTotalSupply(PoolID const& pool) const
{
    return getPool(pool).totalSupply;
}

uint64_t
VaultLedger::getStateVersion() const
{
    return mVersion;
}
}
