// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "verifier/BalanceSnapshot.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace vaultcheck
{

BalanceSnapshot
BalanceSnapshot::capture(VaultStateReader const& reader,
                         std::set<AccountID> const& accounts,
                         std::vector<TokenID> const& tokens,
                         PoolID const& pool, bool includeNative)
{
    BalanceSnapshot snap;
    snap.mAccounts = accounts;
    snap.mTokens = tokens;
    snap.mPool = pool;
    snap.mIncludeNative = includeNative;
    snap.mStateVersion = reader.getStateVersion();

    if (!pool.empty() && !reader.hasPool(pool))
    {
        throw StateReadError(fmt::format(FMT_STRING("unknown pool {}"), pool));
    }
    for (auto const& token : tokens)
    {
        if (!reader.hasToken(token))
        {
            throw StateReadError(
                fmt::format(FMT_STRING("unknown token {}"), token));
        }
    }

    for (auto const& account : accounts)
    {
        if (!reader.hasAccount(account))
        {
            throw StateReadError(
                fmt::format(FMT_STRING("unknown account {}"), account));
        }
        for (auto const& token : tokens)
        {
            snap.mBalances[{account, token}] =
                reader.getBalance(account, token);
        }
        if (!pool.empty())
        {
            snap.mBalances[{account, pool}] = reader.getBalance(account, pool);
        }
        if (includeNative)
        {
            snap.mNativeBalances[account] = reader.getNativeBalance(account);
        }
    }

    if (!pool.empty())
    {
        auto info = reader.getPoolTokenInfo(pool);
        snap.mPoolTokens = info.tokens;
        snap.mPoolBalancesRaw = info.balancesRaw;
        snap.mPoolBalancesScaled18 = info.balancesLiveScaled18;
        snap.mTotalSupply = reader.getTotalSupply(pool);
    }

    if (reader.getStateVersion() != snap.mStateVersion)
    {
        throw StateReadError(fmt::format(
            FMT_STRING("state moved from version {} to {} during capture"),
            snap.mStateVersion, reader.getStateVersion()));
    }
    CLOG_TRACE(Verifier, "captured {} balances at version {}",
               snap.mBalances.size(), snap.mStateVersion);
    return snap;
}

std::set<AccountID> const&
BalanceSnapshot::getAccounts() const
{
    return mAccounts;
}

std::vector<TokenID> const&
BalanceSnapshot::getTokens() const
{
    return mTokens;
}

PoolID const&
BalanceSnapshot::getPool() const
{
    return mPool;
}

bool
BalanceSnapshot::includesNative() const
{
    return mIncludeNative;
}

uint64_t
BalanceSnapshot::getStateVersion() const
{
    return mStateVersion;
}

uint256 const&
BalanceSnapshot::getBalance(AccountID const& account,
                            TokenID const& token) const
{
    auto it = mBalances.find({account, token});
    if (it == mBalances.end())
    {
        throw StateReadError(
            fmt::format(FMT_STRING("snapshot does not cover {} of {}"), token,
                        account));
    }
    return it->second;
}

uint256 const&
BalanceSnapshot::getNativeBalance(AccountID const& account) const
{
    auto it = mNativeBalances.find(account);
    if (it == mNativeBalances.end())
    {
        throw StateReadError(fmt::format(
            FMT_STRING("snapshot does not cover native balance of {}"),
            account));
    }
    return it->second;
}

std::map<BalanceKey, uint256> const&
BalanceSnapshot::getBalances() const
{
    return mBalances;
}

std::vector<TokenID> const&
BalanceSnapshot::getPoolTokens() const
{
    return mPoolTokens;
}

std::vector<uint256> const&
BalanceSnapshot::getPoolBalancesRaw() const
{
    return mPoolBalancesRaw;
}

std::vector<uint256> const&
BalanceSnapshot::getPoolBalancesScaled18() const
{
    return mPoolBalancesScaled18;
}

uint256 const&
BalanceSnapshot::getTotalSupply() const
{
    return mTotalSupply;
}

int256 const&
BalanceDiff::get(AccountID const& account, TokenID const& token) const
{
    auto it = balances.find({account, token});
    if (it == balances.end())
    {
        throw std::out_of_range(fmt::format(
            FMT_STRING("diff does not cover {} of {}"), token, account));
    }
    return it->second;
}

int256 const&
BalanceDiff::getNative(AccountID const& account) const
{
    auto it = nativeBalances.find(account);
    if (it == nativeBalances.end())
    {
        throw std::out_of_range(fmt::format(
            FMT_STRING("diff does not cover native balance of {}"), account));
    }
    return it->second;
}

static std::vector<int256>
diffVectors(std::vector<uint256> const& before,
            std::vector<uint256> const& after)
{
    std::vector<int256> res;
    res.reserve(before.size());
    for (size_t i = 0; i < before.size(); ++i)
    {
        res.emplace_back(delta(before[i], after[i]));
    }
    return res;
}

BalanceDiff
diff(BalanceSnapshot const& before, BalanceSnapshot const& after)
{
    if (before.getAccounts() != after.getAccounts() ||
        before.getTokens() != after.getTokens() ||
        before.getPool() != after.getPool() ||
        before.includesNative() != after.includesNative() ||
        before.getPoolTokens() != after.getPoolTokens())
    {
        throw SnapshotMismatch(
            "snapshots do not cover the same accounts, tokens and pool");
    }

    BalanceDiff res;
    for (auto const& entry : before.getBalances())
    {
        res.balances[entry.first] =
            delta(entry.second,
                  after.getBalance(entry.first.first, entry.first.second));
    }
    if (before.includesNative())
    {
        for (auto const& account : before.getAccounts())
        {
            res.nativeBalances[account] =
                delta(before.getNativeBalance(account),
                      after.getNativeBalance(account));
        }
    }
    res.poolBalancesRaw = diffVectors(before.getPoolBalancesRaw(),
                                      after.getPoolBalancesRaw());
    res.poolBalancesScaled18 = diffVectors(before.getPoolBalancesScaled18(),
                                           after.getPoolBalancesScaled18());
    res.totalSupply = delta(before.getTotalSupply(), after.getTotalSupply());
    return res;
}
}
