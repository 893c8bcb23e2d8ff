// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/WrappedToken.h"
#include "util/Logging.h"

#include <stdexcept>

namespace vaultcheck
{
namespace ERC4626
{

static void
creditOrThrow(VaultLedger& ledger, AccountID const& account,
              TokenID const& token, uint256 const& amount)
{
    if (!ledger.credit(account, token, amount))
    {
        throw ArithmeticOverflow(fmt::format(
            FMT_STRING("balance of {} in {} overflows"), account, token));
    }
}

uint256
convertToShares(WrappedTokenEntry const& w, uint256 const& assets,
                Rounding rounding)
{
    if (w.totalShares == 0 || w.totalAssets == 0)
    {
        return assets;
    }
    return bigDivideOrThrow(assets, w.totalShares, w.totalAssets, rounding);
}

uint256
convertToAssets(WrappedTokenEntry const& w, uint256 const& shares,
                Rounding rounding)
{
    if (w.totalShares == 0)
    {
        return shares;
    }
    return bigDivideOrThrow(shares, w.totalAssets, w.totalShares, rounding);
}

uint256
previewDeposit(WrappedTokenEntry const& w, uint256 const& assets)
{
    return convertToShares(w, assets, ROUND_DOWN);
}

uint256
previewMint(WrappedTokenEntry const& w, uint256 const& shares)
{
    return convertToAssets(w, shares, ROUND_UP);
}

uint256
previewWithdraw(WrappedTokenEntry const& w, uint256 const& assets)
{
    return convertToShares(w, assets, ROUND_UP);
}

uint256
previewRedeem(WrappedTokenEntry const& w, uint256 const& shares)
{
    return convertToAssets(w, shares, ROUND_DOWN);
}

uint256
deposit(VaultLedger& ledger, TokenID const& wrapped, AccountID const& owner,
        uint256 const& assets)
{
    auto shares = previewDeposit(ledger.getWrappedToken(wrapped), assets);
    auto& w = ledger.loadWrappedToken(wrapped);
    if (!ledger.debit(owner, w.underlying, assets))
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("{} cannot deposit {} {} into {}"), owner,
                        assets, w.underlying, wrapped));
    }
    creditOrThrow(ledger, wrapped, w.underlying, assets);
    creditOrThrow(ledger, owner, wrapped, shares);
    w.totalAssets = add(w.totalAssets, assets);
    w.totalShares = add(w.totalShares, shares);
    CLOG_TRACE(Vault, "deposit {} {} -> {} {}", assets, w.underlying, shares,
               wrapped);
    return shares;
}

uint256
redeem(VaultLedger& ledger, TokenID const& wrapped, AccountID const& owner,
       uint256 const& shares)
{
    auto assets = previewRedeem(ledger.getWrappedToken(wrapped), shares);
    auto& w = ledger.loadWrappedToken(wrapped);
    if (!ledger.debit(owner, wrapped, shares))
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("{} cannot redeem {} {}"), owner, shares, wrapped));
    }
    if (!ledger.debit(wrapped, w.underlying, assets))
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("wrapper {} holds less than {} {}"), wrapped, assets,
            w.underlying));
    }
    creditOrThrow(ledger, owner, w.underlying, assets);
    w.totalAssets = sub(w.totalAssets, assets);
    w.totalShares = sub(w.totalShares, shares);
    CLOG_TRACE(Vault, "redeem {} {} -> {} {}", shares, wrapped, assets,
               w.underlying);
    return assets;
}

void
donateYield(VaultLedger& ledger, TokenID const& wrapped, uint256 const& assets)
{
    auto& w = ledger.loadWrappedToken(wrapped);
    creditOrThrow(ledger, wrapped, w.underlying, assets);
    w.totalAssets = add(w.totalAssets, assets);
}
}
}
