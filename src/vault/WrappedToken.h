#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultLedger.h"

namespace vaultcheck
{

// ERC4626 share accounting over a WrappedTokenEntry. The preview functions
// round against the caller: deposit and redeem round down, mint and
// withdraw round up. The mutating functions move balances in the ledger and
// throw std::runtime_error if the caller cannot pay.
namespace ERC4626
{
uint256 convertToShares(WrappedTokenEntry const& w, uint256 const& assets,
                        Rounding rounding);
uint256 convertToAssets(WrappedTokenEntry const& w, uint256 const& shares,
                        Rounding rounding);

uint256 previewDeposit(WrappedTokenEntry const& w, uint256 const& assets);
uint256 previewMint(WrappedTokenEntry const& w, uint256 const& shares);
uint256 previewWithdraw(WrappedTokenEntry const& w, uint256 const& assets);
uint256 previewRedeem(WrappedTokenEntry const& w, uint256 const& shares);

// returns the shares minted to owner
uint256 deposit(VaultLedger& ledger, TokenID const& wrapped,
                AccountID const& owner, uint256 const& assets);
// returns the assets paid to owner
uint256 redeem(VaultLedger& ledger, TokenID const& wrapped,
               AccountID const& owner, uint256 const& shares);

// Adds assets to the wrapper without minting shares, raising the rate.
void donateYield(VaultLedger& ledger, TokenID const& wrapped,
                 uint256 const& assets);
}
}
