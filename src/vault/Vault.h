#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultStateReader.h"
#include "vault/VaultError.h"
#include "vault/VaultTypes.h"

#include <functional>

namespace vaultcheck
{

/*
The surface of a liquidity vault as seen by the verifier.

Every mutating operation is atomic: it either commits completely or returns
an error and leaves no observable change. Token legs are settled against
the sender when the operation completes; BPT is minted and burned directly.

The query* variants run the same code against a throwaway copy of the state,
never settle, and top up BPT burns, so they neither fail for lack of balance
nor mutate committed state.

batch() runs several operations for one sender as a single transaction and
settles only the net token movement at the end; queryBatch() is its query
form.
*/
class Vault
{
  public:
    typedef std::function<VaultStatus()> BatchBody;

    virtual ~Vault()
    {
    }

    virtual VaultResult<uint256> initialize(InitializeParams const& params) = 0;

    virtual VaultResult<AddLiquidityResult>
    addLiquidity(AddLiquidityParams const& params) = 0;
    virtual VaultResult<RemoveLiquidityResult>
    removeLiquidity(RemoveLiquidityParams const& params) = 0;
    virtual VaultResult<SwapResult> swap(SwapParams const& params) = 0;

    virtual VaultResult<AddLiquidityResult>
    queryAddLiquidity(AddLiquidityParams const& params) = 0;
    virtual VaultResult<RemoveLiquidityResult>
    queryRemoveLiquidity(RemoveLiquidityParams const& params) = 0;
    virtual VaultResult<SwapResult> querySwap(SwapParams const& params) = 0;

    virtual VaultResult<BufferLiquidityResult>
    initializeBuffer(TokenID const& wrappedToken,
                     uint256 const& exactUnderlyingIn,
                     uint256 const& exactWrappedIn,
                     uint256 const& minIssuedShares,
                     AccountID const& sender) = 0;
    virtual VaultResult<BufferLiquidityResult>
    addLiquidityToBuffer(TokenID const& wrappedToken,
                         uint256 const& maxUnderlyingIn,
                         uint256 const& maxWrappedIn,
                         uint256 const& exactSharesToIssue,
                         AccountID const& sender) = 0;
    virtual VaultResult<BufferLiquidityResult>
    removeLiquidityFromBuffer(TokenID const& wrappedToken,
                              uint256 const& sharesToRemove,
                              uint256 const& minUnderlyingOut,
                              uint256 const& minWrappedOut,
                              AccountID const& sender) = 0;
    virtual VaultResult<BufferWrapOrUnwrapResult>
    erc4626BufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params) = 0;
    virtual VaultResult<BufferWrapOrUnwrapResult>
    queryBufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params) = 0;

    virtual VaultStatus batch(AccountID const& sender,
                              BatchBody const& body) = 0;
    virtual VaultStatus queryBatch(AccountID const& sender,
                                   BatchBody const& body) = 0;

    // Reads. These throw std::out_of_range for unknown pools or buffers.
    virtual uint256 computeInvariant(PoolID const& pool,
                                     Rounding rounding) const = 0;
    virtual uint256 computeInvariant(PoolID const& pool,
                                     std::vector<uint256> const& balances,
                                     Rounding rounding) const = 0;
    virtual PoolTokenInfo getPoolTokenInfo(PoolID const& pool) const = 0;
    virtual uint256 getMinimumInvariantRatio(PoolID const& pool) const = 0;
    virtual uint256 getMaximumInvariantRatio(PoolID const& pool) const = 0;
    virtual BufferBalance getBufferBalance(TokenID const& wrapped) const = 0;

    virtual VaultStateReader const& getState() const = 0;
};
}
