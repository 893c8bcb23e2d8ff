// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/VaultReservesCoverBalances.h"
#include "invariant/InvariantManager.h"

#include <fmt/format.h>
#include <map>

namespace vaultcheck
{

std::shared_ptr<Invariant>
VaultReservesCoverBalances::registerInvariant(InvariantManager& manager)
{
    return manager.registerInvariant<VaultReservesCoverBalances>();
}

std::string
VaultReservesCoverBalances::getName() const
{
    return "VaultReservesCoverBalances";
}

static bool
addClaim(std::map<TokenID, uint256>& claims, TokenID const& token,
         uint256 const& amount)
{
    return addUnsigned(claims[token], claims[token], amount);
}

std::string
VaultReservesCoverBalances::checkOnOperationApply(
    VaultOperation const& operation, VaultDelta const& delta)
{
    auto const& ledger = delta.current;
    std::map<TokenID, uint256> claims;
    for (auto const& entry : ledger.getPools())
    {
        auto const& pool = entry.second;
        for (size_t i = 0; i < pool.tokens.size(); ++i)
        {
            if (!addClaim(claims, pool.tokens[i], pool.balancesRaw[i]))
            {
                return fmt::format(
                    FMT_STRING("Reserves of {} overflow at pool {}"),
                    pool.tokens[i], pool.id);
            }
        }
    }
    for (auto const& entry : ledger.getBuffers())
    {
        auto const& buffer = entry.second;
        if (!addClaim(claims, buffer.underlying, buffer.underlyingBalance) ||
            !addClaim(claims, buffer.wrapped, buffer.wrappedBalance))
        {
            return fmt::format(FMT_STRING("Reserves overflow at buffer {}"),
                               buffer.wrapped);
        }
    }

    for (auto const& claim : claims)
    {
        auto held = ledger.getBalance(VAULT_ACCOUNT, claim.first);
        if (held < claim.second)
        {
            return fmt::format(
                FMT_STRING("Vault holds {} {} but pools and buffers account "
                           "for {} after {}"),
                held, claim.first, claim.second, operation.toString());
        }
    }
    return {};
}
}
