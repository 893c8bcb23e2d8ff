// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/BptSupplyMatchesHoldings.h"
#include "invariant/InvariantManager.h"

#include <fmt/format.h>

namespace vaultcheck
{

std::shared_ptr<Invariant>
BptSupplyMatchesHoldings::registerInvariant(InvariantManager& manager)
{
    return manager.registerInvariant<BptSupplyMatchesHoldings>();
}

std::string
BptSupplyMatchesHoldings::getName() const
{
    return "BptSupplyMatchesHoldings";
}

std::string
BptSupplyMatchesHoldings::checkOnOperationApply(
    VaultOperation const& operation, VaultDelta const& delta)
{
    auto const& ledger = delta.current;
    for (auto const& entry : ledger.getPools())
    {
        uint256 held;
        for (auto const& account : ledger.getAccounts())
        {
            auto it = account.second.balances.find(entry.first);
            if (it != account.second.balances.end() &&
                !addUnsigned(held, held, it->second))
            {
                return fmt::format(
                    FMT_STRING("BPT holdings of pool {} overflow"),
                    entry.first);
            }
        }
        if (held != entry.second.totalSupply)
        {
            return fmt::format(
                FMT_STRING("Pool {} has totalSupply {} but accounts hold {} "
                           "after {}"),
                entry.first, entry.second.totalSupply, held,
                operation.toString());
        }
    }
    return {};
}
}
