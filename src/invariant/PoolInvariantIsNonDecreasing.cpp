// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/PoolInvariantIsNonDecreasing.h"
#include "invariant/InvariantManager.h"

#include <fmt/format.h>

namespace vaultcheck
{

PoolInvariantIsNonDecreasing::PoolInvariantIsNonDecreasing() : Invariant(true)
{
    for (auto kind : {InvariantKind::LINEAR, InvariantKind::CONSTANT_PRODUCT})
    {
        mPoolMath.emplace(kind, makePoolInvariant(kind));
    }
}

std::shared_ptr<Invariant>
PoolInvariantIsNonDecreasing::registerInvariant(InvariantManager& manager)
{
    return manager.registerInvariant<PoolInvariantIsNonDecreasing>();
}

std::string
PoolInvariantIsNonDecreasing::getName() const
{
    return "PoolInvariantIsNonDecreasing";
}

std::string
PoolInvariantIsNonDecreasing::checkOnOperationApply(
    VaultOperation const& operation, VaultDelta const& delta)
{
    if (operation.type == VaultOperationType::REMOVE_LIQUIDITY)
    {
        return {};
    }

    for (auto const& entry : delta.current.getPools())
    {
        auto const& current = entry.second;
        if (!delta.previous.hasPool(entry.first))
        {
            continue;
        }
        auto const& previous = delta.previous.getPool(entry.first);
        if (!previous.initialized || current.totalSupply < previous.totalSupply)
        {
            continue;
        }

        auto const& math = *mPoolMath.at(current.kind);
        auto before = math.computeInvariant(
            delta.previous.getPoolTokenInfo(entry.first).balancesLiveScaled18,
            ROUND_DOWN);
        auto after = math.computeInvariant(
            delta.current.getPoolTokenInfo(entry.first).balancesLiveScaled18,
            ROUND_DOWN);
        if (after < before)
        {
            return fmt::format(
                FMT_STRING("Invariant of pool {} decreased from {} to {} "
                           "after {}"),
                entry.first, before, after, operation.toString());
        }
    }
    return {};
}
}
