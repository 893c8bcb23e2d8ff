// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "verifier/ScenarioFailure.h"

#include <fmt/format.h>

namespace vaultcheck
{

ScenarioFailure::ScenarioFailure(std::string const& operation,
                                 std::string const& reason,
                                 std::string const& poolState)
    : std::runtime_error(fmt::format(FMT_STRING("{} failed: {}\n  {}"),
                                     operation, reason, poolState))
    , operation(operation)
    , reason(reason)
{
}

std::string
describePool(VaultStateReader const& state, PoolID const& pool)
{
    if (!state.hasPool(pool))
    {
        return fmt::format(FMT_STRING("pool {}: not registered"), pool);
    }
    auto info = state.getPoolTokenInfo(pool);
    std::string res =
        fmt::format(FMT_STRING("pool {}: supply {}, balances ["), pool,
                    state.getTotalSupply(pool));
    for (size_t i = 0; i < info.tokens.size(); ++i)
    {
        if (i != 0)
        {
            res += ", ";
        }
        res += fmt::format(FMT_STRING("{}: {} ({})"), info.tokens[i],
                           info.balancesRaw[i], info.balancesLiveScaled18[i]);
    }
    res += "]";
    return res;
}
}
