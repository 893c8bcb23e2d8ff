#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"
#include "pool/PoolInvariant.h"

#include <map>
#include <memory>

namespace vaultcheck
{

class InvariantManager;

// Swaps and liquidity additions never lower a pool's invariant. Both sides
// are computed from live scaled balances rounded down. Operations that burn
// BPT are exempt since the invariant legitimately shrinks with the supply.
class PoolInvariantIsNonDecreasing : public Invariant
{
    std::map<InvariantKind, std::unique_ptr<PoolInvariant>> mPoolMath;

  public:
    PoolInvariantIsNonDecreasing();

    static std::shared_ptr<Invariant>
    registerInvariant(InvariantManager& manager);

    virtual std::string getName() const override;

    virtual std::string
    checkOnOperationApply(VaultOperation const& operation,
                          VaultDelta const& delta) override;
};
}
