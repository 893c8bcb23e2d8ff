#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"

#include <memory>

namespace vaultcheck
{

class InvariantManager;

// Each pool's totalSupply equals the sum of all accounts' BPT holdings.
class BptSupplyMatchesHoldings : public Invariant
{
  public:
    BptSupplyMatchesHoldings() : Invariant(true)
    {
    }

    static std::shared_ptr<Invariant>
    registerInvariant(InvariantManager& manager);

    virtual std::string getName() const override;

    virtual std::string
    checkOnOperationApply(VaultOperation const& operation,
                          VaultDelta const& delta) override;
};
}
