#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"

#include <memory>

namespace vaultcheck
{

class InvariantManager;

// For every token, the vault account holds at least what the pools and
// buffers claim to hold.
class VaultReservesCoverBalances : public Invariant
{
  public:
    VaultReservesCoverBalances() : Invariant(true)
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
