#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultLedger.h"
#include "vault/VaultTypes.h"

#include <string>

namespace vaultcheck
{

// The vault state on both sides of a committed operation.
struct VaultDelta
{
    VaultLedger const& previous;
    VaultLedger const& current;
};

// NOTE: The checkOn* functions should have a default implementation so that
//       more can be added in the future without requiring changes to all
//       derived classes.
class Invariant
{
    bool const mStrict;

  public:
    explicit Invariant(bool strict) : mStrict(strict)
    {
    }

    virtual ~Invariant()
    {
    }

    virtual std::string getName() const = 0;

    bool
    isStrict() const
    {
        return mStrict;
    }

    // Returns an empty string if the invariant holds, a description of the
    // violation otherwise.
    virtual std::string
    checkOnOperationApply(VaultOperation const& operation,
                          VaultDelta const& delta)
    {
        return std::string{};
    }
};
}
