#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultStateReader.h"

#include <stdexcept>
#include <string>

namespace vaultcheck
{

// A scenario observed something it did not predict: an unexpected vault
// error, a mismatch against the expected outcome, or a broken property. The
// message carries the operation and the pool state at the time.
class ScenarioFailure : public std::runtime_error
{
  public:
    ScenarioFailure(std::string const& operation, std::string const& reason,
                    std::string const& poolState);

    std::string const operation;
    std::string const reason;
};

// "pool P: supply S, balances [t0: raw (scaled), ...]"
std::string describePool(VaultStateReader const& state, PoolID const& pool);
}
