#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vaultcheck
{

class Invariant;
struct VaultDelta;
struct VaultOperation;

/**
 * InvariantManager maintains a registry of available invariants and
 * supports enabling them dynamically, such as at configuration time.
 * When a vault operation commits it will check each of the enabled
 * invariants and throw InvariantDoesNotHold if a strict one is violated.
 */
class InvariantManager
{
  public:
    static std::unique_ptr<InvariantManager> create();

    virtual ~InvariantManager()
    {
    }

    virtual std::vector<std::string> getEnabledInvariants() const = 0;

    virtual void checkOnOperationApply(VaultOperation const& operation,
                                       VaultDelta const& delta) = 0;

    virtual void registerInvariant(std::shared_ptr<Invariant> invariant) = 0;

    virtual void enableInvariant(std::string const& name) = 0;

    // number of failures reported by each invariant so far
    virtual size_t getFailureCount(std::string const& name) const = 0;

    template <typename T, typename... Args>
    std::shared_ptr<T>
    registerInvariant(Args&&... args)
    {
        auto invariant = std::make_shared<T>(std::forward<Args>(args)...);
        registerInvariant(invariant);
        return invariant;
    }
};
}
