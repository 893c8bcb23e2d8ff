// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

#include "invariant/InvariantManager.h"

#include <map>
#include <vector>

namespace vaultcheck
{

class InvariantManagerImpl : public InvariantManager
{
    std::map<std::string, std::shared_ptr<Invariant>> mInvariants;
    std::vector<std::shared_ptr<Invariant>> mEnabled;

    struct InvariantFailureInformation
    {
        size_t count;
        std::string lastFailedWithMessage;
    };
    std::map<std::string, InvariantFailureInformation> mFailureInformation;

  public:
    InvariantManagerImpl();

    std::vector<std::string> getEnabledInvariants() const override;

    void checkOnOperationApply(VaultOperation const& operation,
                               VaultDelta const& delta) override;

    void registerInvariant(std::shared_ptr<Invariant> invariant) override;

    void enableInvariant(std::string const& name) override;

    size_t getFailureCount(std::string const& name) const override;

  private:
    void onInvariantFailure(std::shared_ptr<Invariant> invariant,
                            std::string const& message);

    virtual void handleInvariantFailure(std::shared_ptr<Invariant> invariant,
                                        std::string const& message) const;
};
}
