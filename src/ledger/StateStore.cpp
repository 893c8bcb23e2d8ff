// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/StateStore.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <stdexcept>

namespace vaultcheck
{

VaultLedger&
StateStore::getLedger()
{
    return mLedger;
}

VaultLedger const&
StateStore::getLedger() const
{
    return mLedger;
}

StateStore::Checkpoint
StateStore::checkpoint()
{
    Checkpoint cp(mNextId++, mSaved.size() + 1);
    mSaved.push_back(Saved{cp.mId, mLedger});
    CLOG_TRACE(Ledger, "checkpoint {} at depth {} (version {})", cp.mId,
               cp.mDepth, mLedger.getStateVersion());
    return cp;
}

bool
StateStore::isInnermost(Checkpoint const& cp) const
{
    return !mSaved.empty() && mSaved.back().mId == cp.mId &&
           mSaved.size() == cp.mDepth;
}

void
StateStore::checkInnermost(Checkpoint const& cp, char const* action) const
{
    if (!isInnermost(cp))
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("cannot {} checkpoint {}: not the innermost open "
                       "checkpoint"),
            action, cp.mId));
    }
}

void
StateStore::restore(Checkpoint const& cp)
{
    checkInnermost(cp, "restore");
    mLedger = std::move(mSaved.back().mState);
    mSaved.pop_back();
    CLOG_TRACE(Ledger, "restored checkpoint {} (version {})", cp.mId,
               mLedger.getStateVersion());
}

void
StateStore::release(Checkpoint const& cp)
{
    checkInnermost(cp, "release");
    mSaved.pop_back();
}

VaultLedger const&
StateStore::getCheckpointState(Checkpoint const& cp) const
{
    for (auto const& s : mSaved)
    {
        if (s.mId == cp.mId)
        {
            return s.mState;
        }
    }
    throw std::runtime_error(
        fmt::format(FMT_STRING("checkpoint {} is not open"), cp.mId));
}

size_t
StateStore::getDepth() const
{
    return mSaved.size();
}

StateTxn::StateTxn(StateStore& store)
    : mStore(store), mCheckpoint(store.checkpoint())
{
}

StateTxn::~StateTxn()
{
    if (mActive)
    {
        // scopes nest, so an open txn is always the innermost checkpoint
        releaseAssert(mStore.isInnermost(mCheckpoint));
        mStore.restore(mCheckpoint);
    }
}

void
StateTxn::commit()
{
    releaseAssertOrThrow(mActive);
    mStore.release(mCheckpoint);
    mActive = false;
}

void
StateTxn::rollback()
{
    releaseAssertOrThrow(mActive);
    mStore.restore(mCheckpoint);
    mActive = false;
}

VaultLedger const&
StateTxn::getPrevious() const
{
    return mStore.getCheckpointState(mCheckpoint);
}

ScopedRestore::ScopedRestore(StateStore& store)
    : mStore(store), mCheckpoint(store.checkpoint())
{
}

ScopedRestore::~ScopedRestore()
{
    releaseAssert(mStore.isInnermost(mCheckpoint));
    mStore.restore(mCheckpoint);
}
}
