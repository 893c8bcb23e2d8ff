#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultLedger.h"
#include "util/NonCopyable.h"

#include <vector>

/*
StateStore owns the live VaultLedger and a stack of checkpoints.

A checkpoint is a deep copy of the ledger taken at checkpoint() time.
Checkpoints nest, and only the innermost open checkpoint may be restored or
released; touching any other one throws. This mirrors the single-child rule
of a LedgerTxn: a parent cannot be modified while it has an open child.

StateTxn and ScopedRestore are the two RAII scopes built on top of it:

 - StateTxn: restores on destruction unless commit() was called. Vault
   operations run inside one so that a failed operation leaves no trace.

 - ScopedRestore: always restores on destruction, even if the scope exits
   by exception. Query variants of vault operations run inside one.
*/

namespace vaultcheck
{

class StateStore : public NonCopyable
{
  public:
    class Checkpoint
    {
        uint64_t mId;
        size_t mDepth;

        Checkpoint(uint64_t id, size_t depth) : mId(id), mDepth(depth)
        {
        }
        friend class StateStore;

      public:
        uint64_t
        getId() const
        {
            return mId;
        }
        size_t
        getDepth() const
        {
            return mDepth;
        }
    };

  private:
    struct Saved
    {
        uint64_t mId;
        VaultLedger mState;
    };

    VaultLedger mLedger;
    std::vector<Saved> mSaved;
    uint64_t mNextId{1};

    void checkInnermost(Checkpoint const& cp, char const* action) const;

  public:
    StateStore() = default;

    VaultLedger& getLedger();
    VaultLedger const& getLedger() const;

    Checkpoint checkpoint();

    // Replaces the live ledger with the checkpointed copy and closes the
    // checkpoint.
    void restore(Checkpoint const& cp);

    // Closes the checkpoint, keeping the live ledger.
    void release(Checkpoint const& cp);

    bool isInnermost(Checkpoint const& cp) const;
    VaultLedger const& getCheckpointState(Checkpoint const& cp) const;
    size_t getDepth() const;
};

class StateTxn : public NonMovableOrCopyable
{
    StateStore& mStore;
    StateStore::Checkpoint mCheckpoint;
    bool mActive{true};

  public:
    explicit StateTxn(StateStore& store);
    ~StateTxn();

    void commit();
    void rollback();

    // the ledger as it was when the transaction began
    VaultLedger const& getPrevious() const;
};

class ScopedRestore : public NonMovableOrCopyable
{
    StateStore& mStore;
    StateStore::Checkpoint mCheckpoint;

  public:
    explicit ScopedRestore(StateStore& store);
    ~ScopedRestore();
};
}
