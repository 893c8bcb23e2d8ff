#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantDoesNotHold.h"
#include "util/NonCopyable.h"
#include "vault/Vault.h"

#include <optional>
#include <stdexcept>
#include <type_traits>

namespace vaultcheck
{

class NestedInvariantCheck : public std::logic_error
{
  public:
    explicit NestedInvariantCheck(std::string const& msg)
        : std::logic_error(msg)
    {
    }
};

class InvariantDecreased : public InvariantDoesNotHold
{
  public:
    InvariantDecreased(PoolID const& pool, uint256 const& before,
                       uint256 const& after);

    PoolID const pool;
    uint256 const before;
    uint256 const after;
};

class InvariantGuard;

// Checks that the invariant of a pool does not decrease across the
// operations run between begin() and verify(). Only one check can be armed
// at a time. The invariant is computed with the same rounding on both sides.
//
// TOTAL compares the invariants themselves. PER_SHARE compares
// invariant / totalSupply, for operations such as remove liquidity that
// legitimately reduce the total. Rounding can move either invariant by one
// unit, so PER_SHARE tolerates the after side being one unit short.
class InvariantChecker : public NonMovableOrCopyable
{
  public:
    enum class State
    {
        IDLE,
        ARMED,
        VERIFIED
    };

    enum class Measure
    {
        TOTAL,
        PER_SHARE
    };

  private:
    Vault const& mVault;
    Rounding const mRounding;
    State mState{State::IDLE};
    uint64_t mGeneration{0};

    friend class InvariantGuard;

  public:
    explicit InvariantChecker(Vault const& vault, Rounding rounding = ROUND_UP);

    // throws NestedInvariantCheck while another guard is armed
    InvariantGuard begin(PoolID const& pool, Measure measure = Measure::TOTAL);

    // Runs f under a guard. The invariant is verified whether f returns or
    // throws; a decrease replaces any exception f threw.
    template <typename F>
    auto check(PoolID const& pool, F&& f, Measure measure = Measure::TOTAL)
        -> decltype(f());

    State
    getState() const
    {
        return mState;
    }

    Rounding
    getRounding() const
    {
        return mRounding;
    }
};

// Armed on construction by InvariantChecker::begin. A guard that goes out of
// scope without verify() having been called verifies in its destructor, and
// a decrease found there aborts the process.
class InvariantGuard : private NonCopyable
{
    InvariantChecker* mChecker;
    PoolID mPool;
    InvariantChecker::Measure mMeasure;
    uint64_t mGeneration;
    uint256 mBefore;
    uint256 mSupplyBefore;

    InvariantGuard(InvariantChecker& checker, PoolID const& pool,
                   InvariantChecker::Measure measure);

    // empty when the invariant did not decrease
    std::string compare(InvariantChecker const& checker, uint256& after) const;
    // disarms the guard, throws std::logic_error if it already was
    InvariantChecker& release();

    friend class InvariantChecker;

  public:
    InvariantGuard(InvariantGuard&& other);
    InvariantGuard& operator=(InvariantGuard&&) = delete;
    ~InvariantGuard();

    // throws InvariantDecreased; the guard is spent either way
    void verify();

    uint256 const&
    getBefore() const
    {
        return mBefore;
    }
};

template <typename F>
auto
InvariantChecker::check(PoolID const& pool, F&& f, Measure measure)
    -> decltype(f())
{
    auto guard = begin(pool, measure);
    if constexpr (std::is_void_v<decltype(f())>)
    {
        try
        {
            f();
        }
        catch (std::exception const&)
        {
            guard.verify();
            throw;
        }
        guard.verify();
    }
    else
    {
        std::optional<std::decay_t<decltype(f())>> res;
        try
        {
            res.emplace(f());
        }
        catch (std::exception const&)
        {
            guard.verify();
            throw;
        }
        guard.verify();
        return std::move(*res);
    }
}
}
