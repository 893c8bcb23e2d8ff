// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantGuard.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace vaultcheck
{

InvariantDecreased::InvariantDecreased(PoolID const& pool,
                                       uint256 const& before,
                                       uint256 const& after)
    : InvariantDoesNotHold(
          fmt::format(FMT_STRING("invariant of pool {} decreased from {} to {}"),
                      pool, before, after))
    , pool(pool)
    , before(before)
    , after(after)
{
}

InvariantChecker::InvariantChecker(Vault const& vault, Rounding rounding)
    : mVault(vault), mRounding(rounding)
{
}

InvariantGuard
InvariantChecker::begin(PoolID const& pool, Measure measure)
{
    if (mState == State::ARMED)
    {
        throw NestedInvariantCheck(fmt::format(
            FMT_STRING("invariant check on {} started while another is armed"),
            pool));
    }
    InvariantGuard guard(*this, pool, measure);
    mState = State::ARMED;
    return guard;
}

InvariantGuard::InvariantGuard(InvariantChecker& checker, PoolID const& pool,
                               InvariantChecker::Measure measure)
    : mChecker(&checker)
    , mPool(pool)
    , mMeasure(measure)
    , mGeneration(++checker.mGeneration)
    , mBefore(checker.mVault.computeInvariant(pool, checker.mRounding))
{
    if (mMeasure == InvariantChecker::Measure::PER_SHARE)
    {
        mSupplyBefore = checker.mVault.getState().getTotalSupply(pool);
        if (mSupplyBefore.is_zero())
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("pool {} has no supply to measure per share"),
                pool));
        }
    }
    CLOG_TRACE(Invariant, "armed invariant check {} on {}: {}", mGeneration,
               mPool, mBefore);
}

InvariantGuard::InvariantGuard(InvariantGuard&& other)
    : mChecker(other.mChecker)
    , mPool(std::move(other.mPool))
    , mMeasure(other.mMeasure)
    , mGeneration(other.mGeneration)
    , mBefore(other.mBefore)
    , mSupplyBefore(other.mSupplyBefore)
{
    other.mChecker = nullptr;
}

std::string
InvariantGuard::compare(InvariantChecker const& checker, uint256& after) const
{
    after = checker.mVault.computeInvariant(mPool, checker.mRounding);
    if (mMeasure == InvariantChecker::Measure::TOTAL)
    {
        if (after < mBefore)
        {
            return fmt::format(FMT_STRING("{} < {}"), after, mBefore);
        }
        return {};
    }

    // (after + 1) / supplyAfter >= before / supplyBefore. Both invariants
    // are within one unit of exact, so one unit is allowed for the rounding.
    auto supplyAfter = checker.mVault.getState().getTotalSupply(mPool);
    uint512 lhs = (uint512(after) + 1) * uint512(mSupplyBefore);
    uint512 rhs = uint512(mBefore) * uint512(supplyAfter);
    if (lhs < rhs)
    {
        return fmt::format(FMT_STRING("{}/{} < {}/{}"), after, supplyAfter,
                           mBefore, mSupplyBefore);
    }
    return {};
}

InvariantChecker&
InvariantGuard::release()
{
    if (mChecker == nullptr)
    {
        throw std::logic_error("invariant guard already verified");
    }
    auto& checker = *mChecker;
    mChecker = nullptr;
    if (checker.mGeneration == mGeneration)
    {
        checker.mState = InvariantChecker::State::VERIFIED;
    }
    return checker;
}

void
InvariantGuard::verify()
{
    auto& checker = release();
    uint256 after;
    auto err = compare(checker, after);
    if (!err.empty())
    {
        CLOG_ERROR(Invariant, "invariant of {} decreased: {}", mPool, err);
        throw InvariantDecreased(mPool, mBefore, after);
    }
    CLOG_TRACE(Invariant, "verified invariant check {} on {}: {}", mGeneration,
               mPool, after);
}

InvariantGuard::~InvariantGuard()
{
    if (mChecker == nullptr)
    {
        return;
    }
    auto& checker = release();

    uint256 after;
    std::string err;
    try
    {
        err = compare(checker, after);
    }
    catch (std::exception const& e)
    {
        CLOG_ERROR(Invariant, "could not verify invariant of {} on release: {}",
                   mPool, e.what());
        return;
    }
    if (!err.empty())
    {
        auto msg = fmt::format(
            FMT_STRING("invariant of pool {} decreased on release: {}"),
            mPool, err);
        CLOG_FATAL(Invariant, "{}", msg);
        printErrorAndAbort(msg.c_str());
    }
}
}
