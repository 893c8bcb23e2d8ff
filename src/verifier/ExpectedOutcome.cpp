// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "verifier/ExpectedOutcome.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <utility>

namespace vaultcheck
{

void
ExpectedDiffMap::add(AccountID const& account, TokenID const& token,
                     int256 const& delta)
{
    auto res = mDeltas.emplace(BalanceKey{account, token}, delta);
    if (!res.second)
    {
        res.first->second += delta;
    }
}

void
ExpectedDiffMap::merge(ExpectedDiffMap const& other)
{
    for (auto const& entry : other.mDeltas)
    {
        add(entry.first.first, entry.first.second, entry.second);
    }
}

int256
ExpectedDiffMap::get(AccountID const& account, TokenID const& token) const
{
    auto it = mDeltas.find({account, token});
    return it == mDeltas.end() ? int256(0) : it->second;
}

bool
ExpectedDiffMap::contains(AccountID const& account, TokenID const& token) const
{
    return mDeltas.find({account, token}) != mDeltas.end();
}

std::map<BalanceKey, int256> const&
ExpectedDiffMap::entries() const
{
    return mDeltas;
}

size_t
ExpectedDiffMap::size() const
{
    return mDeltas.size();
}

bool
ExpectedDiffMap::empty() const
{
    return mDeltas.empty();
}

TokenID const&
settlementToken(OperationPath const& path, SwapKind kind)
{
    if (path.steps.empty())
    {
        throw EmptyPath(
            fmt::format(FMT_STRING("path from {} has no steps"), path.tokenIn));
    }
    return kind == SwapKind::EXACT_IN ? path.steps.back().tokenOut
                                      : path.tokenIn;
}

ExpectedOutcomeAccumulator::ExpectedOutcomeAccumulator(
    AccountID const& payer, AccountID const& counterparty)
    : mPayer(payer), mCounterparty(counterparty)
{
}

void
ExpectedOutcomeAccumulator::accumulatePath(OperationPath const& path,
                                           SwapKind kind)
{
    auto const& tokenOut = path.steps.back().tokenOut;
    auto const& amountIn =
        kind == SwapKind::EXACT_IN ? path.givenAmount : path.limit;
    auto const& amountOut =
        kind == SwapKind::EXACT_IN ? path.limit : path.givenAmount;

    mDiffs.add(mPayer, path.tokenIn, -toSigned(amountIn));
    mDiffs.add(mCounterparty, path.tokenIn, toSigned(amountIn));
    mDiffs.add(mPayer, tokenOut, toSigned(amountOut));
    mDiffs.add(mCounterparty, tokenOut, -toSigned(amountOut));

    auto const& token = settlementToken(path, kind);
    auto const& settled = kind == SwapKind::EXACT_IN ? amountOut : amountIn;
    mPathAmounts.emplace_back(settled);
    auto res = mTokenTotals.emplace(token, settled);
    if (!res.second)
    {
        res.first->second = add(res.first->second, settled);
    }
}

void
ExpectedOutcomeAccumulator::accumulate(std::vector<OperationPath> const& paths,
                                       SwapKind kind)
{
    for (auto const& path : paths)
    {
        settlementToken(path, kind);
    }
    // token totals can overflow part way through
    auto next = *this;
    for (auto const& path : paths)
    {
        next.accumulatePath(path, kind);
    }
    *this = std::move(next);
    CLOG_DEBUG(Verifier, "accumulated {} paths for {}, {} settlement tokens",
               paths.size(), mPayer, mTokenTotals.size());
}

std::vector<uint256> const&
ExpectedOutcomeAccumulator::pathAmounts() const
{
    return mPathAmounts;
}

std::map<TokenID, uint256> const&
ExpectedOutcomeAccumulator::tokenTotals() const
{
    return mTokenTotals;
}

ExpectedDiffMap const&
ExpectedOutcomeAccumulator::diffs() const
{
    return mDiffs;
}
}
