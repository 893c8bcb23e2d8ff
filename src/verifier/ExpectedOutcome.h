#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/BatchRouter.h"
#include "verifier/BalanceSnapshot.h"

#include <map>
#include <stdexcept>
#include <vector>

namespace vaultcheck
{

typedef SwapPath OperationPath;

class EmptyPath : public std::invalid_argument
{
  public:
    explicit EmptyPath(std::string const& msg) : std::invalid_argument(msg)
    {
    }
};

// Signed balance changes keyed by (account, token). Adding to a key that is
// already present sums the two deltas.
class ExpectedDiffMap
{
    std::map<BalanceKey, int256> mDeltas;

  public:
    void add(AccountID const& account, TokenID const& token,
             int256 const& delta);
    void merge(ExpectedDiffMap const& other);

    // zero for keys never added
    int256 get(AccountID const& account, TokenID const& token) const;
    bool contains(AccountID const& account, TokenID const& token) const;

    std::map<BalanceKey, int256> const& entries() const;
    size_t size() const;
    bool empty() const;
};

/*
Predicts what a BalanceDiff should show once a batch of swap paths has been
executed by a sender ("payer") against the vault.

For EXACT_IN paths the given amount of tokenIn moves from the payer to the
vault and the path's limit, the expected minimum out, moves back in the
token out of the last step. For EXACT_OUT paths the given amount is paid
out in the last step's token and the limit is charged in tokenIn.

Each path settles in one token: the last step's tokenOut for EXACT_IN and
tokenIn for EXACT_OUT. Settlement amounts are kept per path, in order, and
summed per token.
*/
class ExpectedOutcomeAccumulator
{
    AccountID mPayer;
    AccountID mCounterparty;

    std::vector<uint256> mPathAmounts;
    std::map<TokenID, uint256> mTokenTotals;
    ExpectedDiffMap mDiffs;

    void accumulatePath(OperationPath const& path, SwapKind kind);

  public:
    explicit ExpectedOutcomeAccumulator(
        AccountID const& payer, AccountID const& counterparty = VAULT_ACCOUNT);

    // A failed call leaves the accumulator unchanged. Throws EmptyPath, or
    // ArithmeticOverflow when a token total passes 2^256.
    void accumulate(std::vector<OperationPath> const& paths, SwapKind kind);

    std::vector<uint256> const& pathAmounts() const;
    std::map<TokenID, uint256> const& tokenTotals() const;
    ExpectedDiffMap const& diffs() const;
};

TokenID const& settlementToken(OperationPath const& path, SwapKind kind);
}
