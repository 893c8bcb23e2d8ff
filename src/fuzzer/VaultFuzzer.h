#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/Fuzzer.h"
#include "invariant/InvariantGuard.h"
#include "util/FixedPoint.h"
#include "util/Math.h"
#include "vault/VaultImpl.h"
#include "verifier/BalanceSnapshot.h"
#include "verifier/ExpectedOutcome.h"

#include <array>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vaultcheck
{

struct FuzzOptions
{
    uint64_t runs{100};
    unsigned int seed{1};
    InvariantKind poolKind{InvariantKind::LINEAR};
    // initial pool balances, scaled to 18 decimals
    uint256 minBalance{FixedPoint::fp(1)};
    uint256 maxBalance{FixedPoint::fp(1000000000)};
    uint256 maxSkew{1000};
    std::vector<std::string> invariantChecks{".*"};
};

/*
Runs sequences of vault operations derived from raw 256-bit words.

An input is a list of words, four per action: the action selector, a raw
amount, a token selector and one extra word. Every amount is bounded into
a range the operation can accept before the operation runs. Each pool
operation then runs under an InvariantChecker with balance snapshots taken
on both sides, and the observed diff must match the amounts the vault
returned, exactly.

A vault error that bounded inputs can legitimately hit (a limit, a ratio
bound, a trade that is too small) is counted as a skip. Anything else,
including an arithmetic error, a decreased invariant or a diff mismatch,
is thrown as a ScenarioFailure. State is restored after every input, so
inputs are independent of each other.
*/
class VaultFuzzer : public Fuzzer
{
  public:
    enum class Action
    {
        ADD_PROPORTIONAL,
        ADD_UNBALANCED,
        ADD_SINGLE_TOKEN_EXACT_OUT,
        REMOVE_PROPORTIONAL,
        REMOVE_SINGLE_TOKEN_EXACT_IN,
        REMOVE_SINGLE_TOKEN_EXACT_OUT,
        SWAP_EXACT_IN,
        SWAP_EXACT_OUT,
        ROUND_TRIP_SWAP,
        WRAP,
        UNWRAP,
        DONATE_YIELD
    };
    static constexpr size_t NUM_ACTIONS = 12;
    static constexpr size_t WORDS_PER_ACTION = 4;
    static constexpr size_t ACTIONS_PER_INPUT = 16;

    struct ActionStats
    {
        uint64_t runs{0};
        uint64_t succeeded{0};
        uint64_t skipped{0};
    };

    static PoolID const POOL;
    static TokenID const DAI;
    static TokenID const USDC;
    static TokenID const WA_DAI;
    static AccountID const LP;
    static AccountID const TRADER;

  private:
    typedef std::array<uint256, WORDS_PER_ACTION> ActionWords;

    FuzzOptions mOptions;
    std::unique_ptr<VaultImpl> mVault;
    std::unique_ptr<InvariantChecker> mChecker;
    std::map<Action, ActionStats> mStats;
    vaultcheck_default_random_engine mEngine;
    uint64_t mInputs{0};

    BalanceSnapshot capture() const;
    [[noreturn]] void fail(std::string const& operation,
                           std::string const& reason) const;

    // true on success, false for a skip; throws ScenarioFailure otherwise
    bool handleError(std::string const& operation,
                     VaultError const& error) const;

    template <typename Op, typename Expect>
    bool runChecked(std::string const& operation,
                    InvariantChecker::Measure measure, Op&& op,
                    Expect&& expect);

    bool runAction(Action action, ActionWords const& words,
                   std::string& operation);
    void applyAction(ActionWords const& words);

    bool addLiquidity(AddLiquidityKind kind, ActionWords const& words,
                      std::string& operation);
    bool removeLiquidity(RemoveLiquidityKind kind, ActionWords const& words,
                         std::string& operation);
    bool swap(SwapKind kind, ActionWords const& words, std::string& operation);
    bool roundTripSwap(ActionWords const& words, std::string& operation);
    bool wrapOrUnwrap(WrappingDirection direction, ActionWords const& words,
                      std::string& operation);
    bool donateYield(ActionWords const& words, std::string& operation);

    // raw amount of token `a` no larger than either its own balance or
    // the balance of token `b`, compared in scaled18 units
    uint256 swapCapacity(PoolTokenInfo const& info, size_t a, size_t b) const;

  public:
    explicit VaultFuzzer(FuzzOptions const& options);
    ~VaultFuzzer() override;

    void initialize() override;
    void inject(std::string const& filename) override;
    void shutdown() override;
    void genFuzz(std::string const& filename) override;
    size_t inputSizeLimit() const override;

    // Applies one input; words past inputSizeLimit() are ignored and a
    // trailing partial action is dropped.
    void injectWords(std::vector<uint256> const& words);

    // options.runs inputs drawn from a generator seeded with options.seed
    void runCampaign();

    std::vector<uint256> generateInput();

    std::map<Action, ActionStats> const& getStats() const;
    uint64_t getInputCount() const;
    VaultImpl& getVault();
};

std::string toString(VaultFuzzer::Action action);
}
