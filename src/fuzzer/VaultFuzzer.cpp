// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/VaultFuzzer.h"
#include "fuzzer/BoundedInput.h"
#include "util/Logging.h"
#include "verifier/OutcomeComparator.h"
#include "verifier/ScenarioFailure.h"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace vaultcheck
{

PoolID const VaultFuzzer::POOL = "fuzz-pool";
TokenID const VaultFuzzer::DAI = "DAI";
TokenID const VaultFuzzer::USDC = "USDC";
TokenID const VaultFuzzer::WA_DAI = "waDAI";
AccountID const VaultFuzzer::LP = "lp";
AccountID const VaultFuzzer::TRADER = "trader";

namespace
{
constexpr size_t WORD_BYTES = 32;

size_t
toIndex(uint256 const& word, size_t n)
{
    return static_cast<size_t>(word % n);
}

std::string
describeAmounts(std::vector<uint256> const& amounts)
{
    std::string res = "[";
    for (size_t i = 0; i < amounts.size(); ++i)
    {
        res += fmt::format(FMT_STRING("{}{}"), i == 0 ? "" : ", ", amounts[i]);
    }
    return res + "]";
}
}

std::string
toString(VaultFuzzer::Action action)
{
    switch (action)
    {
    case VaultFuzzer::Action::ADD_PROPORTIONAL:
        return "ADD_PROPORTIONAL";
    case VaultFuzzer::Action::ADD_UNBALANCED:
        return "ADD_UNBALANCED";
    case VaultFuzzer::Action::ADD_SINGLE_TOKEN_EXACT_OUT:
        return "ADD_SINGLE_TOKEN_EXACT_OUT";
    case VaultFuzzer::Action::REMOVE_PROPORTIONAL:
        return "REMOVE_PROPORTIONAL";
    case VaultFuzzer::Action::REMOVE_SINGLE_TOKEN_EXACT_IN:
        return "REMOVE_SINGLE_TOKEN_EXACT_IN";
    case VaultFuzzer::Action::REMOVE_SINGLE_TOKEN_EXACT_OUT:
        return "REMOVE_SINGLE_TOKEN_EXACT_OUT";
    case VaultFuzzer::Action::SWAP_EXACT_IN:
        return "SWAP_EXACT_IN";
    case VaultFuzzer::Action::SWAP_EXACT_OUT:
        return "SWAP_EXACT_OUT";
    case VaultFuzzer::Action::ROUND_TRIP_SWAP:
        return "ROUND_TRIP_SWAP";
    case VaultFuzzer::Action::WRAP:
        return "WRAP";
    case VaultFuzzer::Action::UNWRAP:
        return "UNWRAP";
    case VaultFuzzer::Action::DONATE_YIELD:
        return "DONATE_YIELD";
    }
    throw std::invalid_argument("unknown fuzz action");
}

VaultFuzzer::VaultFuzzer(FuzzOptions const& options)
    : mOptions(options), mEngine(options.seed)
{
}

VaultFuzzer::~VaultFuzzer()
{
}

void
VaultFuzzer::initialize()
{
    mVault = std::make_unique<VaultImpl>(mOptions.invariantChecks);
    mChecker = std::make_unique<InvariantChecker>(*mVault);
    mStats.clear();
    mInputs = 0;

    auto& vault = *mVault;
    vault.registerToken(DAI, 18);
    vault.registerToken(USDC, 6);
    vault.registerWrappedToken(WA_DAI, DAI, 18);
    vault.createAccount(LP);
    vault.createAccount(TRADER);

    // enough of everything that no operation on bounded amounts runs out
    auto funding = saturatingMultiply(mOptions.maxBalance, 1000,
                                      maxUint256() / 1024);
    auto usdcFunding = funding / FixedPoint::pow10(12);
    for (auto const& account : {LP, TRADER})
    {
        vault.mint(account, DAI, funding);
        vault.mint(account, USDC, usdcFunding);
        vault.mint(account, WA_DAI, funding / 4);
    }

    // the pool's own parameters come from the seed, like any input
    vaultcheck_default_random_engine setup(mOptions.seed);
    std::vector<uint256> raw{rand_uint256(setup), rand_uint256(setup)};
    auto balances = boundBalances(raw, mOptions.minBalance,
                                  mOptions.maxBalance, mOptions.maxSkew);

    PoolConfig config;
    config.id = POOL;
    config.kind = mOptions.poolKind;
    config.tokens = {DAI, USDC};
    config.minSwapFee = FixedPoint::pow10(12);
    config.maxSwapFee = FixedPoint::pow10(17);
    config.swapFee = boundSwapFee(rand_uint256(setup), config.minSwapFee,
                                  config.maxSwapFee);
    vault.registerPool(config).value();

    InitializeParams init;
    init.pool = POOL;
    init.sender = LP;
    init.exactAmountsIn = {
        balances[0], std::max(uint256(1), balances[1] / FixedPoint::pow10(12))};
    auto bpt = vault.initialize(init).value();

    auto bufferAmount = std::min(balances[0], funding / 8);
    vault
        .initializeBuffer(WA_DAI, bufferAmount, bufferAmount, uint256(0), LP)
        .value();

    CLOG_INFO(Fuzz,
              "fuzzer initialized: {} pool, balances {}, fee {}, {} BPT to {}",
              toString(mOptions.poolKind), describeAmounts(init.exactAmountsIn),
              config.swapFee, bpt, LP);
}

void
VaultFuzzer::shutdown()
{
    for (auto const& entry : mStats)
    {
        CLOG_INFO(Fuzz, "{}: {} runs, {} succeeded, {} skipped",
                  toString(entry.first), entry.second.runs,
                  entry.second.succeeded, entry.second.skipped);
    }
    CLOG_INFO(Fuzz, "{} inputs applied", mInputs);
    mChecker.reset();
    mVault.reset();
}

size_t
VaultFuzzer::inputSizeLimit() const
{
    return ACTIONS_PER_INPUT * WORDS_PER_ACTION * WORD_BYTES;
}

std::vector<uint256>
VaultFuzzer::generateInput()
{
    std::vector<uint256> words;
    words.reserve(ACTIONS_PER_INPUT * WORDS_PER_ACTION);
    for (size_t i = 0; i < ACTIONS_PER_INPUT * WORDS_PER_ACTION; ++i)
    {
        words.emplace_back(rand_uint256(mEngine));
    }
    return words;
}

void
VaultFuzzer::genFuzz(std::string const& filename)
{
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("cannot open {} for writing"), filename));
    }
    for (auto const& word : generateInput())
    {
        // big-endian, 32 bytes per word
        for (size_t i = 0; i < WORD_BYTES; ++i)
        {
            auto byte = static_cast<char>(static_cast<uint8_t>(
                (word >> (8 * (WORD_BYTES - 1 - i))) & 0xff));
            out.put(byte);
        }
    }
    if (!out)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("error writing {}"), filename));
    }
}

void
VaultFuzzer::inject(std::string const& filename)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("cannot open {}"), filename));
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
    bytes.resize(std::min(bytes.size(), inputSizeLimit()));

    std::vector<uint256> words;
    for (size_t off = 0; off + WORD_BYTES <= bytes.size(); off += WORD_BYTES)
    {
        uint256 word;
        for (size_t i = 0; i < WORD_BYTES; ++i)
        {
            word <<= 8;
            word |= static_cast<uint8_t>(bytes[off + i]);
        }
        words.emplace_back(word);
    }
    injectWords(words);
}

void
VaultFuzzer::injectWords(std::vector<uint256> const& words)
{
    if (!mVault)
    {
        throw std::logic_error("fuzzer is not initialized");
    }
    ScopedRestore restore(mVault->getStateStore());
    auto n = std::min(words.size() / WORDS_PER_ACTION, ACTIONS_PER_INPUT);
    for (size_t i = 0; i < n; ++i)
    {
        ActionWords action;
        std::copy_n(words.begin() + i * WORDS_PER_ACTION, WORDS_PER_ACTION,
                    action.begin());
        applyAction(action);
    }
    ++mInputs;
}

void
VaultFuzzer::runCampaign()
{
    mEngine.seed(mOptions.seed);
    for (uint64_t run = 0; run < mOptions.runs; ++run)
    {
        injectWords(generateInput());
    }
}

std::map<VaultFuzzer::Action, VaultFuzzer::ActionStats> const&
VaultFuzzer::getStats() const
{
    return mStats;
}

uint64_t
VaultFuzzer::getInputCount() const
{
    return mInputs;
}

VaultImpl&
VaultFuzzer::getVault()
{
    if (!mVault)
    {
        throw std::logic_error("fuzzer is not initialized");
    }
    return *mVault;
}

BalanceSnapshot
VaultFuzzer::capture() const
{
    return BalanceSnapshot::capture(mVault->getState(),
                                    {LP, TRADER, VAULT_ACCOUNT},
                                    {DAI, USDC, WA_DAI}, POOL);
}

void
VaultFuzzer::fail(std::string const& operation,
                  std::string const& reason) const
{
    throw ScenarioFailure(operation, reason,
                          describePool(mVault->getState(), POOL));
}

bool
VaultFuzzer::handleError(std::string const& operation,
                         VaultError const& error) const
{
    switch (error.code)
    {
    case VaultErrorCode::ARITHMETIC:
    case VaultErrorCode::VAULT_LOCKED:
    case VaultErrorCode::ACCOUNT_NOT_FOUND:
    case VaultErrorCode::POOL_NOT_REGISTERED:
    case VaultErrorCode::POOL_NOT_INITIALIZED:
    case VaultErrorCode::TOKEN_NOT_REGISTERED:
    case VaultErrorCode::BUFFER_NOT_INITIALIZED:
    case VaultErrorCode::INVALID_INPUT:
        fail(operation, error.toString());
    default:
        CLOG_TRACE(Fuzz, "{} skipped: {}", operation, error.toString());
        return false;
    }
}

template <typename Op, typename Expect>
bool
VaultFuzzer::runChecked(std::string const& operation,
                        InvariantChecker::Measure measure, Op&& op,
                        Expect&& expect)
{
    auto before = capture();
    auto res = mChecker->check(POOL, std::forward<Op>(op), measure);
    if (!res)
    {
        return handleError(operation, res.error());
    }
    auto after = capture();

    ExpectedDiffMap expected = expect(res.value());
    auto err =
        compareDiffs(expected, diff(before, after), Tolerance::exact(), true);
    if (!err.empty())
    {
        fail(operation, err);
    }
    return true;
}

uint256
VaultFuzzer::swapCapacity(PoolTokenInfo const& info, size_t a,
                          size_t b) const
{
    return std::min(info.balancesRaw[a],
                    info.balancesLiveScaled18[b] / info.scalingFactors[a]);
}

bool
VaultFuzzer::addLiquidity(AddLiquidityKind kind, ActionWords const& words,
                          std::string& operation)
{
    auto& vault = *mVault;
    auto info = vault.getPoolTokenInfo(POOL);
    auto supply = vault.getState().getTotalSupply(POOL);
    auto minRatio = vault.getMinimumInvariantRatio(POOL);
    auto maxRatio = vault.getMaximumInvariantRatio(POOL);
    auto i = toIndex(words[2], info.tokens.size());

    AddLiquidityParams params;
    params.pool = POOL;
    params.to = LP;
    params.kind = kind;
    params.maxAmountsIn.assign(info.tokens.size(), uint256(0));
    switch (kind)
    {
    case AddLiquidityKind::PROPORTIONAL:
        params.minBptAmountOut =
            boundBptAmount(words[1], supply, minRatio, maxRatio);
        params.maxAmountsIn.assign(info.tokens.size(), maxUint256());
        break;
    case AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT:
        params.minBptAmountOut =
            boundBptAmount(words[1], supply, minRatio, maxRatio);
        params.maxAmountsIn[i] = maxUint256();
        break;
    default:
        for (size_t t = 0; t < info.tokens.size(); ++t)
        {
            auto const& raw = t == i ? words[1] : words[3];
            params.maxAmountsIn[t] = boundAmountForInvariantRatio(
                raw, info.balancesRaw[t], minRatio, maxRatio, uint256(0));
        }
        break;
    }

    operation = fmt::format(FMT_STRING("addLiquidity {} to {}: max in {}, "
                                       "bpt {}"),
                            toString(kind), params.to,
                            describeAmounts(params.maxAmountsIn),
                            params.minBptAmountOut);
    return runChecked(
        operation, InvariantChecker::Measure::TOTAL,
        [&] { return vault.addLiquidity(params); },
        [&](AddLiquidityResult const& r) {
            ExpectedDiffMap expected;
            for (size_t t = 0; t < info.tokens.size(); ++t)
            {
                expected.add(LP, info.tokens[t], -toSigned(r.amountsIn[t]));
                expected.add(VAULT_ACCOUNT, info.tokens[t],
                             toSigned(r.amountsIn[t]));
            }
            expected.add(LP, POOL, toSigned(r.bptAmountOut));
            return expected;
        });
}

bool
VaultFuzzer::removeLiquidity(RemoveLiquidityKind kind,
                             ActionWords const& words, std::string& operation)
{
    auto& vault = *mVault;
    auto const& state = vault.getState();
    auto info = vault.getPoolTokenInfo(POOL);
    auto supply = state.getTotalSupply(POOL);
    auto held = state.getBalance(LP, POOL);
    auto minRatio = vault.getMinimumInvariantRatio(POOL);
    auto maxRatio = vault.getMaximumInvariantRatio(POOL);
    auto i = toIndex(words[2], info.tokens.size());

    RemoveLiquidityParams params;
    params.pool = POOL;
    params.from = LP;
    params.kind = kind;
    params.minAmountsOut.assign(info.tokens.size(), uint256(0));
    if (kind == RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT)
    {
        // never more than half of the balance
        params.minAmountsOut[i] = boundAmountForInvariantRatio(
            words[1], info.balancesRaw[i] / 2, minRatio, maxRatio, uint256(1));
        params.maxBptAmountIn = held;
    }
    else
    {
        params.maxBptAmountIn = std::min(
            held, boundBptAmount(words[1], supply, minRatio, maxRatio));
        if (kind == RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN)
        {
            // keep the BPT worth at most half of what token i holds
            auto invariant = vault.computeInvariant(POOL, ROUND_UP);
            auto covered = bigDivideOrThrow(
                supply, info.balancesLiveScaled18[i], invariant, ROUND_DOWN);
            params.maxBptAmountIn =
                std::min(params.maxBptAmountIn, covered / 2);
            params.minAmountsOut[i] = 1;
        }
    }

    operation = fmt::format(
        FMT_STRING("removeLiquidity {} from {}: bpt {}, min out {}"),
        toString(kind), params.from, params.maxBptAmountIn,
        describeAmounts(params.minAmountsOut));
    return runChecked(
        operation, InvariantChecker::Measure::PER_SHARE,
        [&] { return vault.removeLiquidity(params); },
        [&](RemoveLiquidityResult const& r) {
            ExpectedDiffMap expected;
            for (size_t t = 0; t < info.tokens.size(); ++t)
            {
                expected.add(LP, info.tokens[t], toSigned(r.amountsOut[t]));
                expected.add(VAULT_ACCOUNT, info.tokens[t],
                             -toSigned(r.amountsOut[t]));
            }
            expected.add(LP, POOL, -toSigned(r.bptAmountIn));
            return expected;
        });
}

bool
VaultFuzzer::swap(SwapKind kind, ActionWords const& words,
                  std::string& operation)
{
    auto& vault = *mVault;
    auto info = vault.getPoolTokenInfo(POOL);
    auto in = toIndex(words[2], info.tokens.size());
    auto out = (in + 1) % info.tokens.size();

    SwapParams params;
    params.kind = kind;
    params.pool = POOL;
    params.tokenIn = info.tokens[in];
    params.tokenOut = info.tokens[out];
    params.sender = TRADER;
    if (kind == SwapKind::EXACT_IN)
    {
        params.amountGivenRaw =
            boundSwapAmount(words[1], swapCapacity(info, in, out));
        params.limitRaw = 0;
    }
    else
    {
        params.amountGivenRaw =
            boundSwapAmount(words[1], swapCapacity(info, out, in));
        params.limitRaw = maxUint256();
    }

    operation = fmt::format(FMT_STRING("swap {} {} {} -> {}"), toString(kind),
                            params.amountGivenRaw, params.tokenIn,
                            params.tokenOut);
    return runChecked(
        operation, InvariantChecker::Measure::TOTAL,
        [&] { return vault.swap(params); },
        [&](SwapResult const& r) {
            ExpectedDiffMap expected;
            expected.add(TRADER, params.tokenIn, -toSigned(r.amountIn));
            expected.add(VAULT_ACCOUNT, params.tokenIn, toSigned(r.amountIn));
            expected.add(TRADER, params.tokenOut, toSigned(r.amountOut));
            expected.add(VAULT_ACCOUNT, params.tokenOut,
                         -toSigned(r.amountOut));
            return expected;
        });
}

bool
VaultFuzzer::roundTripSwap(ActionWords const& words, std::string& operation)
{
    auto& vault = *mVault;
    auto info = vault.getPoolTokenInfo(POOL);
    auto a = toIndex(words[2], info.tokens.size());
    auto b = (a + 1) % info.tokens.size();

    SwapParams there;
    there.kind = SwapKind::EXACT_IN;
    there.pool = POOL;
    there.tokenIn = info.tokens[a];
    there.tokenOut = info.tokens[b];
    there.amountGivenRaw = boundSwapAmount(words[1], swapCapacity(info, a, b));
    there.sender = TRADER;
    operation = fmt::format(FMT_STRING("round trip {} {} via {}"),
                            there.amountGivenRaw, there.tokenIn,
                            there.tokenOut);

    auto first = mChecker->check(POOL, [&] { return vault.swap(there); });
    if (!first)
    {
        return handleError(operation, first.error());
    }

    SwapParams back = there;
    back.tokenIn = there.tokenOut;
    back.tokenOut = there.tokenIn;
    back.amountGivenRaw = first.value().amountOut;
    auto second = mChecker->check(POOL, [&] { return vault.swap(back); });
    if (!second)
    {
        return handleError(operation, second.error());
    }

    auto const& returned = second.value().amountOut;
    if (returned > there.amountGivenRaw)
    {
        fail(operation,
             fmt::format(FMT_STRING("got back {} for {}"), returned,
                         there.amountGivenRaw));
    }
    return true;
}

bool
VaultFuzzer::wrapOrUnwrap(WrappingDirection direction,
                          ActionWords const& words, std::string& operation)
{
    auto& vault = *mVault;
    auto buffer = vault.getBufferBalance(WA_DAI);
    bool wrapping = direction == WrappingDirection::WRAP;

    BufferWrapOrUnwrapParams params;
    params.kind = words[3].is_zero() || (words[3] & 1).is_zero()
                      ? SwapKind::EXACT_IN
                      : SwapKind::EXACT_OUT;
    params.direction = direction;
    params.wrappedToken = WA_DAI;
    params.sender = TRADER;
    // up to twice the buffer's side, so that some trades need a rebalance
    auto const& side = wrapping ? buffer.underlying : buffer.wrapped;
    params.amountGivenRaw =
        bound(words[1], MINIMUM_WRAP_AMOUNT,
              std::max(MINIMUM_WRAP_AMOUNT, saturatingMultiply(
                                                side, 2, maxUint256())));
    params.limitRaw =
        params.kind == SwapKind::EXACT_IN ? uint256(0) : maxUint256();

    operation = fmt::format(FMT_STRING("{} {} {} of {}"),
                            toString(direction), toString(params.kind),
                            params.amountGivenRaw, WA_DAI);

    auto before = capture();
    auto res = vault.erc4626BufferWrapOrUnwrap(params);
    if (!res)
    {
        return handleError(operation, res.error());
    }
    auto actual = diff(before, capture());

    auto const& r = res.value();
    auto const& tokenIn = wrapping ? DAI : WA_DAI;
    auto const& tokenOut = wrapping ? WA_DAI : DAI;
    auto err = checkBalanceChanges(
        actual,
        {{TRADER, tokenIn, ChangeMode::EQUAL, -toSigned(r.amountIn)},
         {TRADER, tokenOut, ChangeMode::EQUAL, toSigned(r.amountOut)}});
    if (!err.empty())
    {
        fail(operation, err);
    }
    return true;
}

bool
VaultFuzzer::donateYield(ActionWords const& words, std::string& operation)
{
    auto& vault = *mVault;
    auto const& wrapper = vault.getLedger().getWrappedToken(WA_DAI);
    // at most 10% of the assets at a time
    auto assets = bound(words[1], uint256(1), wrapper.totalAssets / 10 + 1);
    operation =
        fmt::format(FMT_STRING("donate {} {} to {}"), assets, DAI, WA_DAI);
    vault.donateYield(WA_DAI, assets);
    return true;
}

bool
VaultFuzzer::runAction(Action action, ActionWords const& words,
                       std::string& operation)
{
    switch (action)
    {
    case Action::ADD_PROPORTIONAL:
        return addLiquidity(AddLiquidityKind::PROPORTIONAL, words, operation);
    case Action::ADD_UNBALANCED:
        return addLiquidity(AddLiquidityKind::UNBALANCED, words, operation);
    case Action::ADD_SINGLE_TOKEN_EXACT_OUT:
        return addLiquidity(AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT, words,
                            operation);
    case Action::REMOVE_PROPORTIONAL:
        return removeLiquidity(RemoveLiquidityKind::PROPORTIONAL, words,
                               operation);
    case Action::REMOVE_SINGLE_TOKEN_EXACT_IN:
        return removeLiquidity(RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN,
                               words, operation);
    case Action::REMOVE_SINGLE_TOKEN_EXACT_OUT:
        return removeLiquidity(RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT,
                               words, operation);
    case Action::SWAP_EXACT_IN:
        return swap(SwapKind::EXACT_IN, words, operation);
    case Action::SWAP_EXACT_OUT:
        return swap(SwapKind::EXACT_OUT, words, operation);
    case Action::ROUND_TRIP_SWAP:
        return roundTripSwap(words, operation);
    case Action::WRAP:
        return wrapOrUnwrap(WrappingDirection::WRAP, words, operation);
    case Action::UNWRAP:
        return wrapOrUnwrap(WrappingDirection::UNWRAP, words, operation);
    case Action::DONATE_YIELD:
        return donateYield(words, operation);
    }
    throw std::invalid_argument("unknown fuzz action");
}

void
VaultFuzzer::applyAction(ActionWords const& words)
{
    auto action = static_cast<Action>(toIndex(words[0], NUM_ACTIONS));
    auto& stats = mStats[action];
    ++stats.runs;

    std::string operation = toString(action);
    try
    {
        if (runAction(action, words, operation))
        {
            ++stats.succeeded;
        }
        else
        {
            ++stats.skipped;
        }
    }
    catch (UnboundableInput const& e)
    {
        CLOG_TRACE(Fuzz, "{} skipped: {}", operation, e.what());
        ++stats.skipped;
    }
    catch (ScenarioFailure const& e)
    {
        CLOG_ERROR(Fuzz, "{}", e.what());
        throw;
    }
    catch (std::exception const& e)
    {
        CLOG_ERROR(Fuzz, "{} threw: {}", operation, e.what());
        fail(operation, e.what());
    }
}
}
