// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/VaultImpl.h"
#include "invariant/BptSupplyMatchesHoldings.h"
#include "invariant/Invariant.h"
#include "invariant/PoolInvariantIsNonDecreasing.h"
#include "invariant/VaultReservesCoverBalances.h"
#include "pool/BasePoolMath.h"
#include "util/FixedPoint.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include "vault/WrappedToken.h"

#include <fmt/format.h>
#include <set>

namespace vaultcheck
{

using namespace FixedPoint;

uint256 const POOL_MINIMUM_TOTAL_SUPPLY = 1000000;
uint256 const MINIMUM_TRADE_AMOUNT = 1000000;
uint256 const BUFFER_MINIMUM_TOTAL_SUPPLY = 10000;
uint256 const MINIMUM_WRAP_AMOUNT = 10000;
TokenID const NATIVE_TOKEN = "ETH";

namespace
{
// Carries a VaultError out of the operation body; runOperation turns it back
// into a value.
class VaultFailure : public std::runtime_error
{
    VaultError mError;

  public:
    explicit VaultFailure(VaultError error)
        : std::runtime_error(error.toString()), mError(std::move(error))
    {
    }

    VaultError const&
    getError() const
    {
        return mError;
    }
};

[[noreturn]] void
fail(VaultErrorCode code, std::string message)
{
    throw VaultFailure(VaultError::make(code, std::move(message)));
}

[[noreturn]] void
failInsufficient(VaultErrorCode code, AccountID const& account,
                 TokenID const& token, uint256 const& have,
                 uint256 const& need)
{
    throw VaultFailure(
        VaultError::insufficient(code, account, token, have, need));
}

uint256
toScaled18Down(uint256 const& raw, uint256 const& scalingFactor,
               uint256 const& rate)
{
    return mulDown(mul(raw, scalingFactor), rate);
}

uint256
toScaled18Up(uint256 const& raw, uint256 const& scalingFactor,
             uint256 const& rate)
{
    return mulUp(mul(raw, scalingFactor), rate);
}

uint256
toRawDown(uint256 const& scaled, uint256 const& scalingFactor,
          uint256 const& rate)
{
    return divDown(scaled, mul(scalingFactor, rate));
}

uint256
toRawUp(uint256 const& scaled, uint256 const& scalingFactor,
        uint256 const& rate)
{
    return divUp(scaled, mul(scalingFactor, rate));
}

void
ensureValidTradeAmount(uint256 const& scaled18)
{
    if (scaled18 != 0 && scaled18 < MINIMUM_TRADE_AMOUNT)
    {
        failInsufficient(VaultErrorCode::TRADE_AMOUNT_TOO_SMALL, "", "",
                         scaled18, MINIMUM_TRADE_AMOUNT);
    }
}

size_t
singleTokenIndex(std::vector<uint256> const& amounts)
{
    size_t index = amounts.size();
    for (size_t i = 0; i < amounts.size(); ++i)
    {
        if (amounts[i] != 0)
        {
            if (index != amounts.size())
            {
                fail(VaultErrorCode::INVALID_INPUT,
                     "more than one non-zero amount for a single token "
                     "operation");
            }
            index = i;
        }
    }
    if (index == amounts.size())
    {
        fail(VaultErrorCode::INVALID_INPUT,
             "single token operation needs one non-zero amount");
    }
    return index;
}

bool
isValidSwapFee(uint256 const& fee, uint256 const& minFee,
               uint256 const& maxFee)
{
    return minFee <= fee && fee <= maxFee && maxFee < ONE();
}
}

class VaultImpl::SessionScope : public NonMovableOrCopyable
{
    std::optional<Session>& mSlot;
    std::optional<Session> mSaved;

  public:
    SessionScope(std::optional<Session>& slot, AccountID const& sender,
                 bool query)
        : mSlot(slot), mSaved(std::move(slot))
    {
        Session session;
        session.mSender = sender;
        session.mQuery = query;
        mSlot = std::move(session);
    }

    ~SessionScope()
    {
        mSlot = std::move(mSaved);
    }
};

VaultImpl::VaultImpl(std::vector<std::string> const& invariantChecks)
    : mInvariantManager(InvariantManager::create())
{
    for (auto kind : {InvariantKind::LINEAR, InvariantKind::CONSTANT_PRODUCT})
    {
        mPoolMath.emplace(kind, makePoolInvariant(kind));
    }

    PoolInvariantIsNonDecreasing::registerInvariant(*mInvariantManager);
    VaultReservesCoverBalances::registerInvariant(*mInvariantManager);
    BptSupplyMatchesHoldings::registerInvariant(*mInvariantManager);
    for (auto const& pattern : invariantChecks)
    {
        mInvariantManager->enableInvariant(pattern);
    }
}

VaultImpl::~VaultImpl()
{
}

template <typename T, typename F>
VaultResult<T>
VaultImpl::captureErrors(F&& body)
{
    try
    {
        return VaultResult<T>(body());
    }
    catch (VaultFailure const& e)
    {
        return e.getError();
    }
    catch (InvariantRatioOutOfRange const& e)
    {
        return VaultError::make(
            e.isAboveMax() ? VaultErrorCode::INVARIANT_RATIO_ABOVE_MAX
                           : VaultErrorCode::INVARIANT_RATIO_BELOW_MIN,
            e.what());
    }
    catch (PoolMathError const& e)
    {
        return VaultError::make(VaultErrorCode::POOL_MATH, e.what());
    }
    catch (ArithmeticOverflow const& e)
    {
        return VaultError::make(VaultErrorCode::ARITHMETIC, e.what());
    }
    catch (ArithmeticUnderflow const& e)
    {
        return VaultError::make(VaultErrorCode::ARITHMETIC, e.what());
    }
    catch (std::domain_error const& e)
    {
        return VaultError::make(VaultErrorCode::ARITHMETIC, e.what());
    }
}

template <typename T, typename F>
VaultResult<T>
VaultImpl::runOperation(VaultOperation const& op, F&& body)
{
    if (mSession && mSession->mSender != op.sender)
    {
        return VaultError::make(
            VaultErrorCode::VAULT_LOCKED,
            fmt::format(FMT_STRING("vault is unlocked for {}, not {}"),
                        mSession->mSender, op.sender));
    }
    if (!mStore.getLedger().hasAccount(op.sender))
    {
        return VaultError::make(
            VaultErrorCode::ACCOUNT_NOT_FOUND,
            fmt::format(FMT_STRING("unknown account {}"), op.sender));
    }

    if (mSession)
    {
        // Nested in a batch: the operation joins the enclosing transaction
        // and its token legs settle with it.
        auto savedDeltas = mSession->mDeltas;
        auto savedNative = mSession->mNativeDelta;
        StateTxn txn(mStore);
        auto res = captureErrors<T>([&]() -> T {
            T r = body();
            if (!mSession->mQuery)
            {
                checkInvariants(op, txn.getPrevious());
            }
            return r;
        });
        if (res)
        {
            txn.commit();
        }
        else
        {
            mSession->mDeltas = std::move(savedDeltas);
            mSession->mNativeDelta = savedNative;
        }
        return res;
    }

    StateTxn txn(mStore);
    SessionScope session(mSession, op.sender, false);
    auto res = captureErrors<T>([&]() -> T {
        T r = body();
        settle();
        checkInvariants(op, txn.getPrevious());
        return r;
    });
    if (res)
    {
        txn.commit();
        CLOG_DEBUG(Vault, "{} committed", op.toString());
    }
    else
    {
        CLOG_DEBUG(Vault, "{} failed: {}", op.toString(),
                   res.error().toString());
    }
    return res;
}

template <typename T, typename F>
VaultResult<T>
VaultImpl::runQuery(AccountID const& sender, F&& body)
{
    if (!mStore.getLedger().hasAccount(sender))
    {
        return VaultError::make(
            VaultErrorCode::ACCOUNT_NOT_FOUND,
            fmt::format(FMT_STRING("unknown account {}"), sender));
    }
    ScopedRestore restore(mStore);
    SessionScope session(mSession, sender, true);
    return captureErrors<T>(std::forward<F>(body));
}

void
VaultImpl::checkInvariants(VaultOperation const& op,
                           VaultLedger const& previous)
{
    mInvariantManager->checkOnOperationApply(
        op, VaultDelta{previous, mStore.getLedger()});
}

void
VaultImpl::takeIn(TokenID const& token, uint256 const& amount, bool wethIsEth)
{
    releaseAssertOrThrow(mSession);
    if (amount == 0)
    {
        return;
    }
    auto& ledger = mStore.getLedger();
    if (!ledger.credit(VAULT_ACCOUNT, token, amount))
    {
        fail(VaultErrorCode::ARITHMETIC,
             fmt::format(FMT_STRING("vault balance of {} overflows"), token));
    }
    if (wethIsEth && ledger.getWethToken() == token)
    {
        mSession->mNativeDelta -= toSigned(amount);
    }
    else
    {
        mSession->mDeltas[token] -= toSigned(amount);
    }
}

void
VaultImpl::sendOut(TokenID const& token, uint256 const& amount, bool wethIsEth)
{
    releaseAssertOrThrow(mSession);
    if (amount == 0)
    {
        return;
    }
    auto& ledger = mStore.getLedger();
    if (!ledger.debit(VAULT_ACCOUNT, token, amount))
    {
        failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                         VAULT_ACCOUNT, token,
                         ledger.getBalance(VAULT_ACCOUNT, token), amount);
    }
    if (wethIsEth && ledger.getWethToken() == token)
    {
        mSession->mNativeDelta += toSigned(amount);
    }
    else
    {
        mSession->mDeltas[token] += toSigned(amount);
    }
}

void
VaultImpl::settle()
{
    auto& ledger = mStore.getLedger();
    auto const& sender = mSession->mSender;
    for (auto const& d : mSession->mDeltas)
    {
        auto amount = absValue(d.second);
        if (d.second < 0)
        {
            if (!ledger.debit(sender, d.first, amount))
            {
                failInsufficient(VaultErrorCode::INSUFFICIENT_BALANCE, sender,
                                 d.first, ledger.getBalance(sender, d.first),
                                 amount);
            }
        }
        else if (d.second > 0 && !ledger.credit(sender, d.first, amount))
        {
            fail(VaultErrorCode::ARITHMETIC,
                 fmt::format(FMT_STRING("balance of {} in {} overflows"),
                             sender, d.first));
        }
        CLOG_TRACE(Vault, "settled {} {} for {}", d.second, d.first, sender);
    }

    auto const& native = mSession->mNativeDelta;
    if (native < 0)
    {
        auto need = absValue(native);
        if (!ledger.debitNative(sender, need))
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_BALANCE, sender,
                             NATIVE_TOKEN, ledger.getNativeBalance(sender),
                             need);
        }
    }
    else if (native > 0 && !ledger.creditNative(sender, absValue(native)))
    {
        fail(VaultErrorCode::ARITHMETIC,
             fmt::format(FMT_STRING("native balance of {} overflows"),
                         sender));
    }

    mSession->mDeltas.clear();
    mSession->mNativeDelta = 0;
}

void
VaultImpl::mintBpt(PoolID const& pool, AccountID const& to,
                   uint256 const& amount)
{
    auto& ledger = mStore.getLedger();
    auto& p = ledger.loadPool(pool);
    p.totalSupply = add(p.totalSupply, amount);
    if (!ledger.credit(to, pool, amount))
    {
        fail(VaultErrorCode::ARITHMETIC,
             fmt::format(FMT_STRING("BPT balance of {} overflows"), to));
    }
}

void
VaultImpl::burnBpt(PoolID const& pool, AccountID const& from,
                   uint256 const& amount)
{
    auto& ledger = mStore.getLedger();
    auto have = ledger.getBalance(from, pool);
    if (have < amount)
    {
        if (!mSession->mQuery)
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_BALANCE, from, pool,
                             have, amount);
        }
        // queries price the burn as if the sender held enough
        if (!ledger.credit(from, pool, amount - have))
        {
            fail(VaultErrorCode::ARITHMETIC, "BPT top up overflows");
        }
    }
    if (!ledger.debit(from, pool, amount))
    {
        failInsufficient(VaultErrorCode::INSUFFICIENT_BALANCE, from, pool,
                         ledger.getBalance(from, pool), amount);
    }
    auto& p = ledger.loadPool(pool);
    p.totalSupply = sub(p.totalSupply, amount);
}

PoolEntry const&
VaultImpl::loadInitializedPool(PoolID const& pool) const
{
    auto const& ledger = mStore.getLedger();
    if (!ledger.hasPool(pool))
    {
        fail(VaultErrorCode::POOL_NOT_REGISTERED,
             fmt::format(FMT_STRING("pool {} is not registered"), pool));
    }
    auto const& p = ledger.getPool(pool);
    if (!p.initialized)
    {
        fail(VaultErrorCode::POOL_NOT_INITIALIZED,
             fmt::format(FMT_STRING("pool {} is not initialized"), pool));
    }
    return p;
}

PoolInvariant const&
VaultImpl::getPoolMath(InvariantKind kind) const
{
    return *mPoolMath.at(kind);
}

size_t
VaultImpl::findTokenIndex(PoolEntry const& pool, TokenID const& token) const
{
    for (size_t i = 0; i < pool.tokens.size(); ++i)
    {
        if (pool.tokens[i] == token)
        {
            return i;
        }
    }
    fail(VaultErrorCode::TOKEN_NOT_REGISTERED,
         fmt::format(FMT_STRING("token {} is not in pool {}"), token,
                     pool.id));
}

void
VaultImpl::registerToken(TokenID const& token, uint32_t decimals)
{
    mStore.getLedger().registerToken(TokenEntry{token, decimals});
    CLOG_DEBUG(Vault, "registered token {} ({} decimals)", token, decimals);
}

void
VaultImpl::registerWrappedToken(TokenID const& wrapped,
                                TokenID const& underlying, uint32_t decimals)
{
    WrappedTokenEntry entry;
    entry.id = wrapped;
    entry.underlying = underlying;
    mStore.getLedger().registerWrappedToken(entry, decimals);
    CLOG_DEBUG(Vault, "registered wrapped token {} over {}", wrapped,
               underlying);
}

void
VaultImpl::createAccount(AccountID const& account)
{
    mStore.getLedger().createAccount(account);
}

void
VaultImpl::mint(AccountID const& account, TokenID const& token,
                uint256 const& amount)
{
    auto& ledger = mStore.getLedger();
    if (ledger.isWrappedToken(token))
    {
        // back new shares with freshly minted underlying so that the rate
        // is unchanged; the account receives at least amount
        auto const& w = ledger.getWrappedToken(token);
        auto assets = ERC4626::previewMint(w, amount);
        mint(account, w.underlying, assets);
        ERC4626::deposit(ledger, token, account, assets);
        return;
    }
    ledger.getToken(token);
    if (!ledger.credit(account, token, amount))
    {
        throw ArithmeticOverflow(
            fmt::format(FMT_STRING("minting {} {} to {} overflows"), amount,
                        token, account));
    }
}

void
VaultImpl::mintNative(AccountID const& account, uint256 const& amount)
{
    if (!mStore.getLedger().creditNative(account, amount))
    {
        throw ArithmeticOverflow(fmt::format(
            FMT_STRING("native balance of {} overflows"), account));
    }
}

void
VaultImpl::setWethToken(TokenID const& token)
{
    mStore.getLedger().setWethToken(token);
}

void
VaultImpl::donateYield(TokenID const& wrapped, uint256 const& assets)
{
    ERC4626::donateYield(mStore.getLedger(), wrapped, assets);
    CLOG_DEBUG(Vault, "donated {} to {}, rate now {}", assets, wrapped,
               mStore.getLedger().getTokenRate(wrapped));
}

VaultStatus
VaultImpl::registerPool(PoolConfig const& config)
{
    auto& ledger = mStore.getLedger();
    if (ledger.hasPool(config.id) || ledger.hasToken(config.id) ||
        ledger.hasAccount(config.id))
    {
        return VaultError::make(
            VaultErrorCode::POOL_ALREADY_REGISTERED,
            fmt::format(FMT_STRING("pool {} already registered"), config.id));
    }
    if (config.tokens.size() < 2 ||
        (config.kind == InvariantKind::CONSTANT_PRODUCT &&
         config.tokens.size() != 2))
    {
        return VaultError::make(
            VaultErrorCode::INVALID_INPUT,
            fmt::format(FMT_STRING("{} pool cannot have {} tokens"),
                        toString(config.kind), config.tokens.size()));
    }
    std::set<TokenID> seen;
    for (auto const& token : config.tokens)
    {
        if (!ledger.hasToken(token) || ledger.hasPool(token))
        {
            return VaultError::make(
                VaultErrorCode::TOKEN_NOT_REGISTERED,
                fmt::format(FMT_STRING("token {} is not registered"), token));
        }
        if (!seen.insert(token).second)
        {
            return VaultError::make(
                VaultErrorCode::INVALID_INPUT,
                fmt::format(FMT_STRING("token {} listed twice"), token));
        }
    }
    if (!isValidSwapFee(config.swapFee, config.minSwapFee, config.maxSwapFee))
    {
        return VaultError::make(
            VaultErrorCode::SWAP_FEE_OUT_OF_RANGE,
            fmt::format(FMT_STRING("swap fee {} outside [{}, {}]"),
                        config.swapFee, config.minSwapFee,
                        config.maxSwapFee));
    }

    auto const& math = getPoolMath(config.kind);
    PoolEntry entry;
    entry.id = config.id;
    entry.kind = config.kind;
    entry.tokens = config.tokens;
    entry.balancesRaw.assign(config.tokens.size(), 0);
    entry.swapFee = config.swapFee;
    entry.minSwapFee = config.minSwapFee;
    entry.maxSwapFee = config.maxSwapFee;
    entry.minInvariantRatio =
        config.minInvariantRatio.value_or(math.getMinimumInvariantRatio());
    entry.maxInvariantRatio =
        config.maxInvariantRatio.value_or(math.getMaximumInvariantRatio());
    ledger.addPool(entry);

    CLOG_INFO(Vault, "registered {} pool {} with {} tokens, fee {}",
              toString(config.kind), config.id, config.tokens.size(),
              config.swapFee);
    return vaultOk();
}

VaultStatus
VaultImpl::setSwapFee(PoolID const& pool, uint256 const& swapFee)
{
    auto& ledger = mStore.getLedger();
    if (!ledger.hasPool(pool))
    {
        return VaultError::make(
            VaultErrorCode::POOL_NOT_REGISTERED,
            fmt::format(FMT_STRING("pool {} is not registered"), pool));
    }
    auto const& p = ledger.getPool(pool);
    if (!isValidSwapFee(swapFee, p.minSwapFee, p.maxSwapFee))
    {
        return VaultError::make(
            VaultErrorCode::SWAP_FEE_OUT_OF_RANGE,
            fmt::format(FMT_STRING("swap fee {} outside [{}, {}]"), swapFee,
                        p.minSwapFee, p.maxSwapFee));
    }
    ledger.loadPool(pool).swapFee = swapFee;
    return vaultOk();
}

VaultResult<uint256>
VaultImpl::initialize(InitializeParams const& params)
{
    VaultOperation op{VaultOperationType::INITIALIZE, params.pool,
                      params.sender};
    return runOperation<uint256>(op, [&]() -> uint256 {
        auto& ledger = mStore.getLedger();
        if (!ledger.hasPool(params.pool))
        {
            fail(VaultErrorCode::POOL_NOT_REGISTERED,
                 fmt::format(FMT_STRING("pool {} is not registered"),
                             params.pool));
        }
        auto& pool = ledger.loadPool(params.pool);
        if (pool.initialized)
        {
            fail(VaultErrorCode::POOL_ALREADY_INITIALIZED,
                 fmt::format(FMT_STRING("pool {} is already initialized"),
                             params.pool));
        }
        if (params.exactAmountsIn.size() != pool.tokens.size())
        {
            fail(VaultErrorCode::INVALID_INPUT,
                 "amounts do not match pool tokens");
        }
        pool.balancesRaw = params.exactAmountsIn;
        pool.initialized = true;
        auto tokens = pool.tokens;
        auto kind = pool.kind;

        auto info = ledger.getPoolTokenInfo(params.pool);
        auto bpt = getPoolMath(kind).computeInvariant(
            info.balancesLiveScaled18, ROUND_DOWN);
        if (bpt < POOL_MINIMUM_TOTAL_SUPPLY)
        {
            failInsufficient(VaultErrorCode::POOL_TOTAL_SUPPLY_TOO_LOW, "",
                             params.pool, bpt, POOL_MINIMUM_TOTAL_SUPPLY);
        }
        auto bptOut = bpt - POOL_MINIMUM_TOTAL_SUPPLY;
        if (bptOut < params.minBptAmountOut)
        {
            failInsufficient(VaultErrorCode::BPT_AMOUNT_OUT_BELOW_MIN, "",
                             params.pool, bptOut, params.minBptAmountOut);
        }

        for (size_t i = 0; i < tokens.size(); ++i)
        {
            takeIn(tokens[i], params.exactAmountsIn[i], params.wethIsEth);
        }
        mintBpt(params.pool, ZERO_ACCOUNT, POOL_MINIMUM_TOTAL_SUPPLY);
        mintBpt(params.pool, params.sender, bptOut);

        CLOG_INFO(Vault, "initialized pool {}: supply {}, {} to {}",
                  params.pool, bpt, bptOut, params.sender);
        return bptOut;
    });
}

AddLiquidityResult
VaultImpl::doAddLiquidity(AddLiquidityParams const& params)
{
    auto& ledger = mStore.getLedger();
    auto const& pool = loadInitializedPool(params.pool);
    auto n = pool.tokens.size();
    if (params.maxAmountsIn.size() != n)
    {
        fail(VaultErrorCode::INVALID_INPUT, "amounts do not match pool tokens");
    }
    auto tokens = pool.tokens;
    auto info = ledger.getPoolTokenInfo(params.pool);
    auto const& math = getPoolMath(pool.kind);

    AddLiquidityResult res;
    res.amountsIn.assign(n, 0);
    switch (params.kind)
    {
    case AddLiquidityKind::PROPORTIONAL:
        res.bptAmountOut = params.minBptAmountOut;
        res.amountsIn = BasePoolMath::computeProportionalAmountsIn(
            info.balancesRaw, pool.totalSupply, res.bptAmountOut);
        break;
    case AddLiquidityKind::UNBALANCED:
    case AddLiquidityKind::SINGLE_TOKEN_EXACT_IN:
    {
        if (params.kind == AddLiquidityKind::SINGLE_TOKEN_EXACT_IN)
        {
            singleTokenIndex(params.maxAmountsIn);
        }
        std::vector<uint256> scaled;
        for (size_t i = 0; i < n; ++i)
        {
            scaled.emplace_back(toScaled18Down(params.maxAmountsIn[i],
                                               info.scalingFactors[i],
                                               info.tokenRates[i]));
        }
        auto r = BasePoolMath::computeAddLiquidityUnbalanced(
            math, info.balancesLiveScaled18, scaled, pool.totalSupply,
            pool.swapFee, pool.maxInvariantRatio);
        res.amountsIn = params.maxAmountsIn;
        res.bptAmountOut = r.amount;
        break;
    }
    case AddLiquidityKind::SINGLE_TOKEN_EXACT_OUT:
    {
        auto index = singleTokenIndex(params.maxAmountsIn);
        res.bptAmountOut = params.minBptAmountOut;
        auto r = BasePoolMath::computeAddLiquiditySingleTokenExactOut(
            math, info.balancesLiveScaled18, index, res.bptAmountOut,
            pool.totalSupply, pool.swapFee, pool.maxInvariantRatio);
        res.amountsIn[index] = toRawUp(r.amount, info.scalingFactors[index],
                                       info.tokenRates[index]);
        break;
    }
    }

    for (size_t i = 0; i < n; ++i)
    {
        if (res.amountsIn[i] > params.maxAmountsIn[i])
        {
            failInsufficient(VaultErrorCode::AMOUNT_IN_ABOVE_MAX, "",
                             tokens[i], params.maxAmountsIn[i],
                             res.amountsIn[i]);
        }
    }
    if (res.bptAmountOut < params.minBptAmountOut)
    {
        failInsufficient(VaultErrorCode::BPT_AMOUNT_OUT_BELOW_MIN, "",
                         params.pool, res.bptAmountOut,
                         params.minBptAmountOut);
    }

    auto& p = ledger.loadPool(params.pool);
    for (size_t i = 0; i < n; ++i)
    {
        p.balancesRaw[i] = add(p.balancesRaw[i], res.amountsIn[i]);
    }
    for (size_t i = 0; i < n; ++i)
    {
        takeIn(tokens[i], res.amountsIn[i], params.wethIsEth);
    }
    mintBpt(params.pool, params.to, res.bptAmountOut);

    CLOG_TRACE(Vault, "add {} to {}: {} BPT", toString(params.kind),
               params.pool, res.bptAmountOut);
    return res;
}

RemoveLiquidityResult
VaultImpl::doRemoveLiquidity(RemoveLiquidityParams const& params)
{
    auto& ledger = mStore.getLedger();
    auto const& pool = loadInitializedPool(params.pool);
    auto n = pool.tokens.size();
    if (params.minAmountsOut.size() != n)
    {
        fail(VaultErrorCode::INVALID_INPUT, "amounts do not match pool tokens");
    }
    auto tokens = pool.tokens;
    auto info = ledger.getPoolTokenInfo(params.pool);
    auto const& math = getPoolMath(pool.kind);

    RemoveLiquidityResult res;
    res.amountsOut.assign(n, 0);
    switch (params.kind)
    {
    case RemoveLiquidityKind::PROPORTIONAL:
        res.bptAmountIn = params.maxBptAmountIn;
        res.amountsOut = BasePoolMath::computeProportionalAmountsOut(
            info.balancesRaw, pool.totalSupply, res.bptAmountIn);
        break;
    case RemoveLiquidityKind::SINGLE_TOKEN_EXACT_IN:
    {
        auto index = singleTokenIndex(params.minAmountsOut);
        res.bptAmountIn = params.maxBptAmountIn;
        BasePoolMath::LiquidityResult r;
        try
        {
            r = BasePoolMath::computeRemoveLiquiditySingleTokenExactIn(
                math, info.balancesLiveScaled18, index, res.bptAmountIn,
                pool.totalSupply, pool.swapFee, pool.minInvariantRatio);
        }
        catch (InsufficientTokenBalance const& e)
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                             params.pool, tokens[index],
                             info.balancesRaw[index],
                             toRawUp(e.getRequired(),
                                     info.scalingFactors[index],
                                     info.tokenRates[index]));
        }
        res.amountsOut[index] = toRawDown(
            r.amount, info.scalingFactors[index], info.tokenRates[index]);
        break;
    }
    case RemoveLiquidityKind::SINGLE_TOKEN_EXACT_OUT:
    {
        auto index = singleTokenIndex(params.minAmountsOut);
        res.amountsOut[index] = params.minAmountsOut[index];
        if (res.amountsOut[index] >= info.balancesRaw[index])
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                             params.pool, tokens[index],
                             info.balancesRaw[index], res.amountsOut[index]);
        }
        auto exactOutScaled =
            toScaled18Up(res.amountsOut[index], info.scalingFactors[index],
                         info.tokenRates[index]);
        auto r = BasePoolMath::computeRemoveLiquiditySingleTokenExactOut(
            math, info.balancesLiveScaled18, index, exactOutScaled,
            pool.totalSupply, pool.swapFee, pool.minInvariantRatio);
        res.bptAmountIn = r.amount;
        break;
    }
    }

    for (size_t i = 0; i < n; ++i)
    {
        if (res.amountsOut[i] < params.minAmountsOut[i])
        {
            failInsufficient(VaultErrorCode::AMOUNT_OUT_BELOW_MIN, "",
                             tokens[i], res.amountsOut[i],
                             params.minAmountsOut[i]);
        }
        if (res.amountsOut[i] > info.balancesRaw[i])
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                             params.pool, tokens[i], info.balancesRaw[i],
                             res.amountsOut[i]);
        }
    }
    if (res.bptAmountIn > params.maxBptAmountIn)
    {
        failInsufficient(VaultErrorCode::BPT_AMOUNT_IN_ABOVE_MAX, "",
                         params.pool, params.maxBptAmountIn, res.bptAmountIn);
    }

    burnBpt(params.pool, params.from, res.bptAmountIn);
    auto& p = ledger.loadPool(params.pool);
    if (p.totalSupply < POOL_MINIMUM_TOTAL_SUPPLY)
    {
        failInsufficient(VaultErrorCode::POOL_TOTAL_SUPPLY_TOO_LOW, "",
                         params.pool, p.totalSupply,
                         POOL_MINIMUM_TOTAL_SUPPLY);
    }
    for (size_t i = 0; i < n; ++i)
    {
        p.balancesRaw[i] = sub(p.balancesRaw[i], res.amountsOut[i]);
    }
    for (size_t i = 0; i < n; ++i)
    {
        sendOut(tokens[i], res.amountsOut[i], params.wethIsEth);
    }

    CLOG_TRACE(Vault, "remove {} from {}: {} BPT", toString(params.kind),
               params.pool, res.bptAmountIn);
    return res;
}

SwapResult
VaultImpl::doSwap(SwapParams const& params)
{
    auto& ledger = mStore.getLedger();
    auto const& pool = loadInitializedPool(params.pool);
    if (params.tokenIn == params.tokenOut)
    {
        fail(VaultErrorCode::INVALID_INPUT,
             fmt::format(FMT_STRING("cannot swap {} for itself"),
                         params.tokenIn));
    }
    auto in = findTokenIndex(pool, params.tokenIn);
    auto out = findTokenIndex(pool, params.tokenOut);
    if (params.amountGivenRaw == 0)
    {
        fail(VaultErrorCode::AMOUNT_GIVEN_ZERO, "swap amount is zero");
    }

    auto info = ledger.getPoolTokenInfo(params.pool);
    auto const& math = getPoolMath(pool.kind);
    auto const& balances = info.balancesLiveScaled18;

    SwapResult res;
    if (params.kind == SwapKind::EXACT_IN)
    {
        auto givenScaled =
            toScaled18Down(params.amountGivenRaw, info.scalingFactors[in],
                           info.tokenRates[in]);
        ensureValidTradeAmount(givenScaled);
        auto fee = mulUp(givenScaled, pool.swapFee);
        auto calculated = math.onSwap(SwapKind::EXACT_IN, balances, in, out,
                                      givenScaled - fee);
        ensureValidTradeAmount(calculated);

        res.amountIn = params.amountGivenRaw;
        res.amountOut = toRawDown(calculated, info.scalingFactors[out],
                                  info.tokenRates[out]);
        res.amountCalculated = res.amountOut;
        if (res.amountOut < params.limitRaw)
        {
            failInsufficient(VaultErrorCode::SWAP_LIMIT, "", params.tokenOut,
                             res.amountOut, params.limitRaw);
        }
    }
    else
    {
        if (params.amountGivenRaw >= info.balancesRaw[out])
        {
            failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                             params.pool, params.tokenOut,
                             info.balancesRaw[out], params.amountGivenRaw);
        }
        auto givenScaled =
            toScaled18Up(params.amountGivenRaw, info.scalingFactors[out],
                         info.tokenRates[out]);
        ensureValidTradeAmount(givenScaled);
        auto calculated = math.onSwap(SwapKind::EXACT_OUT, balances, in, out,
                                      givenScaled);
        auto withFee = divUp(calculated, complement(pool.swapFee));
        ensureValidTradeAmount(withFee);

        res.amountOut = params.amountGivenRaw;
        res.amountIn =
            toRawUp(withFee, info.scalingFactors[in], info.tokenRates[in]);
        res.amountCalculated = res.amountIn;
        if (res.amountIn > params.limitRaw)
        {
            failInsufficient(VaultErrorCode::SWAP_LIMIT, "", params.tokenIn,
                             params.limitRaw, res.amountIn);
        }
    }

    if (res.amountOut >= info.balancesRaw[out])
    {
        failInsufficient(VaultErrorCode::INSUFFICIENT_POOL_BALANCE,
                         params.pool, params.tokenOut, info.balancesRaw[out],
                         res.amountOut);
    }

    auto& p = ledger.loadPool(params.pool);
    p.balancesRaw[in] = add(p.balancesRaw[in], res.amountIn);
    p.balancesRaw[out] = sub(p.balancesRaw[out], res.amountOut);
    takeIn(params.tokenIn, res.amountIn, params.wethIsEth);
    sendOut(params.tokenOut, res.amountOut, params.wethIsEth);

    CLOG_TRACE(Vault, "swap {} on {}: {} {} -> {} {}", toString(params.kind),
               params.pool, res.amountIn, params.tokenIn, res.amountOut,
               params.tokenOut);
    return res;
}

VaultResult<AddLiquidityResult>
VaultImpl::addLiquidity(AddLiquidityParams const& params)
{
    VaultOperation op{VaultOperationType::ADD_LIQUIDITY, params.pool,
                      params.to};
    return runOperation<AddLiquidityResult>(
        op, [&]() { return doAddLiquidity(params); });
}

VaultResult<RemoveLiquidityResult>
VaultImpl::removeLiquidity(RemoveLiquidityParams const& params)
{
    VaultOperation op{VaultOperationType::REMOVE_LIQUIDITY, params.pool,
                      params.from};
    return runOperation<RemoveLiquidityResult>(
        op, [&]() { return doRemoveLiquidity(params); });
}

VaultResult<SwapResult>
VaultImpl::swap(SwapParams const& params)
{
    VaultOperation op{VaultOperationType::SWAP, params.pool, params.sender};
    return runOperation<SwapResult>(op, [&]() { return doSwap(params); });
}

VaultResult<AddLiquidityResult>
VaultImpl::queryAddLiquidity(AddLiquidityParams const& params)
{
    return runQuery<AddLiquidityResult>(
        params.to, [&]() { return doAddLiquidity(params); });
}

VaultResult<RemoveLiquidityResult>
VaultImpl::queryRemoveLiquidity(RemoveLiquidityParams const& params)
{
    return runQuery<RemoveLiquidityResult>(
        params.from, [&]() { return doRemoveLiquidity(params); });
}

VaultResult<SwapResult>
VaultImpl::querySwap(SwapParams const& params)
{
    return runQuery<SwapResult>(params.sender,
                                [&]() { return doSwap(params); });
}

VaultResult<BufferLiquidityResult>
VaultImpl::initializeBuffer(TokenID const& wrappedToken,
                            uint256 const& exactUnderlyingIn,
                            uint256 const& exactWrappedIn,
                            uint256 const& minIssuedShares,
                            AccountID const& sender)
{
    VaultOperation op{VaultOperationType::BUFFER_LIQUIDITY, wrappedToken,
                      sender};
    return runOperation<BufferLiquidityResult>(
        op, [&]() -> BufferLiquidityResult {
            auto& ledger = mStore.getLedger();
            if (!ledger.isWrappedToken(wrappedToken))
            {
                fail(VaultErrorCode::TOKEN_NOT_REGISTERED,
                     fmt::format(FMT_STRING("{} is not a wrapped token"),
                                 wrappedToken));
            }
            if (ledger.hasBuffer(wrappedToken))
            {
                fail(VaultErrorCode::BUFFER_ALREADY_INITIALIZED,
                     fmt::format(FMT_STRING("buffer for {} already exists"),
                                 wrappedToken));
            }
            auto const& w = ledger.getWrappedToken(wrappedToken);
            auto underlying = w.underlying;
            auto shares = add(exactUnderlyingIn,
                              ERC4626::previewRedeem(w, exactWrappedIn));
            if (shares < BUFFER_MINIMUM_TOTAL_SUPPLY)
            {
                failInsufficient(VaultErrorCode::BUFFER_TOTAL_SUPPLY_TOO_LOW,
                                 "", wrappedToken, shares,
                                 BUFFER_MINIMUM_TOTAL_SUPPLY);
            }
            auto issued = shares - BUFFER_MINIMUM_TOTAL_SUPPLY;
            if (issued < minIssuedShares)
            {
                failInsufficient(VaultErrorCode::ISSUED_SHARES_BELOW_MIN, "",
                                 wrappedToken, issued, minIssuedShares);
            }

            auto& buffer = ledger.loadBuffer(wrappedToken);
            buffer.underlyingBalance = exactUnderlyingIn;
            buffer.wrappedBalance = exactWrappedIn;
            buffer.totalShares = shares;
            buffer.shares[ZERO_ACCOUNT] = BUFFER_MINIMUM_TOTAL_SUPPLY;
            buffer.shares[sender] = issued;
            buffer.initialized = true;

            takeIn(underlying, exactUnderlyingIn, false);
            takeIn(wrappedToken, exactWrappedIn, false);
            CLOG_INFO(Vault, "initialized buffer {}: {} underlying, {} "
                             "wrapped, {} shares",
                      wrappedToken, exactUnderlyingIn, exactWrappedIn, shares);
            return BufferLiquidityResult{exactUnderlyingIn, exactWrappedIn,
                                         issued};
        });
}

VaultResult<BufferLiquidityResult>
VaultImpl::addLiquidityToBuffer(TokenID const& wrappedToken,
                                uint256 const& maxUnderlyingIn,
                                uint256 const& maxWrappedIn,
                                uint256 const& exactSharesToIssue,
                                AccountID const& sender)
{
    VaultOperation op{VaultOperationType::BUFFER_LIQUIDITY, wrappedToken,
                      sender};
    return runOperation<BufferLiquidityResult>(
        op, [&]() -> BufferLiquidityResult {
            auto& ledger = mStore.getLedger();
            if (!ledger.hasBuffer(wrappedToken))
            {
                fail(VaultErrorCode::BUFFER_NOT_INITIALIZED,
                     fmt::format(FMT_STRING("no buffer for {}"),
                                 wrappedToken));
            }
            auto& buffer = ledger.loadBuffer(wrappedToken);
            auto underlyingIn = mulDivUp(buffer.underlyingBalance,
                                         exactSharesToIssue,
                                         buffer.totalShares);
            auto wrappedIn = mulDivUp(buffer.wrappedBalance,
                                      exactSharesToIssue, buffer.totalShares);
            if (underlyingIn > maxUnderlyingIn)
            {
                failInsufficient(VaultErrorCode::AMOUNT_IN_ABOVE_MAX, "",
                                 buffer.underlying, maxUnderlyingIn,
                                 underlyingIn);
            }
            if (wrappedIn > maxWrappedIn)
            {
                failInsufficient(VaultErrorCode::AMOUNT_IN_ABOVE_MAX, "",
                                 wrappedToken, maxWrappedIn, wrappedIn);
            }

            buffer.underlyingBalance =
                add(buffer.underlyingBalance, underlyingIn);
            buffer.wrappedBalance = add(buffer.wrappedBalance, wrappedIn);
            buffer.totalShares = add(buffer.totalShares, exactSharesToIssue);
            buffer.shares[sender] =
                add(buffer.shares[sender], exactSharesToIssue);
            auto underlying = buffer.underlying;

            takeIn(underlying, underlyingIn, false);
            takeIn(wrappedToken, wrappedIn, false);
            return BufferLiquidityResult{underlyingIn, wrappedIn,
                                         exactSharesToIssue};
        });
}

VaultResult<BufferLiquidityResult>
VaultImpl::removeLiquidityFromBuffer(TokenID const& wrappedToken,
                                     uint256 const& sharesToRemove,
                                     uint256 const& minUnderlyingOut,
                                     uint256 const& minWrappedOut,
                                     AccountID const& sender)
{
    VaultOperation op{VaultOperationType::BUFFER_LIQUIDITY, wrappedToken,
                      sender};
    return runOperation<BufferLiquidityResult>(
        op, [&]() -> BufferLiquidityResult {
            auto& ledger = mStore.getLedger();
            if (!ledger.hasBuffer(wrappedToken))
            {
                fail(VaultErrorCode::BUFFER_NOT_INITIALIZED,
                     fmt::format(FMT_STRING("no buffer for {}"),
                                 wrappedToken));
            }
            auto& buffer = ledger.loadBuffer(wrappedToken);
            auto& owned = buffer.shares[sender];
            if (owned < sharesToRemove)
            {
                failInsufficient(VaultErrorCode::INSUFFICIENT_BALANCE, sender,
                                 wrappedToken, owned, sharesToRemove);
            }
            auto remaining = buffer.totalShares - sharesToRemove;
            if (remaining < BUFFER_MINIMUM_TOTAL_SUPPLY)
            {
                failInsufficient(VaultErrorCode::BUFFER_TOTAL_SUPPLY_TOO_LOW,
                                 "", wrappedToken, remaining,
                                 BUFFER_MINIMUM_TOTAL_SUPPLY);
            }

            auto underlyingOut = mulDivDown(buffer.underlyingBalance,
                                            sharesToRemove,
                                            buffer.totalShares);
            auto wrappedOut = mulDivDown(buffer.wrappedBalance,
                                         sharesToRemove, buffer.totalShares);
            if (underlyingOut < minUnderlyingOut)
            {
                failInsufficient(VaultErrorCode::AMOUNT_OUT_BELOW_MIN, "",
                                 buffer.underlying, underlyingOut,
                                 minUnderlyingOut);
            }
            if (wrappedOut < minWrappedOut)
            {
                failInsufficient(VaultErrorCode::AMOUNT_OUT_BELOW_MIN, "",
                                 wrappedToken, wrappedOut, minWrappedOut);
            }

            owned -= sharesToRemove;
            buffer.totalShares = remaining;
            buffer.underlyingBalance -= underlyingOut;
            buffer.wrappedBalance -= wrappedOut;
            auto underlying = buffer.underlying;

            sendOut(underlying, underlyingOut, false);
            sendOut(wrappedToken, wrappedOut, false);
            return BufferLiquidityResult{underlyingOut, wrappedOut,
                                         sharesToRemove};
        });
}

BufferWrapOrUnwrapResult
VaultImpl::doWrapOrUnwrap(BufferWrapOrUnwrapParams const& params)
{
    auto& ledger = mStore.getLedger();
    auto const& wrappedToken = params.wrappedToken;
    if (!ledger.isWrappedToken(wrappedToken))
    {
        fail(VaultErrorCode::TOKEN_NOT_REGISTERED,
             fmt::format(FMT_STRING("{} is not a wrapped token"),
                         wrappedToken));
    }
    if (!ledger.hasBuffer(wrappedToken))
    {
        fail(VaultErrorCode::BUFFER_NOT_INITIALIZED,
             fmt::format(FMT_STRING("no buffer for {}"), wrappedToken));
    }
    if (params.amountGivenRaw == 0)
    {
        fail(VaultErrorCode::AMOUNT_GIVEN_ZERO, "wrap amount is zero");
    }
    if (params.amountGivenRaw < MINIMUM_WRAP_AMOUNT)
    {
        failInsufficient(VaultErrorCode::WRAP_AMOUNT_TOO_SMALL, "",
                         wrappedToken, params.amountGivenRaw,
                         MINIMUM_WRAP_AMOUNT);
    }

    bool wrap = params.direction == WrappingDirection::WRAP;
    bool exactIn = params.kind == SwapKind::EXACT_IN;
    auto const& given = params.amountGivenRaw;

    // the previews run against the wrapper's current rate
    WrappedTokenEntry w = ledger.getWrappedToken(wrappedToken);
    BufferWrapOrUnwrapResult res;
    if (wrap)
    {
        res.amountIn = exactIn ? given : ERC4626::previewMint(w, given);
        res.amountOut = exactIn ? ERC4626::previewDeposit(w, given) : given;
    }
    else
    {
        res.amountIn = exactIn ? given : ERC4626::previewWithdraw(w, given);
        res.amountOut = exactIn ? ERC4626::previewRedeem(w, given) : given;
    }
    res.amountCalculated = exactIn ? res.amountOut : res.amountIn;
    if (exactIn && res.amountOut < params.limitRaw)
    {
        failInsufficient(VaultErrorCode::SWAP_LIMIT, "",
                         wrap ? wrappedToken : w.underlying, res.amountOut,
                         params.limitRaw);
    }
    if (!exactIn && res.amountIn > params.limitRaw)
    {
        failInsufficient(VaultErrorCode::SWAP_LIMIT, "",
                         wrap ? w.underlying : wrappedToken, params.limitRaw,
                         res.amountIn);
    }

    TokenID tokenIn = wrap ? w.underlying : wrappedToken;
    TokenID tokenOut = wrap ? wrappedToken : w.underlying;
    takeIn(tokenIn, res.amountIn, false);

    auto& buffer = ledger.loadBuffer(wrappedToken);
    if (wrap)
    {
        if (buffer.wrappedBalance >= res.amountOut)
        {
            buffer.underlyingBalance =
                add(buffer.underlyingBalance, res.amountIn);
            buffer.wrappedBalance -= res.amountOut;
        }
        else
        {
            // Not enough wrapped in the buffer: deposit the trade together
            // with half of the buffer's underlying surplus.
            auto held =
                ERC4626::convertToAssets(w, buffer.wrappedBalance, ROUND_DOWN);
            uint256 surplus = buffer.underlyingBalance > held
                                  ? (buffer.underlyingBalance - held) / 2
                                  : uint256(0);
            auto minted = ERC4626::deposit(ledger, wrappedToken, VAULT_ACCOUNT,
                                           add(res.amountIn, surplus));
            releaseAssertOrThrow(minted >= res.amountOut);
            buffer.underlyingBalance -= surplus;
            buffer.wrappedBalance =
                add(buffer.wrappedBalance, minted - res.amountOut);
            CLOG_DEBUG(Vault, "rebalanced buffer {}: deposited {}, minted {}",
                       wrappedToken, res.amountIn + surplus, minted);
        }
    }
    else
    {
        if (buffer.underlyingBalance >= res.amountOut)
        {
            buffer.wrappedBalance = add(buffer.wrappedBalance, res.amountIn);
            buffer.underlyingBalance -= res.amountOut;
        }
        else
        {
            auto held =
                ERC4626::convertToShares(w, buffer.underlyingBalance,
                                         ROUND_DOWN);
            uint256 surplus = buffer.wrappedBalance > held
                                  ? (buffer.wrappedBalance - held) / 2
                                  : uint256(0);
            auto assets = ERC4626::redeem(ledger, wrappedToken, VAULT_ACCOUNT,
                                          add(res.amountIn, surplus));
            releaseAssertOrThrow(assets >= res.amountOut);
            buffer.wrappedBalance -= surplus;
            buffer.underlyingBalance =
                add(buffer.underlyingBalance, assets - res.amountOut);
            CLOG_DEBUG(Vault, "rebalanced buffer {}: redeemed {}, got {}",
                       wrappedToken, res.amountIn + surplus, assets);
        }
    }
    sendOut(tokenOut, res.amountOut, false);

    CLOG_TRACE(Vault, "{} {} via buffer {}: {} in, {} out",
               toString(params.direction), toString(params.kind),
               wrappedToken, res.amountIn, res.amountOut);
    return res;
}

VaultResult<BufferWrapOrUnwrapResult>
VaultImpl::erc4626BufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params)
{
    VaultOperation op{VaultOperationType::BUFFER_WRAP_UNWRAP,
                      params.wrappedToken, params.sender};
    return runOperation<BufferWrapOrUnwrapResult>(
        op, [&]() { return doWrapOrUnwrap(params); });
}

VaultResult<BufferWrapOrUnwrapResult>
VaultImpl::queryBufferWrapOrUnwrap(BufferWrapOrUnwrapParams const& params)
{
    return runQuery<BufferWrapOrUnwrapResult>(
        params.sender, [&]() { return doWrapOrUnwrap(params); });
}

VaultStatus
VaultImpl::batch(AccountID const& sender, BatchBody const& body)
{
    VaultOperation op{VaultOperationType::BATCH, "", sender};
    return runOperation<std::monostate>(op, [&]() {
        auto status = body();
        if (!status)
        {
            throw VaultFailure(status.error());
        }
        return std::monostate{};
    });
}

VaultStatus
VaultImpl::queryBatch(AccountID const& sender, BatchBody const& body)
{
    return runQuery<std::monostate>(sender, [&]() {
        auto status = body();
        if (!status)
        {
            throw VaultFailure(status.error());
        }
        return std::monostate{};
    });
}

uint256
VaultImpl::computeInvariant(PoolID const& pool, Rounding rounding) const
{
    auto const& ledger = mStore.getLedger();
    auto info = ledger.getPoolTokenInfo(pool);
    return getPoolMath(ledger.getPool(pool).kind)
        .computeInvariant(info.balancesLiveScaled18, rounding);
}

uint256
VaultImpl::computeInvariant(PoolID const& pool,
                            std::vector<uint256> const& balances,
                            Rounding rounding) const
{
    return getPoolMath(mStore.getLedger().getPool(pool).kind)
        .computeInvariant(balances, rounding);
}

PoolTokenInfo
VaultImpl::getPoolTokenInfo(PoolID const& pool) const
{
    return mStore.getLedger().getPoolTokenInfo(pool);
}

uint256
VaultImpl::getMinimumInvariantRatio(PoolID const& pool) const
{
    return mStore.getLedger().getPool(pool).minInvariantRatio;
}

uint256
VaultImpl::getMaximumInvariantRatio(PoolID const& pool) const
{
    return mStore.getLedger().getPool(pool).maxInvariantRatio;
}

BufferBalance
VaultImpl::getBufferBalance(TokenID const& wrapped) const
{
    auto const& buffer = mStore.getLedger().getBuffer(wrapped);
    return BufferBalance{buffer.underlyingBalance, buffer.wrappedBalance};
}

uint256
VaultImpl::getBufferShares(TokenID const& wrapped,
                           AccountID const& account) const
{
    auto const& shares = mStore.getLedger().getBuffer(wrapped).shares;
    auto it = shares.find(account);
    return it == shares.end() ? uint256(0) : it->second;
}

VaultStateReader const&
VaultImpl::getState() const
{
    return mStore.getLedger();
}

VaultLedger const&
VaultImpl::getLedger() const
{
    return mStore.getLedger();
}

StateStore&
VaultImpl::getStateStore()
{
    return mStore;
}

InvariantManager&
VaultImpl::getInvariantManager()
{
    return *mInvariantManager;
}
}
