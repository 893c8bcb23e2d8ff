#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/VaultEntries.h"
#include "util/numeric.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace vaultcheck
{

enum class VaultErrorCode
{
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_POOL_BALANCE,
    SWAP_LIMIT,
    BPT_AMOUNT_OUT_BELOW_MIN,
    BPT_AMOUNT_IN_ABOVE_MAX,
    AMOUNT_IN_ABOVE_MAX,
    AMOUNT_OUT_BELOW_MIN,
    INVARIANT_RATIO_ABOVE_MAX,
    INVARIANT_RATIO_BELOW_MIN,
    ACCOUNT_NOT_FOUND,
    POOL_NOT_REGISTERED,
    POOL_ALREADY_REGISTERED,
    POOL_NOT_INITIALIZED,
    POOL_ALREADY_INITIALIZED,
    TOKEN_NOT_REGISTERED,
    BUFFER_NOT_INITIALIZED,
    BUFFER_ALREADY_INITIALIZED,
    BUFFER_TOTAL_SUPPLY_TOO_LOW,
    ISSUED_SHARES_BELOW_MIN,
    SWAP_FEE_OUT_OF_RANGE,
    AMOUNT_GIVEN_ZERO,
    TRADE_AMOUNT_TOO_SMALL,
    WRAP_AMOUNT_TOO_SMALL,
    POOL_TOTAL_SUPPLY_TOO_LOW,
    VAULT_LOCKED,
    INVALID_INPUT,
    POOL_MATH,
    ARITHMETIC
};

char const* toString(VaultErrorCode code);

// A failed vault operation. account/token/have/need are filled in where
// they make sense, e.g. for INSUFFICIENT_BALANCE the holder, the token, its
// balance and the amount that was required.
struct VaultError
{
    VaultErrorCode code;
    AccountID account;
    TokenID token;
    uint256 have;
    uint256 need;
    std::string message;

    static VaultError make(VaultErrorCode code, std::string message);
    static VaultError insufficient(VaultErrorCode code,
                                   AccountID const& account,
                                   TokenID const& token, uint256 const& have,
                                   uint256 const& need);

    std::string toString() const;
};

// Thrown when a caller asks for the value of a failed VaultResult.
class UnexpectedVaultError : public std::runtime_error
{
    VaultError mError;

  public:
    explicit UnexpectedVaultError(VaultError const& error);

    VaultError const&
    getError() const
    {
        return mError;
    }
};

template <typename T> class VaultResult
{
    std::variant<T, VaultError> mValue;

  public:
    VaultResult(T value) : mValue(std::in_place_index<0>, std::move(value))
    {
    }
    VaultResult(VaultError error)
        : mValue(std::in_place_index<1>, std::move(error))
    {
    }

    bool
    isOk() const
    {
        return mValue.index() == 0;
    }

    explicit operator bool() const
    {
        return isOk();
    }

    T const&
    value() const
    {
        if (!isOk())
        {
            throw UnexpectedVaultError(std::get<1>(mValue));
        }
        return std::get<0>(mValue);
    }

    T&
    value()
    {
        if (!isOk())
        {
            throw UnexpectedVaultError(std::get<1>(mValue));
        }
        return std::get<0>(mValue);
    }

    VaultError const&
    error() const
    {
        if (isOk())
        {
            throw std::logic_error("vault result holds no error");
        }
        return std::get<1>(mValue);
    }

    bool
    failedWith(VaultErrorCode code) const
    {
        return !isOk() && std::get<1>(mValue).code == code;
    }
};

typedef VaultResult<std::monostate> VaultStatus;

inline VaultStatus
vaultOk()
{
    return VaultStatus(std::monostate{});
}
}
