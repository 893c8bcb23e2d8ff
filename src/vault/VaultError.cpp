// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "vault/VaultError.h"

#include <fmt/format.h>

namespace vaultcheck
{

char const*
toString(VaultErrorCode code)
{
    switch (code)
    {
    case VaultErrorCode::INSUFFICIENT_BALANCE:
        return "INSUFFICIENT_BALANCE";
    case VaultErrorCode::INSUFFICIENT_POOL_BALANCE:
        return "INSUFFICIENT_POOL_BALANCE";
    case VaultErrorCode::SWAP_LIMIT:
        return "SWAP_LIMIT";
    case VaultErrorCode::BPT_AMOUNT_OUT_BELOW_MIN:
        return "BPT_AMOUNT_OUT_BELOW_MIN";
    case VaultErrorCode::BPT_AMOUNT_IN_ABOVE_MAX:
        return "BPT_AMOUNT_IN_ABOVE_MAX";
    case VaultErrorCode::AMOUNT_IN_ABOVE_MAX:
        return "AMOUNT_IN_ABOVE_MAX";
    case VaultErrorCode::AMOUNT_OUT_BELOW_MIN:
        return "AMOUNT_OUT_BELOW_MIN";
    case VaultErrorCode::INVARIANT_RATIO_ABOVE_MAX:
        return "INVARIANT_RATIO_ABOVE_MAX";
    case VaultErrorCode::INVARIANT_RATIO_BELOW_MIN:
        return "INVARIANT_RATIO_BELOW_MIN";
    case VaultErrorCode::ACCOUNT_NOT_FOUND:
        return "ACCOUNT_NOT_FOUND";
    case VaultErrorCode::POOL_NOT_REGISTERED:
        return "POOL_NOT_REGISTERED";
    case VaultErrorCode::POOL_ALREADY_REGISTERED:
        return "POOL_ALREADY_REGISTERED";
    case VaultErrorCode::POOL_NOT_INITIALIZED:
        return "POOL_NOT_INITIALIZED";
    case VaultErrorCode::POOL_ALREADY_INITIALIZED:
        return "POOL_ALREADY_INITIALIZED";
    case VaultErrorCode::TOKEN_NOT_REGISTERED:
        return "TOKEN_NOT_REGISTERED";
    case VaultErrorCode::BUFFER_NOT_INITIALIZED:
        return "BUFFER_NOT_INITIALIZED";
    case VaultErrorCode::BUFFER_ALREADY_INITIALIZED:
        return "BUFFER_ALREADY_INITIALIZED";
    case VaultErrorCode::BUFFER_TOTAL_SUPPLY_TOO_LOW:
        return "BUFFER_TOTAL_SUPPLY_TOO_LOW";
    case VaultErrorCode::ISSUED_SHARES_BELOW_MIN:
        return "ISSUED_SHARES_BELOW_MIN";
    case VaultErrorCode::SWAP_FEE_OUT_OF_RANGE:
        return "SWAP_FEE_OUT_OF_RANGE";
    case VaultErrorCode::AMOUNT_GIVEN_ZERO:
        return "AMOUNT_GIVEN_ZERO";
    case VaultErrorCode::TRADE_AMOUNT_TOO_SMALL:
        return "TRADE_AMOUNT_TOO_SMALL";
    case VaultErrorCode::WRAP_AMOUNT_TOO_SMALL:
        return "WRAP_AMOUNT_TOO_SMALL";
    case VaultErrorCode::POOL_TOTAL_SUPPLY_TOO_LOW:
        return "POOL_TOTAL_SUPPLY_TOO_LOW";
    case VaultErrorCode::VAULT_LOCKED:
        return "VAULT_LOCKED";
    case VaultErrorCode::INVALID_INPUT:
        return "INVALID_INPUT";
    case VaultErrorCode::POOL_MATH:
        return "POOL_MATH";
    case VaultErrorCode::ARITHMETIC:
        return "ARITHMETIC";
    }
    return "UNKNOWN";
}

VaultError
VaultError::make(VaultErrorCode code, std::string message)
{
    VaultError e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

VaultError
VaultError::insufficient(VaultErrorCode code, AccountID const& account,
                         TokenID const& token, uint256 const& have,
                         uint256 const& need)
{
    VaultError e;
    e.code = code;
    e.account = account;
    e.token = token;
    e.have = have;
    e.need = need;
    e.message = fmt::format(FMT_STRING("{} of {} has {}, needs {}"),
                            account.empty() ? std::string("amount") : account,
                            token, have, need);
    return e;
}

std::string
VaultError::toString() const
{
    return fmt::format(FMT_STRING("{}: {}"), vaultcheck::toString(code),
                       message);
}

UnexpectedVaultError::UnexpectedVaultError(VaultError const& error)
    : std::runtime_error(
          fmt::format(FMT_STRING("unexpected vault error {}"),
                      error.toString()))
    , mError(error)
{
}
}
