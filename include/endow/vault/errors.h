// ENDOW - Vault Errors
// Copyright (c) 2026 ENDOW Developers
// MIT License

#ifndef ENDOW_VAULT_ERRORS_H
#define ENDOW_VAULT_ERRORS_H

#include <stdexcept>
#include <string>

namespace endow {
namespace vault {

/// Failure kinds raised by vault components. Any of them aborts and
/// reverts the operation in progress.
enum class ErrorCode {
    InvalidAddress,       ///< Null identity where a concrete collaborator is required
    InvalidAmount,        ///< Zero or malformed amount where a positive one is required
    Unauthorized,         ///< Caller is not the scheduler/registry/admin/venue
    AlreadySet,           ///< Pause flag set to its current value, or wiring repeated
    NotPaused,            ///< Emergency operation attempted while running
    TransferFailed,       ///< Native payout rejected by the recipient
    InsufficientOutput,   ///< Swap returned less than the slippage bound
    TradeBlocked,         ///< Launch guard rejected a buy
    DuplicateVault,       ///< Vault already registered for this owner
    PoolAlreadyExists,    ///< Liquidity already created for this vault
    InsufficientBalance,  ///< Ledger debit beyond the holder's balance
    UnknownVault,         ///< No vault registered for the owner
};

/// Stable name of an error code
const char* ErrorCodeToString(ErrorCode code);

/**
 * Exception carrying an ErrorCode.
 * what() is "<CodeName>: <detail>".
 */
class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& detail);
    
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_ERRORS_H
