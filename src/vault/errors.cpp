// ENDOW - Vault Errors
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/errors.h"

namespace endow {
namespace vault {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidAddress:      return "InvalidAddress";
        case ErrorCode::InvalidAmount:       return "InvalidAmount";
        case ErrorCode::Unauthorized:        return "Unauthorized";
        case ErrorCode::AlreadySet:          return "AlreadySet";
        case ErrorCode::NotPaused:           return "NotPaused";
        case ErrorCode::TransferFailed:      return "TransferFailed";
        case ErrorCode::InsufficientOutput:  return "InsufficientOutput";
        case ErrorCode::TradeBlocked:        return "TradeBlocked";
        case ErrorCode::DuplicateVault:      return "DuplicateVault";
        case ErrorCode::PoolAlreadyExists:   return "PoolAlreadyExists";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::UnknownVault:        return "UnknownVault";
    }
    return "Unknown";
}

VaultError::VaultError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + detail)
    , code_(code) {}

} // namespace vault
} // namespace endow
