// ENDOW - Protocol Vault
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/vault.h"
#include "endow/vault/errors.h"

#include <sstream>

namespace endow {
namespace vault {

namespace {

void RequireAddress(const Address& addr, const char* what) {
    if (addr.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, std::string(what) + " is null");
    }
}

} // namespace

std::string Vault::ToString() const {
    std::ostringstream ss;
    ss << "Vault(owner=" << owner.ToShortString()
       << ", token=" << token.ToShortString()
       << ", asset=" << (asset.IsNull() ? std::string("native") : asset.ToShortString())
       << ", treasury=" << treasury.ToShortString()
       << ", donation=" << donation.ToShortString()
       << ", lp=" << (isLPCreated ? "yes" : "no") << ")";
    return ss.str();
}

void AccessRoles::Validate() const {
    RequireAddress(admin, "admin");
    RequireAddress(scheduler, "scheduler");
    RequireAddress(registry, "registry");
}

void VaultServices::Validate() const {
    if (!venue) {
        throw VaultError(ErrorCode::InvalidAddress, "trading venue is missing");
    }
    if (!quoter) {
        throw VaultError(ErrorCode::InvalidAddress, "quoting service is missing");
    }
    if (!assets) {
        throw VaultError(ErrorCode::InvalidAddress, "asset ledger is missing");
    }
    if (!events) {
        throw VaultError(ErrorCode::InvalidAddress, "event log is missing");
    }
    RequireAddress(venue->GetAddress(), "trading venue address");
}

void VaultLinks::Validate() const {
    RequireAddress(owner, "owner");
    RequireAddress(token, "token");
    RequireAddress(treasury, "treasury");
    RequireAddress(donation, "donation forwarder");
    RequireAddress(guard, "launch guard");
    RequireAddress(liquidityManager, "liquidity manager");
    if (tokenLedger == nullptr) {
        throw VaultError(ErrorCode::InvalidAddress, "token ledger is missing");
    }
    if (directory == nullptr) {
        throw VaultError(ErrorCode::InvalidAddress, "registry is missing");
    }
    services.Validate();
    roles.Validate();
}

} // namespace vault
} // namespace endow
