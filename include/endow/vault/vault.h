// ENDOW - Protocol Vault
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// The per-nonprofit vault record and the links injected into each vault
// component during the single wiring step.

#ifndef ENDOW_VAULT_VAULT_H
#define ENDOW_VAULT_VAULT_H

#include "endow/core/serialize.h"
#include "endow/core/types.h"
#include "endow/vault/asset_ledger.h"
#include "endow/vault/events.h"
#include "endow/venue/venue.h"

#include <memory>
#include <string>

namespace endow {
namespace vault {

class FundraisingToken;

// ============================================================================
// Vault Record
// ============================================================================

/// Identities that make up one vault. Owner is immutable; isLPCreated only
/// moves from false to true.
struct Vault {
    Address owner;
    Address token;
    Address asset;              ///< paired asset, null for the native currency
    Address treasury;
    Address donation;
    Address guard;
    Address liquidityManager;
    Address payout;
    venue::PoolKey poolKey;
    bool isLPCreated{false};
    
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Vault& v) {
    s << v.owner << v.token << v.asset << v.treasury << v.donation
      << v.guard << v.liquidityManager << v.payout << v.poolKey << v.isLPCreated;
}

template<typename Stream>
void Unserialize(Stream& s, Vault& v) {
    s >> v.owner >> v.token >> v.asset >> v.treasury >> v.donation
      >> v.guard >> v.liquidityManager >> v.payout >> v.poolKey >> v.isLPCreated;
}

// ============================================================================
// Access Roles
// ============================================================================

/// Privileged callers shared by every vault of a registry
struct AccessRoles {
    Address admin;       ///< creates vaults, pauses, creates liquidity
    Address scheduler;   ///< the only caller of PerformUpkeep
    Address registry;    ///< the only caller of component pause/withdraw
    
    /// Throws VaultError(InvalidAddress) if any role is null
    void Validate() const;
};

// ============================================================================
// Services
// ============================================================================

/// External collaborators injected into every vault
struct VaultServices {
    std::shared_ptr<venue::ITradingVenue> venue;
    std::shared_ptr<venue::IQuoter> quoter;
    std::shared_ptr<IAssetLedger> assets;
    std::shared_ptr<EventLog> events;
    
    /// Throws VaultError(InvalidAddress) if any service is missing
    void Validate() const;
};

/// Registry lookups consumed by the vault components
class IVaultDirectory {
public:
    virtual ~IVaultDirectory() = default;
    
    /// Pool key of the owner's vault; throws VaultError(UnknownVault)
    virtual venue::PoolKey GetPoolKey(const Address& owner) const = 0;
    
    virtual bool IsGloballyPaused() const = 0;
};

// ============================================================================
// Links
// ============================================================================

/// Everything a component learns when its vault is wired
struct VaultLinks {
    Address owner;
    Address token;
    Address asset;
    Address treasury;
    Address donation;
    Address guard;
    Address liquidityManager;
    
    FundraisingToken* tokenLedger{nullptr};
    const IVaultDirectory* directory{nullptr};
    VaultServices services;
    AccessRoles roles;
    
    /// Throws VaultError(InvalidAddress) on a null identity or collaborator.
    /// The asset may be null (native currency).
    void Validate() const;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_VAULT_H
