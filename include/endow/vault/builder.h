// ENDOW - Vault Builder
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Token, treasury, donation forwarder and launch guard refer to each other.
// The builder breaks the cycle in two phases: allocate every component
// unwired, then inject all links in one Wire() step that yields a fully
// linked VaultHandle. Links never change afterwards.

#ifndef ENDOW_VAULT_BUILDER_H
#define ENDOW_VAULT_BUILDER_H

#include "endow/core/types.h"
#include "endow/vault/context.h"
#include "endow/vault/donation.h"
#include "endow/vault/launch_guard.h"
#include "endow/vault/params.h"
#include "endow/vault/tax_router.h"
#include "endow/vault/token.h"
#include "endow/vault/treasury.h"
#include "endow/vault/vault.h"

#include <cstdint>
#include <memory>

namespace endow {
namespace vault {

// ============================================================================
// Vault Parameters
// ============================================================================

/// Everything needed to create one vault
struct VaultParams {
    Address owner;
    Address token;
    Address asset;        ///< null for the native currency
    Address treasury;
    Address donation;
    Address guard;
    Address payout;
    
    uint32_t fee{3000};
    int32_t tickSpacing{60};
    
    /// Minted at creation
    Amount ownerAllocation;
    Amount treasuryAllocation;
    
    EngineParams engine{EngineParams::Default()};
    
    /**
     * Throws VaultError(InvalidAddress) on a null or repeated component
     * identity and VaultError(InvalidAmount) on bad parameters.
     */
    void Validate() const;
};

// ============================================================================
// Vault Handle
// ============================================================================

/// A fully linked vault: the record plus the components it names
class VaultHandle {
public:
    const Vault& Record() const { return record_; }
    const Address& Owner() const { return record_.owner; }
    
    FundraisingToken& Token() { return *token_; }
    const FundraisingToken& Token() const { return *token_; }
    
    TreasuryController& Treasury() { return *treasury_; }
    const TreasuryController& Treasury() const { return *treasury_; }
    
    DonationForwarder& Donation() { return *donation_; }
    const DonationForwarder& Donation() const { return *donation_; }
    
    LaunchGuard& Guard() { return *guard_; }
    const LaunchGuard& Guard() const { return *guard_; }
    
    const TaxRouter& Router() const { return *router_; }

private:
    friend class VaultBuilder;
    friend class VaultRegistry;
    
    VaultHandle() = default;
    
    Vault record_;
    std::unique_ptr<FundraisingToken> token_;
    std::unique_ptr<TreasuryController> treasury_;
    std::unique_ptr<DonationForwarder> donation_;
    std::unique_ptr<LaunchGuard> guard_;
    std::unique_ptr<TaxRouter> router_;
};

// ============================================================================
// Vault Builder
// ============================================================================

class VaultBuilder {
public:
    /// Validate params and allocate the unwired components. The launch guard
    /// and treasury clock start at ctx's block and time.
    VaultBuilder(const VaultParams& params, const CallContext& ctx,
                 const VaultServices& services);
    
    /**
     * Link every component and hand over the vault. Allowed once; a second
     * call throws VaultError(AlreadySet).
     */
    std::unique_ptr<VaultHandle> Wire(const IVaultDirectory& directory, const AccessRoles& roles);
    
    bool IsWired() const { return !handle_; }

private:
    VaultParams params_;
    VaultServices services_;
    std::unique_ptr<VaultHandle> handle_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_BUILDER_H
