// ENDOW - Vault Registry
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Owns the owner -> vault map. Every vault is created, paused and given
// liquidity through the registry, which enforces one vault per owner and
// one liquidity creation per vault.

#ifndef ENDOW_VAULT_REGISTRY_H
#define ENDOW_VAULT_REGISTRY_H

#include "endow/core/types.h"
#include "endow/vault/builder.h"
#include "endow/vault/context.h"
#include "endow/vault/journal.h"
#include "endow/vault/vault.h"

#include <functional>
#include <map>
#include <memory>

namespace endow {
namespace vault {

/// Pausable vault components
enum class VaultComponent : uint8_t {
    Treasury = 0,
    Donation = 1,
};

const char* VaultComponentToString(VaultComponent component);

class VaultRegistry : public IVaultDirectory, public Journaled {
public:
    /// Calls made by the registry to vault components use roles.registry
    /// as the caller identity.
    VaultRegistry(const AccessRoles& roles, const VaultServices& services);
    
    // ========================================================================
    // Vault Lifecycle
    // ========================================================================
    
    /**
     * Build, wire and register a vault, then mint the initial allocations.
     * Admin only.
     * @throws VaultError(DuplicateVault) if the owner or token already has a vault
     */
    VaultHandle& CreateVault(const CallContext& ctx, const VaultParams& params);
    
    /**
     * Seed the vault's pool from its treasury. Admin or the vault owner.
     * @throws VaultError(PoolAlreadyExists) on a second call
     */
    void CreateLiquidity(const CallContext& ctx, const Address& owner,
                         const Amount& tokenAmount, const Amount& assetAmount);
    
    /// Record liquidity created outside the registry. Admin only.
    void MarkLiquidityCreated(const CallContext& ctx, const Address& owner);
    
    // ========================================================================
    // Lookups
    // ========================================================================
    
    VaultHandle* FindVault(const Address& owner);
    const VaultHandle* FindVault(const Address& owner) const;
    
    /// Throws VaultError(UnknownVault)
    VaultHandle& GetVault(const Address& owner);
    const VaultHandle& GetVault(const Address& owner) const;
    
    venue::PoolKey GetPoolKey(const Address& owner) const override;
    
    /// Visit vaults in owner order
    void ForEachVault(const std::function<void(VaultHandle&)>& fn);
    void ForEachVault(const std::function<void(const VaultHandle&)>& fn) const;
    
    size_t Size() const { return vaults_.size(); }
    
    // ========================================================================
    // Pause Control
    // ========================================================================
    
    /// Admin only. Forwards to the component, which rejects a repeated value.
    void SetPause(const CallContext& ctx, const Address& owner,
                  VaultComponent component, bool paused);
    
    /// Admin only. Suspends every component of every vault.
    void SetGlobalPause(const CallContext& ctx, bool paused);
    
    bool IsGloballyPaused() const override { return globalPaused_; }
    
    /// Admin only. Component must be paused.
    void EmergencyWithdraw(const CallContext& ctx, const Address& owner,
                           VaultComponent component, const Address& to);
    
    const Address& GetAddress() const { return roles_.registry; }
    const AccessRoles& Roles() const { return roles_; }
    const VaultServices& Services() const { return services_; }
    
    /// Global pause flag and per-vault liquidity flags. Entries for owners
    /// without a registered vault are skipped on load.
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    void RequireAdmin(const CallContext& ctx) const;
    
    AccessRoles roles_;
    VaultServices services_;
    
    std::map<Address, std::unique_ptr<VaultHandle>> vaults_;
    bool globalPaused_{false};
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_REGISTRY_H
