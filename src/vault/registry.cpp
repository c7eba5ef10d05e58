// ENDOW - Vault Registry
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/registry.h"
#include "endow/vault/errors.h"
#include "endow/util/logging.h"

namespace endow {
namespace vault {

const char* VaultComponentToString(VaultComponent component) {
    switch (component) {
        case VaultComponent::Treasury: return "treasury";
        case VaultComponent::Donation: return "donation";
    }
    return "unknown";
}

VaultRegistry::VaultRegistry(const AccessRoles& roles, const VaultServices& services)
    : roles_(roles), services_(services) {
    roles_.Validate();
    services_.Validate();
}

void VaultRegistry::RequireAdmin(const CallContext& ctx) const {
    if (ctx.caller != roles_.admin) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " is not the registry admin");
    }
}

// ============================================================================
// Vault Lifecycle
// ============================================================================

VaultHandle& VaultRegistry::CreateVault(const CallContext& ctx, const VaultParams& params) {
    RequireAdmin(ctx);
    params.Validate();
    
    if (vaults_.count(params.owner) != 0) {
        throw VaultError(ErrorCode::DuplicateVault, "owner " + params.owner.ToShortString() +
                         " already has a vault");
    }
    for (const auto& entry : vaults_) {
        if (entry.second->Record().token == params.token) {
            throw VaultError(ErrorCode::DuplicateVault, "token " + params.token.ToShortString() +
                             " already belongs to a vault");
        }
    }
    
    VaultBuilder builder(params, ctx, services_);
    std::unique_ptr<VaultHandle> handle = builder.Wire(*this, roles_);
    
    ScopedTransaction tx({services_.events.get()});
    FundraisingToken& token = handle->Token();
    if (params.ownerAllocation != 0) {
        token.Mint(params.owner, params.ownerAllocation, ctx.timestamp);
    }
    if (params.treasuryAllocation != 0) {
        token.Mint(params.treasury, params.treasuryAllocation, ctx.timestamp);
    }
    services_.events->Emit(Event{EventType::VaultCreated, params.owner, params.token,
                                 token.TotalSupply(), 0, ctx.timestamp});
    
    VaultHandle& ref = *handle;
    vaults_.emplace(params.owner, std::move(handle));
    tx.Commit();
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Created " << ref.Record().ToString()
                                          << " with supply " << AmountToString(ref.Token().TotalSupply());
    return ref;
}

void VaultRegistry::CreateLiquidity(const CallContext& ctx, const Address& owner,
                                    const Amount& tokenAmount, const Amount& assetAmount) {
    VaultHandle& vault = GetVault(owner);
    if (ctx.caller != roles_.admin && ctx.caller != owner) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " may not create liquidity for " + owner.ToShortString());
    }
    if (vault.record_.isLPCreated) {
        throw VaultError(ErrorCode::PoolAlreadyExists, "liquidity already created for " +
                         owner.ToShortString());
    }
    
    venue::LiquidityDelta used = vault.Treasury().SeedLiquidity(ctx.As(roles_.registry),
                                                                 tokenAmount, assetAmount);
    vault.record_.isLPCreated = true;
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Created liquidity for " << owner.ToShortString()
        << ": " << AmountToString(used.used0) << "/" << AmountToString(used.used1);
}

void VaultRegistry::MarkLiquidityCreated(const CallContext& ctx, const Address& owner) {
    RequireAdmin(ctx);
    VaultHandle& vault = GetVault(owner);
    if (vault.record_.isLPCreated) {
        throw VaultError(ErrorCode::PoolAlreadyExists, "liquidity already created for " +
                         owner.ToShortString());
    }
    vault.record_.isLPCreated = true;
}

// ============================================================================
// Lookups
// ============================================================================

VaultHandle* VaultRegistry::FindVault(const Address& owner) {
    auto it = vaults_.find(owner);
    return it == vaults_.end() ? nullptr : it->second.get();
}

const VaultHandle* VaultRegistry::FindVault(const Address& owner) const {
    auto it = vaults_.find(owner);
    return it == vaults_.end() ? nullptr : it->second.get();
}

VaultHandle& VaultRegistry::GetVault(const Address& owner) {
    VaultHandle* vault = FindVault(owner);
    if (vault == nullptr) {
        throw VaultError(ErrorCode::UnknownVault, "no vault for " + owner.ToShortString());
    }
    return *vault;
}

const VaultHandle& VaultRegistry::GetVault(const Address& owner) const {
    const VaultHandle* vault = FindVault(owner);
    if (vault == nullptr) {
        throw VaultError(ErrorCode::UnknownVault, "no vault for " + owner.ToShortString());
    }
    return *vault;
}

venue::PoolKey VaultRegistry::GetPoolKey(const Address& owner) const {
    return GetVault(owner).Record().poolKey;
}

void VaultRegistry::ForEachVault(const std::function<void(VaultHandle&)>& fn) {
    for (auto& entry : vaults_) {
        fn(*entry.second);
    }
}

void VaultRegistry::ForEachVault(const std::function<void(const VaultHandle&)>& fn) const {
    for (const auto& entry : vaults_) {
        fn(*entry.second);
    }
}

// ============================================================================
// Pause Control
// ============================================================================

void VaultRegistry::SetPause(const CallContext& ctx, const Address& owner,
                             VaultComponent component, bool paused) {
    RequireAdmin(ctx);
    VaultHandle& vault = GetVault(owner);
    CallContext registryCtx = ctx.As(roles_.registry);
    switch (component) {
        case VaultComponent::Treasury:
            vault.Treasury().SetPause(registryCtx, paused);
            break;
        case VaultComponent::Donation:
            vault.Donation().SetPause(registryCtx, paused);
            break;
    }
}

void VaultRegistry::SetGlobalPause(const CallContext& ctx, bool paused) {
    RequireAdmin(ctx);
    if (globalPaused_ == paused) {
        throw VaultError(ErrorCode::AlreadySet, std::string("registry already ") +
                         (paused ? "paused" : "running"));
    }
    globalPaused_ = paused;
    services_.events->Emit(Event{EventType::PauseChanged, Address(), Address(),
                                 paused ? 1 : 0, 0, ctx.timestamp});
    LOG_WARN(util::LogCategory::REGISTRY) << "Global pause " << (paused ? "enabled" : "lifted")
                                          << " for " << vaults_.size() << " vault(s)";
}

void VaultRegistry::EmergencyWithdraw(const CallContext& ctx, const Address& owner,
                                      VaultComponent component, const Address& to) {
    RequireAdmin(ctx);
    VaultHandle& vault = GetVault(owner);
    CallContext registryCtx = ctx.As(roles_.registry);
    switch (component) {
        case VaultComponent::Treasury:
            vault.Treasury().EmergencyWithdraw(registryCtx, to);
            break;
        case VaultComponent::Donation:
            vault.Donation().EmergencyWithdraw(registryCtx, to);
            break;
    }
}

// ============================================================================
// State
// ============================================================================

void VaultRegistry::SaveState(DataStream& s) const {
    std::map<Address, bool> lpCreated;
    for (const auto& entry : vaults_) {
        lpCreated[entry.first] = entry.second->Record().isLPCreated;
    }
    s << globalPaused_ << lpCreated;
}

void VaultRegistry::LoadState(DataStream& s) {
    bool paused;
    std::map<Address, bool> lpCreated;
    s >> paused >> lpCreated;
    
    globalPaused_ = paused;
    for (const auto& entry : lpCreated) {
        VaultHandle* vault = FindVault(entry.first);
        if (vault == nullptr) {
            LOG_WARN(util::LogCategory::REGISTRY) << "Stored state for unknown vault "
                                                  << entry.first.ToShortString() << " ignored";
            continue;
        }
        vault->record_.isLPCreated = entry.second;
    }
}

} // namespace vault
} // namespace endow
