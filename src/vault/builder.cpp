// ENDOW - Vault Builder
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/builder.h"
#include "endow/vault/errors.h"
#include "endow/util/logging.h"

#include <set>

namespace endow {
namespace vault {

void VaultParams::Validate() const {
    const std::pair<const Address*, const char*> identities[] = {
        {&owner, "owner"}, {&token, "token"}, {&treasury, "treasury"},
        {&donation, "donation forwarder"}, {&guard, "launch guard"}, {&payout, "payout"},
    };
    std::set<Address> seen;
    for (const auto& [addr, name] : identities) {
        if (addr->IsNull()) {
            throw VaultError(ErrorCode::InvalidAddress, std::string(name) + " is null");
        }
        // The payout may be the owner itself
        if (addr != &payout && !seen.insert(*addr).second) {
            throw VaultError(ErrorCode::InvalidAddress, std::string(name) + " " +
                             addr->ToShortString() + " is used twice");
        }
    }
    if (asset == token) {
        throw VaultError(ErrorCode::InvalidAddress, "asset equals the fundraising token");
    }
    if (tickSpacing <= 0) {
        throw VaultError(ErrorCode::InvalidAmount, "tick spacing must be positive");
    }
    engine.Validate();
}

VaultBuilder::VaultBuilder(const VaultParams& params, const CallContext& ctx,
                           const VaultServices& services)
    : params_(params), services_(services) {
    params_.Validate();
    services_.Validate();
    
    // VaultHandle's constructor is private to its friends, so make_unique cannot reach it
    handle_.reset(new VaultHandle());
    handle_->token_ = std::make_unique<FundraisingToken>(params_.token, services_.events);
    handle_->treasury_ = std::make_unique<TreasuryController>(
        params_.treasury, params_.engine.treasury, params_.engine.tax, ctx.timestamp);
    handle_->donation_ = std::make_unique<DonationForwarder>(
        params_.donation, params_.payout, params_.engine.donationSlippageFraction);
    handle_->guard_ = std::make_unique<LaunchGuard>(
        params_.guard, params_.engine.guard, ctx.blockNumber, ctx.timestamp);
}

std::unique_ptr<VaultHandle> VaultBuilder::Wire(const IVaultDirectory& directory,
                                                const AccessRoles& roles) {
    if (!handle_) {
        throw VaultError(ErrorCode::AlreadySet, "vault for " + params_.owner.ToShortString() +
                         " already wired");
    }
    roles.Validate();
    
    const Address& liquidityManager = services_.venue->GetAddress();
    
    Vault& record = handle_->record_;
    record.owner = params_.owner;
    record.token = params_.token;
    record.asset = params_.asset;
    record.treasury = params_.treasury;
    record.donation = params_.donation;
    record.guard = params_.guard;
    record.liquidityManager = liquidityManager;
    record.payout = params_.payout;
    record.poolKey = venue::PoolKey::Make(params_.token, params_.asset, params_.fee,
                                          params_.tickSpacing, params_.guard);
    record.isLPCreated = false;
    
    VaultLinks links;
    links.owner = params_.owner;
    links.token = params_.token;
    links.asset = params_.asset;
    links.treasury = params_.treasury;
    links.donation = params_.donation;
    links.guard = params_.guard;
    links.liquidityManager = liquidityManager;
    links.tokenLedger = handle_->token_.get();
    links.directory = &directory;
    links.services = services_;
    links.roles = roles;
    links.Validate();
    
    SystemAddresses system{liquidityManager, params_.treasury, params_.donation};
    handle_->router_ = std::make_unique<TaxRouter>(params_.engine.tax, system, *handle_->treasury_);
    
    handle_->treasury_->Wire(links);
    handle_->donation_->Wire(links);
    handle_->guard_->Wire(links);
    handle_->token_->SetTaxRouter(*handle_->router_);
    
    LOG_DEBUG(util::LogCategory::REGISTRY) << "Wired " << record.ToString();
    return std::move(handle_);
}

} // namespace vault
} // namespace endow
