// ENDOW - Keeper
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/keeper.h"
#include "endow/vault/errors.h"
#include "endow/util/logging.h"

#include <sstream>

namespace endow {
namespace vault {

std::string KeeperStats::ToString() const {
    std::ostringstream ss;
    ss << "checked=" << checked << " performed=" << performed << " failed=" << failed;
    return ss.str();
}

Keeper::Keeper(VaultRegistry& registry, const Address& scheduler)
    : registry_(registry), scheduler_(scheduler) {
    if (scheduler_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "scheduler address is null");
    }
}

void Keeper::ServiceTreasury(VaultHandle& vault, const CallContext& ctx, KeeperStats& stats) {
    TreasuryController& treasury = vault.Treasury();
    ++stats.checked;
    try {
        UpkeepResult check = treasury.CheckUpkeep(ctx);
        if (!check.needed) {
            return;
        }
        TreasuryDecision decision = TreasuryDecision::Decode(check.performData);
        LOG_DEBUG(util::LogCategory::KEEPER) << "Treasury " << treasury.GetAddress().ToShortString()
            << " needs upkeep (transfer=" << decision.initiateTransfer
            << ", topup=" << decision.initiateLiquidityTopUp << ")";
        treasury.PerformUpkeep(ctx, check.performData);
        ++stats.performed;
    } catch (const VaultError& e) {
        ++stats.failed;
        LOG_WARN(util::LogCategory::KEEPER) << "Treasury upkeep for " << vault.Owner().ToShortString()
                                            << " failed: " << e.what();
    }
}

void Keeper::ServiceDonation(VaultHandle& vault, const CallContext& ctx, KeeperStats& stats) {
    DonationForwarder& donation = vault.Donation();
    ++stats.checked;
    try {
        UpkeepResult check = donation.CheckUpkeep(ctx);
        if (!check.needed) {
            return;
        }
        donation.PerformUpkeep(ctx, check.performData);
        ++stats.performed;
    } catch (const VaultError& e) {
        ++stats.failed;
        LOG_WARN(util::LogCategory::KEEPER) << "Donation upkeep for " << vault.Owner().ToShortString()
                                            << " failed: " << e.what();
    }
}

KeeperStats Keeper::RunCycle(BlockNumber block, Timestamp now) {
    util::ScopedLogTimer timer(util::LogCategory::KEEPER, "keeper cycle");
    
    CallContext ctx{scheduler_, block, now};
    KeeperStats stats;
    registry_.ForEachVault([&](VaultHandle& vault) {
        // Treasury first: a transfer-and-burn funds the forwarder this cycle
        ServiceTreasury(vault, ctx, stats);
        ServiceDonation(vault, ctx, stats);
    });
    
    ++cycles_;
    totals_.checked += stats.checked;
    totals_.performed += stats.performed;
    totals_.failed += stats.failed;
    
    if (stats.performed != 0 || stats.failed != 0) {
        LOG_INFO(util::LogCategory::KEEPER) << "Cycle " << cycles_ << " at block " << block
                                            << ": " << stats.ToString();
    }
    return stats;
}

} // namespace vault
} // namespace endow
