// ENDOW - Treasury Controller
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Scheduled upkeep of a vault treasury. Each poll derives one of four
// states (idle, transfer due, liquidity low, both) from the current ledgers
// and wall-clock time; nothing about the decision is persisted.

#ifndef ENDOW_VAULT_TREASURY_H
#define ENDOW_VAULT_TREASURY_H

#include "endow/core/types.h"
#include "endow/vault/context.h"
#include "endow/vault/journal.h"
#include "endow/vault/params.h"
#include "endow/vault/tax_router.h"
#include "endow/vault/vault.h"

#include <utility>
#include <vector>

namespace endow {
namespace vault {

// ============================================================================
// Treasury Decision
// ============================================================================

/// Work selected by CheckUpkeep and carried to PerformUpkeep
struct TreasuryDecision {
    bool initiateTransfer{false};
    bool initiateLiquidityTopUp{false};
    
    bool Any() const { return initiateTransfer || initiateLiquidityTopUp; }
    
    std::vector<Byte> Encode() const;
    
    /// Empty data decodes to (false, false). Throws VaultError(InvalidAmount)
    /// on malformed data.
    static TreasuryDecision Decode(const std::vector<Byte>& data);
};

// ============================================================================
// Treasury Controller
// ============================================================================

class TreasuryController : public Journaled, public ITreasuryStatus {
public:
    /// The first transfer-and-burn becomes due one interval after startTime
    TreasuryController(const Address& self, const TreasuryParams& params,
                       const TaxPolicy& policy, Timestamp startTime);
    
    /// Attach the rest of the vault. Allowed once (AlreadySet).
    void Wire(const VaultLinks& links);
    bool IsWired() const { return token_ != nullptr; }
    
    // ========================================================================
    // Upkeep
    // ========================================================================
    
    /// Scheduler poll. Never needed while paused locally or globally.
    UpkeepResult CheckUpkeep(const CallContext& ctx, const std::vector<Byte>& checkData = {}) const;
    
    /// What the current state calls for, ignoring pause
    TreasuryDecision Evaluate(Timestamp now) const;
    
    /**
     * Execute a decision. Scheduler only. Each flag is re-checked against
     * the current state, so a stale decision does nothing. Transfer-and-burn
     * runs before the liquidity top-up; any failure reverts both.
     */
    void PerformUpkeep(const CallContext& ctx, const std::vector<Byte>& performData);
    
    // ========================================================================
    // Registry Operations
    // ========================================================================
    
    /// Registry only. Setting the current value again throws AlreadySet.
    void SetPause(const CallContext& ctx, bool paused);
    
    /// Registry only, while paused. Moves every token and asset unit held to `to`.
    void EmergencyWithdraw(const CallContext& ctx, const Address& to);
    
    /// Registry only. Deposit initial liquidity from the treasury's balances.
    venue::LiquidityDelta SeedLiquidity(const CallContext& ctx, const Amount& tokenAmount,
                                        const Amount& assetAmount);
    
    // ========================================================================
    // Status
    // ========================================================================
    
    bool IsPaused() const { return paused_; }
    bool IsTaxSuspended() const override;
    const Amount& LPHealthThreshold() const override { return params_.minLPHealthThreshold; }
    
    Timestamp LastTransferTimestamp() const { return lastTransferTimestamp_; }
    
    /// Treasury token balance as a fraction of supply
    Amount TreasuryFraction() const;
    
    /// Pool token balance as a fraction of supply
    Amount LiquidityHealth() const;
    
    /// Tokens the next transfer-and-burn forwards (and half of what it burns)
    Amount NextBurnAmount() const;
    
    /// Tokens the next liquidity top-up would commit
    Amount LiquidityDeficit() const;
    
    const Address& GetAddress() const { return self_; }
    const TreasuryParams& Params() const { return params_; }
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    void RequireWired() const;
    void RequireRegistry(const CallContext& ctx) const;
    bool IsTransferDue(Timestamp now) const;
    bool IsLiquidityLow() const;
    
    void TransferAndBurn(const CallContext& ctx);
    void TopUpLiquidity(const CallContext& ctx);
    
    /// Split (token, asset) into pool order
    std::pair<Amount, Amount> ToPoolOrder(const venue::PoolKey& key, const Amount& tokenAmount,
                                          const Amount& assetAmount) const;
    
    Address self_;
    TreasuryParams params_;
    TaxPolicy policy_;
    
    Address owner_;
    Address asset_;
    Address donation_;
    Address liquidityManager_;
    AccessRoles roles_;
    FundraisingToken* token_{nullptr};
    const IVaultDirectory* directory_{nullptr};
    VaultServices services_;
    
    Timestamp lastTransferTimestamp_{0};
    bool paused_{false};
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_TREASURY_H
