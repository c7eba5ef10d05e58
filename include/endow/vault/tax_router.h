// ENDOW - Tax Router
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Decides, for every fundraising-token transfer, how much is withheld and
// where the withheld amount goes. Pure decision logic: the token applies
// the resulting balance moves.

#ifndef ENDOW_VAULT_TAX_ROUTER_H
#define ENDOW_VAULT_TAX_ROUTER_H

#include "endow/core/types.h"
#include "endow/vault/params.h"

namespace endow {
namespace vault {

/// How one transfer is split
struct TaxBreakdown {
    Amount net;           ///< credited to the receiver
    Amount toLiquidity;   ///< credited to the liquidity manager
    Amount toTreasury;    ///< credited to the treasury
    
    Amount Tax() const { return toLiquidity + toTreasury; }
};

/**
 * Identities that never pay tax, in either direction.
 * The liquidity manager is the venue's pool account, so swaps against the
 * pool (market buys and sells) are untaxed; only transfers between other
 * holders pay the fee.
 */
struct SystemAddresses {
    Address liquidityManager;
    Address treasury;
    Address donation;
    
    bool IsSystem(const Address& addr) const {
        return addr == liquidityManager || addr == treasury || addr == donation;
    }
};

/// Treasury state the router consults on each transfer
class ITreasuryStatus {
public:
    virtual ~ITreasuryStatus() = default;
    
    /// Fee collection is suspended while the treasury (or everything) is paused
    virtual bool IsTaxSuspended() const = 0;
    
    /// Pool share of supply below which part of the tax supports liquidity
    virtual const Amount& LPHealthThreshold() const = 0;
};

class TaxRouter {
public:
    /// Balances the router needs, read from the token ledger by the caller
    struct LedgerView {
        Amount treasuryBalance;
        Amount liquidityBalance;
        Amount totalSupply;
    };
    
    TaxRouter(const TaxPolicy& policy, const SystemAddresses& system,
              const ITreasuryStatus& treasury);
    
    /**
     * Split a transfer of amount from `from` to `to`.
     *
     * Untaxed when either side is null (mint/burn) or a system address,
     * when fee collection is suspended, or when the treasury already holds
     * maximumTreasuryFraction of supply.
     */
    TaxBreakdown Route(const Address& from, const Address& to, const Amount& amount,
                       const LedgerView& view) const;
    
    bool IsExempt(const Address& from, const Address& to) const;
    
    /// Treasury share of supply has reached the cap
    bool IsTreasuryFull(const LedgerView& view) const;
    
    /// Pool share of supply is below the treasury's LP health threshold
    bool NeedsLiquiditySupport(const LedgerView& view) const;
    
    const TaxPolicy& Policy() const { return policy_; }
    const SystemAddresses& System() const { return system_; }

private:
    TaxPolicy policy_;
    SystemAddresses system_;
    const ITreasuryStatus& treasury_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_TAX_ROUTER_H
