// ENDOW - Donation Forwarder
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Converts every fundraising token the forwarder receives into the pool's
// paired asset and pays the whole proceeds to the nonprofit's payout
// address. Between successful upkeeps the token balance drains to zero.

#ifndef ENDOW_VAULT_DONATION_H
#define ENDOW_VAULT_DONATION_H

#include "endow/core/types.h"
#include "endow/vault/context.h"
#include "endow/vault/journal.h"
#include "endow/vault/vault.h"

#include <vector>

namespace endow {
namespace vault {

class DonationForwarder : public Journaled {
public:
    DonationForwarder(const Address& self, const Address& payout, const Amount& slippageFraction);
    
    /// Attach the rest of the vault. Allowed once (AlreadySet).
    void Wire(const VaultLinks& links);
    bool IsWired() const { return token_ != nullptr; }
    
    /// Needed while the forwarder holds tokens and is not paused
    UpkeepResult CheckUpkeep(const CallContext& ctx, const std::vector<Byte>& checkData = {}) const;
    
    /**
     * Sell the whole token balance and forward the proceeds. Scheduler only.
     * A zero balance or a pause makes this a no-op.
     *
     * @return amount paid out (0 for a no-op)
     * @throws VaultError(InsufficientOutput) if the swap undershoots the quote
     * @throws VaultError(TransferFailed) if the payout rejects native value
     */
    Amount PerformUpkeep(const CallContext& ctx, const std::vector<Byte>& performData = {});
    
    /// Registry only. Setting the current value again throws AlreadySet.
    void SetPause(const CallContext& ctx, bool paused);
    
    /// Registry only, while paused
    void EmergencyWithdraw(const CallContext& ctx, const Address& to);
    
    bool IsPaused() const { return paused_; }
    bool IsSuspended() const;
    
    Amount TokenBalance() const;
    
    const Address& GetAddress() const { return self_; }
    const Address& PayoutAddress() const { return payout_; }
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    void RequireWired() const;
    void RequireRegistry(const CallContext& ctx) const;
    
    /// Send amount of currency to the payout address
    void PayOut(const Address& currency, const Amount& amount);
    
    Address self_;
    Address payout_;
    Amount slippageFraction_;
    
    Address owner_;
    AccessRoles roles_;
    FundraisingToken* token_{nullptr};
    const IVaultDirectory* directory_{nullptr};
    VaultServices services_;
    Address asset_;
    
    bool paused_{false};
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_DONATION_H
