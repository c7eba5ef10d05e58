// ENDOW - Fundraising Token
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Balance ledger of the fundraising token. Every transfer passes through
// the vault's TaxRouter once the vault is wired.

#ifndef ENDOW_VAULT_TOKEN_H
#define ENDOW_VAULT_TOKEN_H

#include "endow/core/types.h"
#include "endow/vault/events.h"
#include "endow/vault/journal.h"
#include "endow/vault/tax_router.h"

#include <map>
#include <memory>

namespace endow {
namespace vault {

class FundraisingToken : public Journaled {
public:
    FundraisingToken(const Address& self, std::shared_ptr<EventLog> events);
    
    const Address& GetAddress() const { return self_; }
    
    Amount TotalSupply() const { return totalSupply_; }
    Amount BalanceOf(const Address& holder) const;
    
    /// Attach the tax router. Allowed once; a second call throws AlreadySet.
    void SetTaxRouter(const TaxRouter& router);
    bool HasTaxRouter() const { return router_ != nullptr; }
    
    /// Create amount for `to` (untaxed)
    void Mint(const Address& to, const Amount& amount, Timestamp time = 0);
    
    /// Destroy amount held by `from`; throws InsufficientBalance
    void Burn(const Address& from, const Amount& amount, Timestamp time = 0);
    
    /**
     * Move amount from `from` to `to`, withholding tax as decided by the
     * router. Throws InsufficientBalance if `from` holds less than amount.
     */
    TaxBreakdown Transfer(const Address& from, const Address& to, const Amount& amount,
                          Timestamp time = 0);
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    void Debit(const Address& holder, const Amount& amount);
    void Credit(const Address& holder, const Amount& amount);
    
    Address self_;
    std::shared_ptr<EventLog> events_;
    const TaxRouter* router_{nullptr};
    
    std::map<Address, Amount> balances_;
    Amount totalSupply_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_TOKEN_H
