// ENDOW - Asset Ledger
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Balances of the paired assets (ERC20-like tokens and the chain's native
// currency, keyed by the null address).

#ifndef ENDOW_VAULT_ASSET_LEDGER_H
#define ENDOW_VAULT_ASSET_LEDGER_H

#include "endow/core/types.h"
#include "endow/vault/journal.h"

#include <map>
#include <set>
#include <utility>

namespace endow {
namespace vault {

class IAssetLedger : public Journaled {
public:
    virtual Amount BalanceOf(const Address& asset, const Address& holder) const = 0;
    
    /**
     * Move amount of asset between holders.
     * Throws VaultError(InsufficientBalance) if `from` is short.
     * @return false if the asset is native and the recipient rejects value
     *         transfers; no balance changes in that case
     */
    virtual bool Transfer(const Address& asset, const Address& from,
                          const Address& to, const Amount& amount) = 0;
};

class AssetLedger : public IAssetLedger {
public:
    Amount BalanceOf(const Address& asset, const Address& holder) const override;
    
    bool Transfer(const Address& asset, const Address& from,
                  const Address& to, const Amount& amount) override;
    
    /// Create units out of thin air (funding venues and test accounts)
    void Credit(const Address& asset, const Address& holder, const Amount& amount);
    
    /// Recipients that reject native value transfers
    void SetAcceptsNative(const Address& holder, bool accepts);
    bool AcceptsNative(const Address& holder) const;
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    using Key = std::pair<Address, Address>;  // (asset, holder)
    
    std::map<Key, Amount> balances_;
    std::set<Address> rejectsNative_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_ASSET_LEDGER_H
