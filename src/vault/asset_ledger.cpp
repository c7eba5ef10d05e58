// ENDOW - Asset Ledger
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/asset_ledger.h"
#include "endow/vault/errors.h"

#include <vector>

namespace endow {
namespace vault {

Amount AssetLedger::BalanceOf(const Address& asset, const Address& holder) const {
    auto it = balances_.find(Key(asset, holder));
    return it == balances_.end() ? Amount(0) : it->second;
}

bool AssetLedger::Transfer(const Address& asset, const Address& from,
                           const Address& to, const Amount& amount) {
    if (asset.IsNull() && !AcceptsNative(to)) {
        return false;
    }
    
    Amount fromBalance = BalanceOf(asset, from);
    if (fromBalance < amount) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         from.ToShortString() + " holds " + AmountToString(fromBalance) +
                         " of " + asset.ToShortString() + ", needs " + AmountToString(amount));
    }
    if (amount == 0 || from == to) {
        return true;
    }
    
    balances_[Key(asset, from)] = fromBalance - amount;
    balances_[Key(asset, to)] += amount;
    return true;
}

void AssetLedger::Credit(const Address& asset, const Address& holder, const Amount& amount) {
    balances_[Key(asset, holder)] += amount;
}

void AssetLedger::SetAcceptsNative(const Address& holder, bool accepts) {
    if (accepts) {
        rejectsNative_.erase(holder);
    } else {
        rejectsNative_.insert(holder);
    }
}

bool AssetLedger::AcceptsNative(const Address& holder) const {
    return rejectsNative_.count(holder) == 0;
}

void AssetLedger::SaveState(DataStream& s) const {
    s << balances_;
    s << std::vector<Address>(rejectsNative_.begin(), rejectsNative_.end());
}

void AssetLedger::LoadState(DataStream& s) {
    std::map<Key, Amount> balances;
    std::vector<Address> rejects;
    s >> balances >> rejects;
    balances_ = std::move(balances);
    rejectsNative_ = std::set<Address>(rejects.begin(), rejects.end());
}

} // namespace vault
} // namespace endow
