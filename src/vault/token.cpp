// ENDOW - Fundraising Token
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/token.h"
#include "endow/vault/errors.h"
#include "endow/util/logging.h"

namespace endow {
namespace vault {

FundraisingToken::FundraisingToken(const Address& self, std::shared_ptr<EventLog> events)
    : self_(self), events_(std::move(events)) {
    if (self_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "token address is null");
    }
    if (!events_) {
        throw VaultError(ErrorCode::InvalidAddress, "token has no event log");
    }
}

Amount FundraisingToken::BalanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? Amount(0) : it->second;
}

void FundraisingToken::SetTaxRouter(const TaxRouter& router) {
    if (router_ != nullptr) {
        throw VaultError(ErrorCode::AlreadySet, "tax router already attached to " +
                         self_.ToShortString());
    }
    router_ = &router;
}

void FundraisingToken::Debit(const Address& holder, const Amount& amount) {
    auto it = balances_.find(holder);
    Amount balance = it == balances_.end() ? Amount(0) : it->second;
    if (balance < amount) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         holder.ToShortString() + " holds " + AmountToString(balance) +
                         ", needs " + AmountToString(amount));
    }
    if (amount == 0) {
        return;
    }
    if (balance == amount) {
        balances_.erase(it);
    } else {
        it->second = balance - amount;
    }
}

void FundraisingToken::Credit(const Address& holder, const Amount& amount) {
    if (amount != 0) {
        balances_[holder] += amount;
    }
}

void FundraisingToken::Mint(const Address& to, const Amount& amount, Timestamp time) {
    if (to.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "mint to null address");
    }
    Credit(to, amount);
    totalSupply_ += amount;
    events_->Emit(Event{EventType::Transfer, Address(), to, amount, 0, time});
}

void FundraisingToken::Burn(const Address& from, const Amount& amount, Timestamp time) {
    Debit(from, amount);
    totalSupply_ -= amount;
    events_->Emit(Event{EventType::Transfer, from, Address(), amount, 0, time});
}

TaxBreakdown FundraisingToken::Transfer(const Address& from, const Address& to,
                                        const Amount& amount, Timestamp time) {
    if (from.IsNull() || to.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "transfer from or to null address");
    }
    
    TaxBreakdown breakdown;
    breakdown.net = amount;
    if (router_ != nullptr) {
        const SystemAddresses& system = router_->System();
        TaxRouter::LedgerView view{BalanceOf(system.treasury),
                                   BalanceOf(system.liquidityManager),
                                   totalSupply_};
        breakdown = router_->Route(from, to, amount, view);
    }
    
    Debit(from, amount);
    Credit(to, breakdown.net);
    events_->Emit(Event{EventType::Transfer, from, to, breakdown.net, 0, time});
    
    if (breakdown.Tax() != 0) {
        Credit(router_->System().liquidityManager, breakdown.toLiquidity);
        Credit(router_->System().treasury, breakdown.toTreasury);
        events_->Emit(Event{EventType::TaxRouted, from, to, breakdown.toLiquidity,
                            breakdown.toTreasury, time});
        LOG_DEBUG(util::LogCategory::TOKEN) << "taxed " << AmountToString(breakdown.Tax())
            << " of " << AmountToString(amount) << " from " << from.ToShortString();
    }
    return breakdown;
}

void FundraisingToken::SaveState(DataStream& s) const {
    s << totalSupply_ << balances_;
}

void FundraisingToken::LoadState(DataStream& s) {
    Amount supply;
    std::map<Address, Amount> balances;
    s >> supply >> balances;
    totalSupply_ = supply;
    balances_ = std::move(balances);
}

} // namespace vault
} // namespace endow
