// ENDOW - Donation Forwarder
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/donation.h"
#include "endow/vault/errors.h"
#include "endow/vault/threshold_math.h"
#include "endow/vault/token.h"
#include "endow/util/logging.h"

namespace endow {
namespace vault {

DonationForwarder::DonationForwarder(const Address& self, const Address& payout,
                                     const Amount& slippageFraction)
    : self_(self), payout_(payout), slippageFraction_(slippageFraction) {
    if (self_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "donation forwarder address is null");
    }
    if (payout_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "payout address is null");
    }
    if (slippageFraction_ > FRACTION_ONE) {
        throw VaultError(ErrorCode::InvalidAmount, "donation slippage above 100%");
    }
}

void DonationForwarder::Wire(const VaultLinks& links) {
    if (IsWired()) {
        throw VaultError(ErrorCode::AlreadySet, "donation forwarder already wired");
    }
    links.Validate();
    owner_ = links.owner;
    asset_ = links.asset;
    roles_ = links.roles;
    directory_ = links.directory;
    services_ = links.services;
    token_ = links.tokenLedger;
}

void DonationForwarder::RequireWired() const {
    if (!IsWired()) {
        throw VaultError(ErrorCode::InvalidAddress, "donation forwarder " +
                         self_.ToShortString() + " is not wired");
    }
}

void DonationForwarder::RequireRegistry(const CallContext& ctx) const {
    RequireWired();
    if (ctx.caller != roles_.registry) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " is not the registry");
    }
}

bool DonationForwarder::IsSuspended() const {
    return paused_ || (directory_ != nullptr && directory_->IsGloballyPaused());
}

Amount DonationForwarder::TokenBalance() const {
    RequireWired();
    return token_->BalanceOf(self_);
}

UpkeepResult DonationForwarder::CheckUpkeep(const CallContext& /*ctx*/,
                                            const std::vector<Byte>& /*checkData*/) const {
    UpkeepResult result;
    result.needed = !IsSuspended() && TokenBalance() > 0;
    return result;
}

void DonationForwarder::PayOut(const Address& currency, const Amount& amount) {
    if (!services_.assets->Transfer(currency, self_, payout_, amount)) {
        throw VaultError(ErrorCode::TransferFailed, "payout " + payout_.ToShortString() +
                         " rejected " + AmountToString(amount));
    }
}

Amount DonationForwarder::PerformUpkeep(const CallContext& ctx,
                                        const std::vector<Byte>& /*performData*/) {
    RequireWired();
    if (ctx.caller != roles_.scheduler) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " is not the scheduler");
    }
    if (IsSuspended()) {
        LOG_INFO(util::LogCategory::DONATION) << "Donation forwarder " << self_.ToShortString()
                                              << " is paused, skipping upkeep";
        return 0;
    }
    Amount balance = TokenBalance();
    if (balance == 0) {
        return 0;
    }
    
    ScopedTransaction tx({token_, services_.assets.get(), services_.events.get()});
    
    venue::PoolKey key = directory_->GetPoolKey(owner_);
    const Address& tokenAddr = token_->GetAddress();
    if (!key.Contains(tokenAddr)) {
        throw VaultError(ErrorCode::InvalidAddress, "pool " + key.ToString() +
                         " does not trade the fundraising token");
    }
    bool zeroForOne = key.ZeroForOneWhenSelling(tokenAddr);
    const Address& output = key.OutputCurrency(zeroForOne);
    
    Amount quote = services_.quoter->QuoteExactInputSingle(key, zeroForOne, balance);
    Amount minOut = MinAmountOut(quote, slippageFraction_);
    Amount received = services_.venue->SwapExactInputSingle(ctx.As(self_), key, balance, minOut,
                                                            zeroForOne, self_);
    if (received < minOut || received == 0) {
        throw VaultError(ErrorCode::InsufficientOutput, "swap returned " +
                         AmountToString(received) + ", expected at least " +
                         AmountToString(minOut));
    }
    
    Amount paid;
    if (output.IsNull()) {
        // Native proceeds: forward exactly what the swap delivered
        paid = received;
    } else {
        paid = services_.assets->BalanceOf(output, self_);
    }
    PayOut(output, paid);
    
    if (token_->BalanceOf(self_) != 0) {
        throw VaultError(ErrorCode::TransferFailed, "venue left tokens with the forwarder");
    }
    
    services_.events->Emit(Event{EventType::DonationForwarded, self_, payout_, paid, balance,
                                 ctx.timestamp});
    tx.Commit();
    
    LOG_INFO(util::LogCategory::DONATION) << "Forwarded " << AmountToString(paid)
        << " to " << payout_.ToShortString() << " from " << AmountToString(balance) << " tokens";
    return paid;
}

void DonationForwarder::SetPause(const CallContext& ctx, bool paused) {
    RequireRegistry(ctx);
    if (paused_ == paused) {
        throw VaultError(ErrorCode::AlreadySet, std::string("donation forwarder already ") +
                         (paused ? "paused" : "running"));
    }
    paused_ = paused;
    services_.events->Emit(Event{EventType::PauseChanged, self_, Address(),
                                 paused ? 1 : 0, 0, ctx.timestamp});
    LOG_INFO(util::LogCategory::DONATION) << "Donation forwarder " << self_.ToShortString()
                                          << (paused ? " paused" : " resumed");
}

void DonationForwarder::EmergencyWithdraw(const CallContext& ctx, const Address& to) {
    RequireRegistry(ctx);
    if (!paused_) {
        throw VaultError(ErrorCode::NotPaused, "donation forwarder must be paused for emergency withdrawal");
    }
    if (to.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "withdrawal recipient is null");
    }
    
    ScopedTransaction tx({token_, services_.assets.get(), services_.events.get()});
    Amount tokens = token_->BalanceOf(self_);
    if (tokens != 0) {
        token_->Transfer(self_, to, tokens, ctx.timestamp);
    }
    Amount assets = services_.assets->BalanceOf(asset_, self_);
    if (assets != 0 && !services_.assets->Transfer(asset_, self_, to, assets)) {
        throw VaultError(ErrorCode::TransferFailed, "recipient " + to.ToShortString() +
                         " rejected native transfer");
    }
    services_.events->Emit(Event{EventType::EmergencyWithdrawal, self_, to, tokens, assets,
                                 ctx.timestamp});
    tx.Commit();
    
    LOG_WARN(util::LogCategory::DONATION) << "Emergency withdrawal from donation forwarder "
        << self_.ToShortString() << " to " << to.ToShortString();
}

void DonationForwarder::SaveState(DataStream& s) const {
    s << paused_;
}

void DonationForwarder::LoadState(DataStream& s) {
    bool paused;
    s >> paused;
    paused_ = paused;
}

} // namespace vault
} // namespace endow
