// ENDOW - Launch Guard
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/launch_guard.h"
#include "endow/vault/errors.h"
#include "endow/vault/threshold_math.h"
#include "endow/vault/token.h"
#include "endow/util/logging.h"

namespace endow {
namespace vault {

LaunchGuard::LaunchGuard(const Address& self, const LaunchGuardParams& params,
                         BlockNumber launchBlock, Timestamp launchTimestamp)
    : self_(self), params_(params)
    , launchBlock_(launchBlock), launchTimestamp_(launchTimestamp) {
    if (self_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "launch guard address is null");
    }
    params_.Validate();
}

void LaunchGuard::Wire(const VaultLinks& links) {
    if (IsWired()) {
        throw VaultError(ErrorCode::AlreadySet, "launch guard already wired");
    }
    links.Validate();
    token_address_ = links.token;
    venue_ = links.services.venue->GetAddress();
    events_ = links.services.events;
    token_ = links.tokenLedger;
}

bool LaunchGuard::IsBuy(const venue::PoolKey& key, bool zeroForOne) const {
    return key.OutputCurrency(zeroForOne) == token_address_;
}

std::optional<Timestamp> LaunchGuard::LastBuyTimestamp(const Address& buyer) const {
    auto it = lastBuy_.find(buyer);
    if (it == lastBuy_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LaunchGuard::Block(const Address& trader, const std::string& reason) const {
    LOG_WARN(util::LogCategory::GUARD) << "Blocked buy by " << trader.ToShortString()
                                       << ": " << reason;
    throw VaultError(ErrorCode::TradeBlocked, reason);
}

void LaunchGuard::BeforeSwap(const CallContext& ctx, const Address& trader,
                             const venue::PoolKey& key, bool zeroForOne,
                             const Amount& tokenAmount) {
    if (!IsWired()) {
        throw VaultError(ErrorCode::InvalidAddress, "launch guard is not wired");
    }
    if (ctx.caller != venue_) {
        throw VaultError(ErrorCode::Unauthorized, "only the trading venue may call the launch guard");
    }
    if (!key.Contains(token_address_) || !IsBuy(key, zeroForOne)) {
        return;
    }
    
    if (IsHolding(ctx.blockNumber)) {
        Block(trader, "trading opens at block " + std::to_string(launchBlock_ + params_.blocksToHold));
    }
    if (!IsRestricted(ctx.timestamp)) {
        return;
    }
    
    Amount maxBuy = MulFraction(token_->TotalSupply(), params_.maxBuyFraction);
    if (tokenAmount > maxBuy) {
        Block(trader, "buy of " + AmountToString(tokenAmount) + " exceeds limit " +
              AmountToString(maxBuy));
    }
    
    auto last = LastBuyTimestamp(trader);
    if (last && ctx.timestamp < *last + params_.cooldownDuration) {
        Block(trader, "cooldown active until " + std::to_string(*last + params_.cooldownDuration));
    }
    
    lastBuy_[trader] = ctx.timestamp;
    events_->Emit(Event{EventType::BuyRecorded, trader, Address(), tokenAmount, 0, ctx.timestamp});
    LOG_DEBUG(util::LogCategory::GUARD) << "Recorded buy of " << AmountToString(tokenAmount)
                                        << " by " << trader.ToShortString();
}

void LaunchGuard::SaveState(DataStream& s) const {
    s << launchBlock_ << launchTimestamp_ << lastBuy_;
}

void LaunchGuard::LoadState(DataStream& s) {
    BlockNumber block;
    Timestamp time;
    std::map<Address, Timestamp> lastBuy;
    s >> block >> time >> lastBuy;
    // A reloaded guard keeps the launch it was first created with
    launchBlock_ = block;
    launchTimestamp_ = time;
    lastBuy_ = std::move(lastBuy);
}

} // namespace vault
} // namespace endow
