// ENDOW - Treasury Controller
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/treasury.h"
#include "endow/vault/errors.h"
#include "endow/vault/threshold_math.h"
#include "endow/vault/token.h"
#include "endow/util/logging.h"

#include <algorithm>
#include <ios>

namespace endow {
namespace vault {

// ============================================================================
// TreasuryDecision
// ============================================================================

std::vector<Byte> TreasuryDecision::Encode() const {
    DataStream s;
    s << initiateTransfer << initiateLiquidityTopUp;
    return s.ToBytes();
}

TreasuryDecision TreasuryDecision::Decode(const std::vector<Byte>& data) {
    TreasuryDecision decision;
    if (data.empty()) {
        return decision;
    }
    DataStream s(data);
    try {
        s >> decision.initiateTransfer >> decision.initiateLiquidityTopUp;
    } catch (const std::ios_base::failure&) {
        throw VaultError(ErrorCode::InvalidAmount, "truncated treasury decision");
    }
    if (!s.empty()) {
        throw VaultError(ErrorCode::InvalidAmount, "trailing data after treasury decision");
    }
    return decision;
}

// ============================================================================
// TreasuryController
// ============================================================================

TreasuryController::TreasuryController(const Address& self, const TreasuryParams& params,
                                       const TaxPolicy& policy, Timestamp startTime)
    : self_(self), params_(params), policy_(policy), lastTransferTimestamp_(startTime) {
    if (self_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "treasury address is null");
    }
    params_.Validate();
    policy_.Validate();
}

void TreasuryController::Wire(const VaultLinks& links) {
    if (IsWired()) {
        throw VaultError(ErrorCode::AlreadySet, "treasury already wired");
    }
    links.Validate();
    owner_ = links.owner;
    asset_ = links.asset;
    donation_ = links.donation;
    liquidityManager_ = links.liquidityManager;
    roles_ = links.roles;
    directory_ = links.directory;
    services_ = links.services;
    token_ = links.tokenLedger;
}

void TreasuryController::RequireWired() const {
    if (!IsWired()) {
        throw VaultError(ErrorCode::InvalidAddress, "treasury " + self_.ToShortString() +
                         " is not wired");
    }
}

void TreasuryController::RequireRegistry(const CallContext& ctx) const {
    RequireWired();
    if (ctx.caller != roles_.registry) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " is not the registry");
    }
}

bool TreasuryController::IsTaxSuspended() const {
    return paused_ || (directory_ != nullptr && directory_->IsGloballyPaused());
}

Amount TreasuryController::TreasuryFraction() const {
    RequireWired();
    return FractionOf(token_->BalanceOf(self_), token_->TotalSupply());
}

Amount TreasuryController::LiquidityHealth() const {
    RequireWired();
    return FractionOf(token_->BalanceOf(liquidityManager_), token_->TotalSupply());
}

Amount TreasuryController::NextBurnAmount() const {
    RequireWired();
    return MulFraction(token_->TotalSupply(), TRANSFER_BURN_FRACTION);
}

Amount TreasuryController::LiquidityDeficit() const {
    RequireWired();
    Amount supply = token_->TotalSupply();
    Amount target = MulFraction(supply, params_.targetLPFraction);
    Amount pool = token_->BalanceOf(liquidityManager_);
    Amount gap = target > pool ? Amount(target - pool) : Amount(0);
    Amount deficit = std::max(gap, MulFraction(supply, policy_.minimumLiquidityTopUpFraction));
    return std::min(deficit, token_->BalanceOf(self_));
}

bool TreasuryController::IsTransferDue(Timestamp now) const {
    // The transfer leg and its burn take three burn amounts from the treasury
    return now >= lastTransferTimestamp_ + params_.transferInterval &&
           TreasuryFraction() >= params_.minimumHealthThreshold &&
           token_->BalanceOf(self_) >= NextBurnAmount() * 3;
}

bool TreasuryController::IsLiquidityLow() const {
    return LiquidityHealth() < params_.minLPHealthThreshold;
}

TreasuryDecision TreasuryController::Evaluate(Timestamp now) const {
    RequireWired();
    TreasuryDecision decision;
    decision.initiateTransfer = IsTransferDue(now);
    decision.initiateLiquidityTopUp = IsLiquidityLow();
    return decision;
}

UpkeepResult TreasuryController::CheckUpkeep(const CallContext& ctx,
                                             const std::vector<Byte>& /*checkData*/) const {
    UpkeepResult result;
    TreasuryDecision decision = Evaluate(ctx.timestamp);
    result.needed = !IsTaxSuspended() && decision.Any();
    result.performData = decision.Encode();
    return result;
}

void TreasuryController::PerformUpkeep(const CallContext& ctx, const std::vector<Byte>& performData) {
    RequireWired();
    if (ctx.caller != roles_.scheduler) {
        throw VaultError(ErrorCode::Unauthorized, "caller " + ctx.caller.ToShortString() +
                         " is not the scheduler");
    }
    TreasuryDecision requested = TreasuryDecision::Decode(performData);
    if (!requested.Any()) {
        return;
    }
    if (IsTaxSuspended()) {
        LOG_INFO(util::LogCategory::TREASURY) << "Treasury " << self_.ToShortString()
                                              << " is paused, skipping upkeep";
        return;
    }
    
    bool doTransfer = requested.initiateTransfer && IsTransferDue(ctx.timestamp);
    bool doTopUp = requested.initiateLiquidityTopUp && IsLiquidityLow();
    if (!doTransfer && !doTopUp) {
        LOG_DEBUG(util::LogCategory::TREASURY) << "Stale upkeep decision for "
                                               << self_.ToShortString() << ", nothing to do";
        return;
    }
    
    ScopedTransaction tx({token_, services_.assets.get(), this, services_.events.get()});
    if (doTransfer) {
        TransferAndBurn(ctx);
    }
    if (doTopUp) {
        TopUpLiquidity(ctx);
    }
    tx.Commit();
}

void TreasuryController::TransferAndBurn(const CallContext& ctx) {
    Amount burnAmount = NextBurnAmount();
    if (burnAmount == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "burn amount is zero");
    }
    
    token_->Transfer(self_, donation_, burnAmount, ctx.timestamp);
    token_->Burn(self_, burnAmount * 2, ctx.timestamp);
    lastTransferTimestamp_ = ctx.timestamp;
    
    services_.events->Emit(Event{EventType::TransferAndBurn, self_, donation_, burnAmount,
                                 burnAmount * 2, ctx.timestamp});
    LOG_INFO(util::LogCategory::TREASURY) << "Treasury " << self_.ToShortString() << " forwarded "
        << AmountToString(burnAmount) << " and burned " << AmountToString(burnAmount * 2);
}

std::pair<Amount, Amount> TreasuryController::ToPoolOrder(const venue::PoolKey& key,
                                                          const Amount& tokenAmount,
                                                          const Amount& assetAmount) const {
    if (key.currency0 == token_->GetAddress()) {
        return {tokenAmount, assetAmount};
    }
    return {assetAmount, tokenAmount};
}

void TreasuryController::TopUpLiquidity(const CallContext& ctx) {
    util::ScopedLogTimer timer(util::LogCategory::TREASURY, "liquidity top-up");
    
    Amount deficit = LiquidityDeficit();
    if (deficit == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "liquidity deficit is zero");
    }
    
    venue::PoolKey key = directory_->GetPoolKey(owner_);
    const Address& tokenAddr = token_->GetAddress();
    if (!key.Contains(tokenAddr)) {
        throw VaultError(ErrorCode::InvalidAddress, "pool " + key.ToString() +
                         " does not trade the fundraising token");
    }
    bool zeroForOne = key.ZeroForOneWhenSelling(tokenAddr);
    
    Amount swapIn = deficit / 2;
    Amount keep = deficit - swapIn;
    if (swapIn == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "top-up too small to swap");
    }
    
    Amount quote = services_.quoter->QuoteExactInputSingle(key, zeroForOne, swapIn);
    Amount minOut = MinAmountOut(quote, params_.slippageFraction);
    CallContext self = ctx.As(self_);
    Amount assetOut = services_.venue->SwapExactInputSingle(self, key, swapIn, minOut,
                                                            zeroForOne, self_);
    if (assetOut < minOut || assetOut == 0) {
        throw VaultError(ErrorCode::InsufficientOutput, "swap returned " + AmountToString(assetOut) +
                         ", expected at least " + AmountToString(minOut));
    }
    
    auto amounts = ToPoolOrder(key, keep, assetOut);
    venue::LiquidityDelta used = services_.venue->AddLiquidity(
        self, key, amounts.first, amounts.second,
        MinUsableTick(key.tickSpacing), MaxUsableTick(key.tickSpacing), self_);
    if (used.used0 > amounts.first || used.used1 > amounts.second) {
        throw VaultError(ErrorCode::InvalidAmount, "venue took more than offered");
    }
    
    Amount dust0 = amounts.first - used.used0;
    Amount dust1 = amounts.second - used.used1;
    if (dust0 != 0 || dust1 != 0) {
        services_.venue->Donate(self, key, dust0, dust1);
        LOG_DEBUG(util::LogCategory::TREASURY) << "Donated dust " << AmountToString(dust0)
                                               << "/" << AmountToString(dust1);
    }
    
    bool tokenIsZero = key.currency0 == tokenAddr;
    Amount tokenUsed = tokenIsZero ? used.used0 : used.used1;
    Amount assetUsed = tokenIsZero ? used.used1 : used.used0;
    services_.events->Emit(Event{EventType::LiquidityAdded, self_, liquidityManager_,
                                 tokenUsed, assetUsed, ctx.timestamp});
    LOG_INFO(util::LogCategory::TREASURY) << "Treasury " << self_.ToShortString()
        << " topped up liquidity with " << AmountToString(tokenUsed) << " tokens and "
        << AmountToString(assetUsed) << " asset";
}

// ============================================================================
// Registry Operations
// ============================================================================

void TreasuryController::SetPause(const CallContext& ctx, bool paused) {
    RequireRegistry(ctx);
    if (paused_ == paused) {
        throw VaultError(ErrorCode::AlreadySet, std::string("treasury already ") +
                         (paused ? "paused" : "running"));
    }
    paused_ = paused;
    services_.events->Emit(Event{EventType::PauseChanged, self_, Address(),
                                 paused ? 1 : 0, 0, ctx.timestamp});
    LOG_INFO(util::LogCategory::TREASURY) << "Treasury " << self_.ToShortString()
                                          << (paused ? " paused" : " resumed");
}

void TreasuryController::EmergencyWithdraw(const CallContext& ctx, const Address& to) {
    RequireRegistry(ctx);
    if (!paused_) {
        throw VaultError(ErrorCode::NotPaused, "treasury must be paused for emergency withdrawal");
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
    
    LOG_WARN(util::LogCategory::TREASURY) << "Emergency withdrawal from treasury "
        << self_.ToShortString() << " to " << to.ToShortString();
}

venue::LiquidityDelta TreasuryController::SeedLiquidity(const CallContext& ctx,
                                                        const Amount& tokenAmount,
                                                        const Amount& assetAmount) {
    RequireRegistry(ctx);
    if (tokenAmount == 0 || assetAmount == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "initial liquidity needs both sides");
    }
    
    venue::PoolKey key = directory_->GetPoolKey(owner_);
    auto amounts = ToPoolOrder(key, tokenAmount, assetAmount);
    
    ScopedTransaction tx({token_, services_.assets.get(), services_.events.get()});
    venue::LiquidityDelta used = services_.venue->AddLiquidity(
        ctx.As(self_), key, amounts.first, amounts.second,
        MinUsableTick(key.tickSpacing), MaxUsableTick(key.tickSpacing), self_);
    bool tokenIsZero = key.currency0 == token_->GetAddress();
    services_.events->Emit(Event{EventType::LiquidityAdded, self_, liquidityManager_,
                                 tokenIsZero ? used.used0 : used.used1,
                                 tokenIsZero ? used.used1 : used.used0, ctx.timestamp});
    tx.Commit();
    return used;
}

// ============================================================================
// State
// ============================================================================

void TreasuryController::SaveState(DataStream& s) const {
    s << lastTransferTimestamp_ << paused_;
}

void TreasuryController::LoadState(DataStream& s) {
    Timestamp last;
    bool paused;
    s >> last >> paused;
    lastTransferTimestamp_ = last;
    paused_ = paused;
}

} // namespace vault
} // namespace endow
