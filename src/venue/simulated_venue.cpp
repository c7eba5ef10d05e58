// ENDOW - Simulated Venue
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/venue/simulated_venue.h"
#include "endow/vault/asset_ledger.h"
#include "endow/vault/errors.h"
#include "endow/vault/journal.h"
#include "endow/vault/launch_guard.h"
#include "endow/vault/threshold_math.h"
#include "endow/vault/token.h"
#include "endow/util/logging.h"

namespace endow {
namespace venue {

using vault::ErrorCode;
using vault::VaultError;

SimulatedVenue::SimulatedVenue(const Address& self, std::shared_ptr<vault::IAssetLedger> assets,
                               const Amount& rate)
    : self_(self), assets_(std::move(assets)) {
    if (self_.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "venue address is null");
    }
    if (!assets_) {
        throw VaultError(ErrorCode::InvalidAddress, "venue has no asset ledger");
    }
    SetRate(rate);
}

void SimulatedVenue::ListToken(vault::FundraisingToken& token, vault::LaunchGuard* guard) {
    listings_[token.GetAddress()] = Listing{&token, guard};
    LOG_DEBUG(util::LogCategory::VENUE) << "Listed " << token.GetAddress().ToShortString()
                                        << (guard ? " with launch guard" : "");
}

void SimulatedVenue::SetRate(const Amount& rate) {
    if (rate == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "venue rate must be positive");
    }
    rate_ = rate;
}

Amount SimulatedVenue::TokenReserve(const Address& token) const {
    auto it = listings_.find(token);
    return it == listings_.end() ? Amount(0) : it->second.token->BalanceOf(self_);
}

Amount SimulatedVenue::AssetReserve(const Address& currency) const {
    return assets_->BalanceOf(currency, self_);
}

const SimulatedVenue::Listing& SimulatedVenue::ListingFor(const PoolKey& key) const {
    auto it = listings_.find(key.currency0);
    if (it == listings_.end()) {
        it = listings_.find(key.currency1);
    }
    if (it == listings_.end()) {
        throw VaultError(ErrorCode::InvalidAddress, "no listed token in " + key.ToString());
    }
    return it->second;
}

Amount SimulatedVenue::TokenToAsset(const Amount& tokens) const {
    return vault::MulFraction(tokens, rate_);
}

Amount SimulatedVenue::AssetToToken(const Amount& assets) const {
    return assets * vault::FRACTION_ONE / rate_;
}

void SimulatedVenue::MoveAsset(const Address& currency, const Address& from, const Address& to,
                               const Amount& amount) {
    if (!assets_->Transfer(currency, from, to, amount)) {
        throw VaultError(ErrorCode::TransferFailed, to.ToShortString() + " rejected native transfer");
    }
}

Amount SimulatedVenue::QuoteExactInputSingle(const PoolKey& key, bool zeroForOne,
                                             const Amount& amountIn) const {
    const Listing& listing = ListingFor(key);
    bool sellingToken = key.OutputCurrency(zeroForOne) != listing.token->GetAddress();
    return sellingToken ? TokenToAsset(amountIn) : AssetToToken(amountIn);
}

Amount SimulatedVenue::SwapExactInputSingle(const CallContext& ctx, const PoolKey& key,
                                            const Amount& amountIn, const Amount& minAmountOut,
                                            bool zeroForOne, const Address& recipient) {
    if (amountIn == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "swap input is zero");
    }
    if (recipient.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "swap recipient is null");
    }
    const Listing& listing = ListingFor(key);
    const Address& tokenAddr = listing.token->GetAddress();
    const Address& asset = key.Other(tokenAddr);
    bool buyingToken = key.OutputCurrency(zeroForOne) == tokenAddr;
    
    // A swap settles completely or not at all
    vault::ScopedTransaction tx({listing.token, assets_.get(), listing.guard});
    Amount amountOut;
    if (buyingToken) {
        amountOut = AssetToToken(amountIn);
        if (listing.guard != nullptr) {
            listing.guard->BeforeSwap(ctx.As(self_), ctx.caller, key, zeroForOne, amountOut);
        }
        if (amountOut < minAmountOut) {
            throw VaultError(ErrorCode::InsufficientOutput, "buy would return " +
                             AmountToString(amountOut));
        }
        MoveAsset(asset, ctx.caller, self_, amountIn);
        listing.token->Transfer(self_, recipient, amountOut, ctx.timestamp);
    } else {
        if (listing.guard != nullptr) {
            listing.guard->BeforeSwap(ctx.As(self_), ctx.caller, key, zeroForOne, 0);
        }
        vault::TaxBreakdown received = listing.token->Transfer(ctx.caller, self_, amountIn,
                                                               ctx.timestamp);
        amountOut = TokenToAsset(received.net);
        if (amountOut < minAmountOut) {
            throw VaultError(ErrorCode::InsufficientOutput, "sell would return " +
                             AmountToString(amountOut));
        }
        MoveAsset(asset, self_, recipient, amountOut);
    }
    tx.Commit();
    
    LOG_DEBUG(util::LogCategory::VENUE) << (buyingToken ? "Buy " : "Sell ") << "by "
        << ctx.caller.ToShortString() << ": " << AmountToString(amountIn) << " -> "
        << AmountToString(amountOut);
    return amountOut;
}

LiquidityDelta SimulatedVenue::AddLiquidity(const CallContext& ctx, const PoolKey& key,
                                            const Amount& amount0, const Amount& amount1,
                                            int32_t tickLower, int32_t tickUpper,
                                            const Address& recipient) {
    if (key.tickSpacing <= 0 || tickLower >= tickUpper ||
        tickLower < vault::MIN_TICK || tickUpper > vault::MAX_TICK ||
        tickLower % key.tickSpacing != 0 || tickUpper % key.tickSpacing != 0) {
        throw VaultError(ErrorCode::InvalidAmount, "bad tick range [" + std::to_string(tickLower) +
                         ", " + std::to_string(tickUpper) + "]");
    }
    if (recipient.IsNull()) {
        throw VaultError(ErrorCode::InvalidAddress, "position recipient is null");
    }
    
    const Listing& listing = ListingFor(key);
    const Address& tokenAddr = listing.token->GetAddress();
    bool tokenIsZero = key.currency0 == tokenAddr;
    Amount tokens = tokenIsZero ? amount0 : amount1;
    Amount assets = tokenIsZero ? amount1 : amount0;
    
    // Accept both sides in the ratio of the current rate
    Amount useTokens = tokens;
    Amount useAssets = TokenToAsset(tokens);
    if (useAssets > assets) {
        useAssets = assets;
        useTokens = AssetToToken(assets);
    }
    if (useTokens == 0 || useAssets == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "liquidity amounts round to zero");
    }
    
    vault::ScopedTransaction tx({listing.token, assets_.get()});
    listing.token->Transfer(ctx.caller, self_, useTokens, ctx.timestamp);
    MoveAsset(key.Other(tokenAddr), ctx.caller, self_, useAssets);
    tx.Commit();
    
    LOG_DEBUG(util::LogCategory::VENUE) << "Liquidity from " << ctx.caller.ToShortString()
        << ": " << AmountToString(useTokens) << " tokens, " << AmountToString(useAssets) << " asset";
    
    LiquidityDelta delta;
    delta.used0 = tokenIsZero ? useTokens : useAssets;
    delta.used1 = tokenIsZero ? useAssets : useTokens;
    return delta;
}

void SimulatedVenue::Donate(const CallContext& ctx, const PoolKey& key,
                            const Amount& amount0, const Amount& amount1) {
    const Listing& listing = ListingFor(key);
    const Address& tokenAddr = listing.token->GetAddress();
    bool tokenIsZero = key.currency0 == tokenAddr;
    Amount tokens = tokenIsZero ? amount0 : amount1;
    Amount assets = tokenIsZero ? amount1 : amount0;
    
    vault::ScopedTransaction tx({listing.token, assets_.get()});
    if (tokens != 0) {
        listing.token->Transfer(ctx.caller, self_, tokens, ctx.timestamp);
    }
    if (assets != 0) {
        MoveAsset(key.Other(tokenAddr), ctx.caller, self_, assets);
    }
    tx.Commit();
}

} // namespace venue
} // namespace endow
