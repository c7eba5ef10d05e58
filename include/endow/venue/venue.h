// ENDOW - Trading Venue Interfaces
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Capability interfaces for the external AMM. Vault components only see
// these abstractions; the daemon injects SimulatedVenue and tests inject
// deterministic fakes.

#ifndef ENDOW_VENUE_VENUE_H
#define ENDOW_VENUE_VENUE_H

#include "endow/core/serialize.h"
#include "endow/core/types.h"
#include "endow/vault/context.h"

#include <cstdint>
#include <string>
#include <utility>

namespace endow {
namespace venue {

using vault::CallContext;

// ============================================================================
// PoolKey
// ============================================================================

/**
 * Identifies a pool: the two currencies in ascending address order (the
 * null address, the native currency, sorts first), fee tier, tick spacing
 * and the hook contract invoked around each swap.
 */
struct PoolKey {
    Address currency0;
    Address currency1;
    uint32_t fee{0};
    int32_t tickSpacing{0};
    Address hooks;
    
    /// Build a key with the currencies sorted
    static PoolKey Make(const Address& a, const Address& b, uint32_t fee,
                        int32_t tickSpacing, const Address& hooks);
    
    bool Contains(const Address& currency) const {
        return currency0 == currency || currency1 == currency;
    }
    
    /// The other side of the pool. Caller must ensure Contains(currency).
    const Address& Other(const Address& currency) const {
        return currency0 == currency ? currency1 : currency0;
    }
    
    /// Swap direction that sells `currency` into the pool
    bool ZeroForOneWhenSelling(const Address& currency) const {
        return currency0 == currency;
    }
    
    /// Currency received by a swap in the given direction
    const Address& OutputCurrency(bool zeroForOne) const {
        return zeroForOne ? currency1 : currency0;
    }
    
    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 && currency1 == other.currency1 &&
               fee == other.fee && tickSpacing == other.tickSpacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
    
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const PoolKey& key) {
    endow::Serialize(s, key.currency0);
    endow::Serialize(s, key.currency1);
    endow::Serialize(s, key.fee);
    endow::Serialize(s, key.tickSpacing);
    endow::Serialize(s, key.hooks);
}

template<typename Stream>
void Unserialize(Stream& s, PoolKey& key) {
    endow::Unserialize(s, key.currency0);
    endow::Unserialize(s, key.currency1);
    endow::Unserialize(s, key.fee);
    endow::Unserialize(s, key.tickSpacing);
    endow::Unserialize(s, key.hooks);
}

// ============================================================================
// ITradingVenue
// ============================================================================

/// Amounts actually taken by a liquidity deposit
struct LiquidityDelta {
    Amount used0;
    Amount used1;
};

class ITradingVenue {
public:
    virtual ~ITradingVenue() = default;
    
    /// Account that holds pool reserves (the liquidity manager)
    virtual const Address& GetAddress() const = 0;
    
    /**
     * Swap exactly amountIn of the input side from ctx.caller.
     * Output is paid to recipient. Fails if output < minAmountOut.
     * @return amount of the output currency delivered
     */
    virtual Amount SwapExactInputSingle(const CallContext& ctx, const PoolKey& key,
                                        const Amount& amountIn, const Amount& minAmountOut,
                                        bool zeroForOne, const Address& recipient) = 0;
    
    /**
     * Deposit up to amount0/amount1 from ctx.caller over [tickLower, tickUpper].
     * The position is credited to recipient.
     */
    virtual LiquidityDelta AddLiquidity(const CallContext& ctx, const PoolKey& key,
                                        const Amount& amount0, const Amount& amount1,
                                        int32_t tickLower, int32_t tickUpper,
                                        const Address& recipient) = 0;
    
    /// Donate amounts from ctx.caller to in-range liquidity providers
    virtual void Donate(const CallContext& ctx, const PoolKey& key,
                        const Amount& amount0, const Amount& amount1) = 0;
};

// ============================================================================
// IQuoter
// ============================================================================

class IQuoter {
public:
    virtual ~IQuoter() = default;
    
    /// Expected output of an exact-input swap, without executing it
    virtual Amount QuoteExactInputSingle(const PoolKey& key, bool zeroForOne,
                                         const Amount& amountIn) const = 0;
};

} // namespace venue
} // namespace endow

#endif // ENDOW_VENUE_VENUE_H
