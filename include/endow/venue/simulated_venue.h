// ENDOW - Simulated Venue
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Fixed-rate stand-in for the external AMM. Reserves are ordinary ledger
// balances of the venue address, swaps settle at a configured rate and
// liquidity is accepted in that same ratio. Used by the daemon when no
// external venue is attached.

#ifndef ENDOW_VENUE_SIMULATED_VENUE_H
#define ENDOW_VENUE_SIMULATED_VENUE_H

#include "endow/core/types.h"
#include "endow/venue/venue.h"

#include <map>
#include <memory>

namespace endow {

namespace vault {
class FundraisingToken;
class IAssetLedger;
class LaunchGuard;
}

namespace venue {

class SimulatedVenue : public ITradingVenue, public IQuoter {
public:
    /**
     * @param self    venue address; also the liquidity manager
     * @param assets  ledger for every non-token currency
     * @param rate    asset units paid per token unit, parts-per-1e18
     */
    SimulatedVenue(const Address& self, std::shared_ptr<vault::IAssetLedger> assets,
                   const Amount& rate);
    
    /// Make pools containing token tradeable. The guard, if any, vets buys.
    void ListToken(vault::FundraisingToken& token, vault::LaunchGuard* guard);
    bool IsListed(const Address& token) const { return listings_.count(token) != 0; }
    
    void SetRate(const Amount& rate);
    const Amount& Rate() const { return rate_; }
    
    /// Token reserve held for a listed token
    Amount TokenReserve(const Address& token) const;
    
    /// Asset reserve held in currency
    Amount AssetReserve(const Address& currency) const;
    
    // ITradingVenue
    const Address& GetAddress() const override { return self_; }
    
    Amount SwapExactInputSingle(const CallContext& ctx, const PoolKey& key,
                                const Amount& amountIn, const Amount& minAmountOut,
                                bool zeroForOne, const Address& recipient) override;
    
    LiquidityDelta AddLiquidity(const CallContext& ctx, const PoolKey& key,
                                const Amount& amount0, const Amount& amount1,
                                int32_t tickLower, int32_t tickUpper,
                                const Address& recipient) override;
    
    void Donate(const CallContext& ctx, const PoolKey& key,
                const Amount& amount0, const Amount& amount1) override;
    
    // IQuoter
    Amount QuoteExactInputSingle(const PoolKey& key, bool zeroForOne,
                                 const Amount& amountIn) const override;

private:
    struct Listing {
        vault::FundraisingToken* token{nullptr};
        vault::LaunchGuard* guard{nullptr};
    };
    
    /// Listing of the pool's fundraising token; throws if none is listed
    const Listing& ListingFor(const PoolKey& key) const;
    
    Amount TokenToAsset(const Amount& tokens) const;
    Amount AssetToToken(const Amount& assets) const;
    
    /// Move `amount` of a non-token currency, failing on native rejection
    void MoveAsset(const Address& currency, const Address& from, const Address& to,
                   const Amount& amount);
    
    Address self_;
    std::shared_ptr<vault::IAssetLedger> assets_;
    Amount rate_;
    std::map<Address, Listing> listings_;
};

} // namespace venue
} // namespace endow

#endif // ENDOW_VENUE_SIMULATED_VENUE_H
