// ENDOW - Launch Guard
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Anti-bot protection invoked by the trading venue before each swap on the
// fundraising token's pool. Buys are rejected outright for the first
// blocksToHold blocks, then size- and frequency-limited until timeToHold
// seconds after launch. Sells are never checked.

#ifndef ENDOW_VAULT_LAUNCH_GUARD_H
#define ENDOW_VAULT_LAUNCH_GUARD_H

#include "endow/core/types.h"
#include "endow/vault/context.h"
#include "endow/vault/journal.h"
#include "endow/vault/params.h"
#include "endow/vault/vault.h"

#include <map>
#include <optional>

namespace endow {
namespace vault {

class LaunchGuard : public Journaled {
public:
    /// Launch block and timestamp are fixed here; only a state reload replaces them
    LaunchGuard(const Address& self, const LaunchGuardParams& params,
                BlockNumber launchBlock, Timestamp launchTimestamp);
    
    /// Attach token, venue and event log. Allowed once (AlreadySet).
    void Wire(const VaultLinks& links);
    bool IsWired() const { return token_ != nullptr; }
    
    /**
     * Check a swap about to execute on the pool.
     *
     * @param ctx          caller must be the trading venue
     * @param trader       account that initiated the swap
     * @param key          pool being traded
     * @param zeroForOne   swap direction
     * @param tokenAmount  fundraising tokens the trader receives (buys only)
     * @throws VaultError(TradeBlocked) when a buy violates the launch rules
     */
    void BeforeSwap(const CallContext& ctx, const Address& trader,
                    const venue::PoolKey& key, bool zeroForOne,
                    const Amount& tokenAmount);
    
    /// True if the swap delivers the fundraising token to the trader
    bool IsBuy(const venue::PoolKey& key, bool zeroForOne) const;
    
    /// Size and cooldown limits still apply at this time
    bool IsRestricted(Timestamp now) const { return now < launchTimestamp_ + params_.timeToHold; }
    
    /// No buys at all at this height
    bool IsHolding(BlockNumber block) const { return block < launchBlock_ + params_.blocksToHold; }
    
    std::optional<Timestamp> LastBuyTimestamp(const Address& buyer) const;
    
    const Address& GetAddress() const { return self_; }
    BlockNumber LaunchBlock() const { return launchBlock_; }
    Timestamp LaunchTimestamp() const { return launchTimestamp_; }
    const LaunchGuardParams& Params() const { return params_; }
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    [[noreturn]] void Block(const Address& trader, const std::string& reason) const;
    
    Address self_;
    LaunchGuardParams params_;
    BlockNumber launchBlock_;
    Timestamp launchTimestamp_;
    
    Address token_address_;
    Address venue_;
    FundraisingToken* token_{nullptr};
    std::shared_ptr<EventLog> events_;
    
    std::map<Address, Timestamp> lastBuy_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_LAUNCH_GUARD_H
