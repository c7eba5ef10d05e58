// ENDOW - Vault Events
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Observable record of every state transition. The log is journaled, so a
// reverted call leaves no events behind.

#ifndef ENDOW_VAULT_EVENTS_H
#define ENDOW_VAULT_EVENTS_H

#include "endow/core/types.h"
#include "endow/vault/journal.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace endow {
namespace vault {

enum class EventType : uint8_t {
    Transfer = 0,            ///< subject=from, counterparty=to, amount=net received
    TaxRouted = 1,           ///< subject=from, amount=to liquidity, secondary=to treasury
    TransferAndBurn = 2,     ///< subject=treasury, counterparty=donation, amount=forwarded, secondary=burned
    LiquidityAdded = 3,      ///< subject=treasury, amount=token side, secondary=asset side
    DonationForwarded = 4,   ///< subject=donation, counterparty=payout, amount=paid out, secondary=tokens sold
    PauseChanged = 5,        ///< subject=component (null for global), amount=1 paused / 0 resumed
    EmergencyWithdrawal = 6, ///< subject=component, counterparty=recipient, amount=token, secondary=asset
    BuyRecorded = 7,         ///< subject=buyer, amount=tokens bought
    VaultCreated = 8,        ///< subject=owner, counterparty=token
};

const char* EventTypeToString(EventType type);

struct Event {
    EventType type{EventType::Transfer};
    Address subject;
    Address counterparty;
    Amount amount;
    Amount secondary;
    Timestamp time{0};
    
    std::string ToString() const;
};

class EventLog : public Journaled {
public:
    void Emit(const Event& event);
    
    const std::vector<Event>& Events() const { return events_; }
    size_t Size() const { return events_.size(); }
    
    /// Events of one type, in emission order
    std::vector<Event> Filter(EventType type) const;
    
    size_t Count(EventType type) const;
    
    void Clear() { events_.clear(); }
    
    void SaveState(DataStream& s) const override;
    void LoadState(DataStream& s) override;

private:
    std::vector<Event> events_;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_EVENTS_H
