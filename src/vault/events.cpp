// ENDOW - Vault Events
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/events.h"
#include "endow/util/logging.h"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace endow {
namespace vault {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::Transfer:            return "Transfer";
        case EventType::TaxRouted:           return "TaxRouted";
        case EventType::TransferAndBurn:     return "TransferAndBurn";
        case EventType::LiquidityAdded:      return "LiquidityAdded";
        case EventType::DonationForwarded:   return "DonationForwarded";
        case EventType::PauseChanged:        return "PauseChanged";
        case EventType::EmergencyWithdrawal: return "EmergencyWithdrawal";
        case EventType::BuyRecorded:         return "BuyRecorded";
        case EventType::VaultCreated:        return "VaultCreated";
    }
    return "Unknown";
}

std::string Event::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type) << "(" << subject.ToShortString();
    if (!counterparty.IsNull()) {
        oss << " -> " << counterparty.ToShortString();
    }
    oss << ", " << AmountToString(amount);
    if (secondary != 0) {
        oss << "/" << AmountToString(secondary);
    }
    oss << ", t=" << time << ")";
    return oss.str();
}

void EventLog::Emit(const Event& event) {
    LOG_TRACE(util::LogCategory::DEFAULT) << "event " << event.ToString();
    events_.push_back(event);
}

std::vector<Event> EventLog::Filter(EventType type) const {
    std::vector<Event> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [type](const Event& e) { return e.type == type; });
    return result;
}

size_t EventLog::Count(EventType type) const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                             [type](const Event& e) { return e.type == type; }));
}

void EventLog::SaveState(DataStream& s) const {
    WriteCompactSize(s, events_.size());
    for (const auto& e : events_) {
        s << static_cast<uint8_t>(e.type) << e.subject << e.counterparty
          << e.amount << e.secondary << e.time;
    }
}

void EventLog::LoadState(DataStream& s) {
    uint64_t count = ReadCompactSize(s);
    std::vector<Event> events;
    events.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        Event e;
        uint8_t type = 0;
        s >> type >> e.subject >> e.counterparty >> e.amount >> e.secondary >> e.time;
        e.type = static_cast<EventType>(type);
        events.push_back(e);
    }
    events_ = std::move(events);
}

} // namespace vault
} // namespace endow
