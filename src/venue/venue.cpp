// ENDOW - Trading Venue Interfaces
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/venue/venue.h"

#include <sstream>

namespace endow {
namespace venue {

PoolKey PoolKey::Make(const Address& a, const Address& b, uint32_t fee,
                      int32_t tickSpacing, const Address& hooks) {
    PoolKey key;
    key.currency0 = a < b ? a : b;
    key.currency1 = a < b ? b : a;
    key.fee = fee;
    key.tickSpacing = tickSpacing;
    key.hooks = hooks;
    return key;
}

std::string PoolKey::ToString() const {
    std::ostringstream oss;
    oss << "PoolKey(" << currency0.ToShortString() << "/" << currency1.ToShortString()
        << ", fee=" << fee << ", spacing=" << tickSpacing << ")";
    return oss.str();
}

} // namespace venue
} // namespace endow
