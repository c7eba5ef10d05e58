// ENDOW - Call Context
// Copyright (c) 2026 ENDOW Developers
// MIT License

#ifndef ENDOW_VAULT_CONTEXT_H
#define ENDOW_VAULT_CONTEXT_H

#include "endow/core/types.h"

#include <vector>

namespace endow {
namespace vault {

/// Who is calling and when. Every entry point receives one; access checks
/// compare `caller` against the expected identity.
struct CallContext {
    Address caller;
    BlockNumber blockNumber{0};
    Timestamp timestamp{0};
    
    /// Same block and time, different caller (a component calling onward)
    CallContext As(const Address& newCaller) const {
        return CallContext{newCaller, blockNumber, timestamp};
    }
};

/// Result of a scheduler poll
struct UpkeepResult {
    bool needed{false};
    std::vector<Byte> performData;
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_CONTEXT_H
