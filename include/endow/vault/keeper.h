// ENDOW - Keeper
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// The scheduler side of the upkeep protocol: poll every vault component
// with CheckUpkeep and call PerformUpkeep where work is needed. A failed
// upkeep reverts on its own and is retried on the next cycle.

#ifndef ENDOW_VAULT_KEEPER_H
#define ENDOW_VAULT_KEEPER_H

#include "endow/core/types.h"
#include "endow/vault/registry.h"

#include <cstddef>
#include <string>

namespace endow {
namespace vault {

struct KeeperStats {
    size_t checked{0};      ///< components polled
    size_t performed{0};    ///< upkeeps executed successfully
    size_t failed{0};       ///< upkeeps that reverted
    
    std::string ToString() const;
};

class Keeper {
public:
    Keeper(VaultRegistry& registry, const Address& scheduler);
    
    /// One poll over every vault at the given block and time
    KeeperStats RunCycle(BlockNumber block, Timestamp now);
    
    /// Totals over all cycles so far
    const KeeperStats& Totals() const { return totals_; }
    uint64_t Cycles() const { return cycles_; }

private:
    void ServiceTreasury(VaultHandle& vault, const CallContext& ctx, KeeperStats& stats);
    void ServiceDonation(VaultHandle& vault, const CallContext& ctx, KeeperStats& stats);
    
    VaultRegistry& registry_;
    Address scheduler_;
    KeeperStats totals_;
    uint64_t cycles_{0};
};

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_KEEPER_H
