// ENDOW - Vault Parameters Header
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Tunables for the tax policy, treasury upkeep, donation forwarding and
// launch protection. All fractions are parts-per-1e18.

#ifndef ENDOW_VAULT_PARAMS_H
#define ENDOW_VAULT_PARAMS_H

#include "endow/core/types.h"
#include "endow/util/config.h"

#include <cstdint>
#include <string>

namespace endow {
namespace vault {

// ============================================================================
// Tax Policy
// ============================================================================

/// Immutable per vault once created
struct TaxPolicy {
    /// Share of each taxable transfer withheld as tax (2%)
    Amount taxFeeFraction;
    
    /// Treasury share of supply at which taxation stops (30%)
    Amount maximumTreasuryFraction;
    
    /// Smallest top-up, as a share of supply, when liquidity is low (1%)
    Amount minimumLiquidityTopUpFraction;
    
    /// Share of each taxable transfer routed to liquidity when it needs support (1%)
    Amount configurableLPFraction;
    
    /// Throws VaultError(InvalidAmount) unless configurableLPFraction <= taxFeeFraction
    /// and every fraction is at most 100%
    void Validate() const;
};

// ============================================================================
// Treasury Parameters
// ============================================================================

struct TreasuryParams {
    /// Minimum seconds between two transfer-and-burn cycles
    int64_t transferInterval{0};
    
    /// Treasury share of supply required before a transfer-and-burn
    Amount minimumHealthThreshold;
    
    /// Pool share of supply below which liquidity is topped up
    Amount minLPHealthThreshold;
    
    /// Pool share of supply a top-up aims for
    Amount targetLPFraction;
    
    /// Tolerated shortfall against the quote when swapping
    Amount slippageFraction;
    
    void Validate() const;
};

// ============================================================================
// Launch Guard Parameters
// ============================================================================

struct LaunchGuardParams {
    /// Largest single buy, as a share of supply, while restricted
    Amount maxBuyFraction;
    
    /// Seconds a buyer must wait between buys while restricted
    int64_t cooldownDuration{0};
    
    /// Blocks after launch during which every buy is rejected
    uint64_t blocksToHold{0};
    
    /// Seconds after launch during which size and cooldown limits apply
    int64_t timeToHold{0};
    
    void Validate() const;
};

// ============================================================================
// Engine Parameters
// ============================================================================

struct EngineParams {
    TaxPolicy tax;
    TreasuryParams treasury;
    LaunchGuardParams guard;
    
    /// Slippage tolerated by the donation forwarder's swap
    Amount donationSlippageFraction;
    
    void Validate() const;
    
    /// Production defaults
    static EngineParams Default();
    
    /// Short intervals for local testing
    static EngineParams RegTest();
};

/**
 * Overlay values present in a config section onto params.
 * Missing keys keep their current value. Returns an error naming the first
 * malformed key; params is left untouched in that case.
 */
util::ConfigParseResult ApplyConfig(const util::ConfigManager& config,
                                    const std::string& section,
                                    EngineParams& params);

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_PARAMS_H
