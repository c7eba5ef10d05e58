// ENDOW - Threshold Math
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Fixed-point helpers shared by the tax router, treasury and launch guard.
// Every ratio is expressed in parts-per-1e18 (FRACTION_ONE = 100%).

#ifndef ENDOW_VAULT_THRESHOLD_MATH_H
#define ENDOW_VAULT_THRESHOLD_MATH_H

#include "endow/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace endow {
namespace vault {

// ============================================================================
// Constants
// ============================================================================

/// 100% in parts-per-1e18
inline const Amount FRACTION_ONE{1000000000000000000ULL};

/// Share of total supply moved by one transfer-and-burn cycle (2%)
inline const Amount TRANSFER_BURN_FRACTION{20000000000000000ULL};

/// Tick range supported by the trading venue
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// ============================================================================
// Fractions
// ============================================================================

/// value * fraction / 1e18, rounded down. The product is exact; throws
/// VaultError(InvalidAmount) only if the result exceeds 256 bits.
Amount MulFraction(const Amount& value, const Amount& fraction);

/// part * 1e18 / whole, rounded down; 0 when whole is 0.
/// Throws VaultError(InvalidAmount) if the result exceeds 256 bits.
Amount FractionOf(const Amount& part, const Amount& whole);

/// Minimum acceptable swap output: quote * (1e18 - slippage) / 1e18.
/// Slippage above 100% is treated as 100%.
Amount MinAmountOut(const Amount& quote, const Amount& slippageFraction);

/// Parse "0.02", "2%" or a raw parts-per-1e18 integer such as "20000000000000000"
std::optional<Amount> ParseFraction(const std::string& str);

/// Decimal rendering, e.g. 2e16 -> "0.02"
std::string FormatFraction(const Amount& fraction);

// ============================================================================
// Tax Split
// ============================================================================

struct TaxSplit {
    Amount tax;
    Amount toLiquidity;
    Amount toTreasury;
};

/**
 * Split the tax on a taxable amount.
 *
 * tax = amount * taxFee / 1e18. When liquidity needs support the LP share
 * is amount * lpFraction / 1e18, clamped to tax so the treasury share can
 * never underflow; otherwise the whole tax goes to the treasury.
 */
TaxSplit SplitTax(const Amount& amount, const Amount& taxFeeFraction,
                  const Amount& lpFraction, bool supportLiquidity);

// ============================================================================
// Ticks
// ============================================================================

/// Lowest tick that is a multiple of tickSpacing (rounds toward zero).
/// Throws VaultError(InvalidAmount) if tickSpacing <= 0.
int32_t MinUsableTick(int32_t tickSpacing);

/// Highest tick that is a multiple of tickSpacing
int32_t MaxUsableTick(int32_t tickSpacing);

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_THRESHOLD_MATH_H
