// ENDOW - Threshold Math
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/threshold_math.h"
#include "endow/vault/errors.h"

#include <algorithm>
#include <limits>

namespace endow {
namespace vault {

namespace {

using WideAmount = boost::multiprecision::uint512_t;

/// Products of two amounts are formed at 512 bits; the quotient must fit back
Amount Narrow(const WideAmount& value, const char* op) {
    if (value > WideAmount(std::numeric_limits<Amount>::max())) {
        throw VaultError(ErrorCode::InvalidAmount, std::string(op) + " overflows 256 bits");
    }
    return value.convert_to<Amount>();
}

Amount Pow10(unsigned exponent) {
    Amount result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

/// "12.345" scaled by 10^scaleDigits; at most scaleDigits fractional digits
std::optional<Amount> ParseScaledDecimal(const std::string& str, unsigned scaleDigits) {
    size_t dot = str.find('.');
    std::string whole = str.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : str.substr(dot + 1);
    
    if ((whole.empty() && frac.empty()) || frac.size() > scaleDigits) {
        return std::nullopt;
    }
    
    Amount result = 0;
    if (!whole.empty()) {
        auto parsed = ParseAmount(whole);
        if (!parsed) return std::nullopt;
        result = *parsed * Pow10(scaleDigits);
    }
    if (!frac.empty()) {
        auto parsed = ParseAmount(frac);
        if (!parsed) return std::nullopt;
        result += *parsed * Pow10(scaleDigits - static_cast<unsigned>(frac.size()));
    }
    return result;
}

} // namespace

// ============================================================================
// Fractions
// ============================================================================

Amount MulFraction(const Amount& value, const Amount& fraction) {
    return Narrow(WideAmount(value) * WideAmount(fraction) / WideAmount(FRACTION_ONE), "MulFraction");
}

Amount FractionOf(const Amount& part, const Amount& whole) {
    if (whole == 0) {
        return 0;
    }
    return Narrow(WideAmount(part) * WideAmount(FRACTION_ONE) / WideAmount(whole), "FractionOf");
}

Amount MinAmountOut(const Amount& quote, const Amount& slippageFraction) {
    Amount slippage = std::min(slippageFraction, FRACTION_ONE);
    return Narrow(WideAmount(quote) * WideAmount(FRACTION_ONE - slippage) /
                  WideAmount(FRACTION_ONE), "MinAmountOut");
}

std::optional<Amount> ParseFraction(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    
    std::optional<Amount> result;
    if (str.back() == '%') {
        result = ParseScaledDecimal(str.substr(0, str.size() - 1), 16);
    } else if (str.find('.') != std::string::npos) {
        result = ParseScaledDecimal(str, 18);
    } else {
        result = ParseAmount(str);
    }
    
    if (!result || *result > FRACTION_ONE) {
        return std::nullopt;
    }
    return result;
}

std::string FormatFraction(const Amount& fraction) {
    std::string whole = AmountToString(fraction / FRACTION_ONE);
    std::string frac = AmountToString(fraction % FRACTION_ONE);
    frac.insert(0, 18 - frac.size(), '0');
    
    size_t last = frac.find_last_not_of('0');
    if (last == std::string::npos) {
        return whole;
    }
    return whole + "." + frac.substr(0, last + 1);
}

// ============================================================================
// Tax Split
// ============================================================================

TaxSplit SplitTax(const Amount& amount, const Amount& taxFeeFraction,
                  const Amount& lpFraction, bool supportLiquidity) {
    TaxSplit split;
    split.tax = MulFraction(amount, taxFeeFraction);
    if (supportLiquidity) {
        split.toLiquidity = std::min(MulFraction(amount, lpFraction), split.tax);
    }
    split.toTreasury = split.tax - split.toLiquidity;
    return split;
}

// ============================================================================
// Ticks
// ============================================================================

int32_t MinUsableTick(int32_t tickSpacing) {
    if (tickSpacing <= 0) {
        throw VaultError(ErrorCode::InvalidAmount, "tick spacing must be positive");
    }
    return (MIN_TICK / tickSpacing) * tickSpacing;
}

int32_t MaxUsableTick(int32_t tickSpacing) {
    if (tickSpacing <= 0) {
        throw VaultError(ErrorCode::InvalidAmount, "tick spacing must be positive");
    }
    return (MAX_TICK / tickSpacing) * tickSpacing;
}

} // namespace vault
} // namespace endow
