// ENDOW - Vault Parameters
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/params.h"
#include "endow/vault/errors.h"
#include "endow/vault/threshold_math.h"

#include <optional>
#include <type_traits>

namespace endow {
namespace vault {

namespace {

Amount Percent(unsigned pct) {
    return FRACTION_ONE * pct / 100;
}

void RequireFraction(const Amount& value, const char* name) {
    if (value > FRACTION_ONE) {
        throw VaultError(ErrorCode::InvalidAmount,
                         std::string(name) + " exceeds 100%: " + FormatFraction(value));
    }
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

void TaxPolicy::Validate() const {
    RequireFraction(taxFeeFraction, "taxFeeFraction");
    RequireFraction(maximumTreasuryFraction, "maximumTreasuryFraction");
    RequireFraction(minimumLiquidityTopUpFraction, "minimumLiquidityTopUpFraction");
    RequireFraction(configurableLPFraction, "configurableLPFraction");
    if (configurableLPFraction > taxFeeFraction) {
        throw VaultError(ErrorCode::InvalidAmount,
                         "LP fraction " + FormatFraction(configurableLPFraction) +
                         " exceeds tax fee " + FormatFraction(taxFeeFraction));
    }
}

void TreasuryParams::Validate() const {
    if (transferInterval < 0) {
        throw VaultError(ErrorCode::InvalidAmount, "negative transfer interval");
    }
    RequireFraction(minimumHealthThreshold, "minimumHealthThreshold");
    RequireFraction(minLPHealthThreshold, "minLPHealthThreshold");
    RequireFraction(targetLPFraction, "targetLPFraction");
    RequireFraction(slippageFraction, "slippageFraction");
}

void LaunchGuardParams::Validate() const {
    if (cooldownDuration < 0 || timeToHold < 0) {
        throw VaultError(ErrorCode::InvalidAmount, "negative launch guard duration");
    }
    RequireFraction(maxBuyFraction, "maxBuyFraction");
}

void EngineParams::Validate() const {
    tax.Validate();
    treasury.Validate();
    guard.Validate();
    RequireFraction(donationSlippageFraction, "donationSlippageFraction");
}

// ============================================================================
// Presets
// ============================================================================

EngineParams EngineParams::Default() {
    EngineParams p;
    
    p.tax.taxFeeFraction = Percent(2);
    p.tax.maximumTreasuryFraction = Percent(30);
    p.tax.minimumLiquidityTopUpFraction = Percent(1);
    p.tax.configurableLPFraction = Percent(1);
    
    p.treasury.transferInterval = 24 * 60 * 60;
    p.treasury.minimumHealthThreshold = Percent(10);
    p.treasury.minLPHealthThreshold = Percent(5);
    p.treasury.targetLPFraction = Percent(10);
    p.treasury.slippageFraction = Percent(5);
    
    p.guard.maxBuyFraction = Percent(1);
    p.guard.cooldownDuration = 60;
    p.guard.blocksToHold = 10;
    p.guard.timeToHold = 60 * 60;
    
    p.donationSlippageFraction = Percent(5);
    return p;
}

EngineParams EngineParams::RegTest() {
    EngineParams p = Default();
    p.treasury.transferInterval = 60;
    p.guard.cooldownDuration = 5;
    p.guard.blocksToHold = 1;
    p.guard.timeToHold = 120;
    return p;
}

// ============================================================================
// Config Overlay
// ============================================================================

util::ConfigParseResult ApplyConfig(const util::ConfigManager& config,
                                    const std::string& section,
                                    EngineParams& params) {
    using util::ConfigParseResult;
    namespace keys = util::ConfigKeys;
    
    EngineParams updated = params;
    std::string badKey;
    
    auto fraction = [&](const char* key, Amount& out) {
        auto raw = config.TryGetString(key, section);
        if (!raw || !badKey.empty()) return;
        auto value = ParseFraction(*raw);
        if (!value) {
            badKey = key;
            return;
        }
        out = *value;
    };
    auto integer = [&](const char* key, auto& out) {
        if (!config.HasKey(key, section) || !badKey.empty()) return;
        auto value = config.TryGetInt(key, section);
        if (!value || *value < 0) {
            badKey = key;
            return;
        }
        out = static_cast<std::remove_reference_t<decltype(out)>>(*value);
    };
    
    fraction(keys::TAXFEE, updated.tax.taxFeeFraction);
    fraction(keys::MAXTREASURY, updated.tax.maximumTreasuryFraction);
    fraction(keys::MINTOPUP, updated.tax.minimumLiquidityTopUpFraction);
    fraction(keys::LPFRACTION, updated.tax.configurableLPFraction);
    
    integer(keys::TRANSFERINTERVAL, updated.treasury.transferInterval);
    fraction(keys::MINHEALTH, updated.treasury.minimumHealthThreshold);
    fraction(keys::MINLPHEALTH, updated.treasury.minLPHealthThreshold);
    fraction(keys::TARGETLP, updated.treasury.targetLPFraction);
    fraction(keys::SLIPPAGE, updated.treasury.slippageFraction);
    fraction(keys::SLIPPAGE, updated.donationSlippageFraction);
    
    fraction(keys::MAXBUY, updated.guard.maxBuyFraction);
    integer(keys::COOLDOWN, updated.guard.cooldownDuration);
    integer(keys::BLOCKSTOHOLD, updated.guard.blocksToHold);
    integer(keys::TIMETOHOLD, updated.guard.timeToHold);
    
    if (!badKey.empty()) {
        std::string where = section.empty() ? badKey : "[" + section + "] " + badKey;
        return ConfigParseResult::Error("Invalid value for " + where + ": '" +
                                        config.GetString(badKey, "", section) + "'");
    }
    
    params = updated;
    return ConfigParseResult::Success();
}

} // namespace vault
} // namespace endow
