// ENDOW - Tax Router
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/tax_router.h"
#include "endow/vault/threshold_math.h"
#include "endow/util/logging.h"

namespace endow {
namespace vault {

TaxRouter::TaxRouter(const TaxPolicy& policy, const SystemAddresses& system,
                     const ITreasuryStatus& treasury)
    : policy_(policy), system_(system), treasury_(treasury) {
    policy_.Validate();
}

bool TaxRouter::IsExempt(const Address& from, const Address& to) const {
    return from.IsNull() || to.IsNull() || system_.IsSystem(from) || system_.IsSystem(to);
}

bool TaxRouter::IsTreasuryFull(const LedgerView& view) const {
    return FractionOf(view.treasuryBalance, view.totalSupply) >= policy_.maximumTreasuryFraction;
}

bool TaxRouter::NeedsLiquiditySupport(const LedgerView& view) const {
    return FractionOf(view.liquidityBalance, view.totalSupply) < treasury_.LPHealthThreshold();
}

TaxBreakdown TaxRouter::Route(const Address& from, const Address& to, const Amount& amount,
                              const LedgerView& view) const {
    TaxBreakdown result;
    result.net = amount;
    
    if (IsExempt(from, to) || treasury_.IsTaxSuspended() || IsTreasuryFull(view)) {
        return result;
    }
    
    TaxSplit split = SplitTax(amount, policy_.taxFeeFraction, policy_.configurableLPFraction,
                              NeedsLiquiditySupport(view));
    result.toLiquidity = split.toLiquidity;
    result.toTreasury = split.toTreasury;
    result.net = amount - split.tax;
    
    LOG_TRACE(util::LogCategory::TAX) << "transfer " << AmountToString(amount)
        << " " << from.ToShortString() << " -> " << to.ToShortString()
        << ": lp=" << AmountToString(result.toLiquidity)
        << " treasury=" << AmountToString(result.toTreasury);
    return result;
}

} // namespace vault
} // namespace endow
