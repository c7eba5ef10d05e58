// ENDOW - Engine Parameter Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>

#include "endow/util/config.h"
#include "endow/vault/errors.h"
#include "endow/vault/params.h"
#include "endow/vault/threshold_math.h"

namespace endow {
namespace vault {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ParamsTest : public ::testing::Test {
protected:
    static Amount Pct(unsigned pct) { return FRACTION_ONE * pct / 100; }
    
    util::ConfigManager config_;
};

// ============================================================================
// Presets
// ============================================================================

TEST_F(ParamsTest, DefaultValues) {
    EngineParams p = EngineParams::Default();
    
    EXPECT_EQ(p.tax.taxFeeFraction, Pct(2));
    EXPECT_EQ(p.tax.maximumTreasuryFraction, Pct(30));
    EXPECT_EQ(p.tax.minimumLiquidityTopUpFraction, Pct(1));
    EXPECT_EQ(p.tax.configurableLPFraction, Pct(1));
    
    EXPECT_EQ(p.treasury.transferInterval, 86400);
    EXPECT_EQ(p.treasury.minimumHealthThreshold, Pct(10));
    EXPECT_EQ(p.treasury.minLPHealthThreshold, Pct(5));
    EXPECT_EQ(p.treasury.targetLPFraction, Pct(10));
    EXPECT_EQ(p.treasury.slippageFraction, Pct(5));
    
    EXPECT_EQ(p.guard.maxBuyFraction, Pct(1));
    EXPECT_EQ(p.guard.cooldownDuration, 60);
    EXPECT_EQ(p.guard.blocksToHold, 10u);
    EXPECT_EQ(p.guard.timeToHold, 3600);
    
    EXPECT_EQ(p.donationSlippageFraction, Pct(5));
    EXPECT_NO_THROW(p.Validate());
}

TEST_F(ParamsTest, RegTestShortensIntervals) {
    EngineParams p = EngineParams::RegTest();
    EngineParams d = EngineParams::Default();
    
    EXPECT_LT(p.treasury.transferInterval, d.treasury.transferInterval);
    EXPECT_LT(p.guard.cooldownDuration, d.guard.cooldownDuration);
    EXPECT_LT(p.guard.blocksToHold, d.guard.blocksToHold);
    EXPECT_LT(p.guard.timeToHold, d.guard.timeToHold);
    // Fractions are unchanged
    EXPECT_EQ(p.tax.taxFeeFraction, d.tax.taxFeeFraction);
    EXPECT_NO_THROW(p.Validate());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ParamsTest, RejectsLPFractionAboveTax) {
    EngineParams p = EngineParams::Default();
    p.tax.configurableLPFraction = Pct(3);
    
    try {
        p.Validate();
        FAIL() << "expected InvalidAmount";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidAmount);
    }
}

TEST_F(ParamsTest, RejectsFractionAboveOne) {
    EngineParams p = EngineParams::Default();
    p.treasury.targetLPFraction = FRACTION_ONE + 1;
    EXPECT_THROW(p.Validate(), VaultError);
    
    p = EngineParams::Default();
    p.guard.maxBuyFraction = Pct(101);
    EXPECT_THROW(p.Validate(), VaultError);
    
    p = EngineParams::Default();
    p.donationSlippageFraction = Pct(200);
    EXPECT_THROW(p.Validate(), VaultError);
}

TEST_F(ParamsTest, RejectsNegativeDurations) {
    EngineParams p = EngineParams::Default();
    p.treasury.transferInterval = -1;
    EXPECT_THROW(p.Validate(), VaultError);
    
    p = EngineParams::Default();
    p.guard.cooldownDuration = -5;
    EXPECT_THROW(p.Validate(), VaultError);
}

TEST_F(ParamsTest, ZeroFractionsAreValid) {
    EngineParams p = EngineParams::Default();
    p.tax.taxFeeFraction = 0;
    p.tax.configurableLPFraction = 0;
    p.treasury.slippageFraction = 0;
    EXPECT_NO_THROW(p.Validate());
}

// ============================================================================
// Config Overlay
// ============================================================================

TEST_F(ParamsTest, ApplyConfigOverlaysSection) {
    auto parsed = config_.ParseString(
        "taxfee=3%\n"
        "[vault.main]\n"
        "lpfraction=0.015\n"
        "transferinterval=3600\n"
        "maxbuy=2%\n"
        "blockstohold=5\n");
    ASSERT_TRUE(parsed.success) << parsed.ToString();
    
    EngineParams p = EngineParams::Default();
    auto result = ApplyConfig(config_, "", p);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(p.tax.taxFeeFraction, Pct(3));
    EXPECT_EQ(p.tax.configurableLPFraction, Pct(1));
    
    result = ApplyConfig(config_, "vault.main", p);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(p.tax.taxFeeFraction, Pct(3));
    EXPECT_EQ(p.tax.configurableLPFraction, FRACTION_ONE * 15 / 1000);
    EXPECT_EQ(p.treasury.transferInterval, 3600);
    EXPECT_EQ(p.guard.maxBuyFraction, Pct(2));
    EXPECT_EQ(p.guard.blocksToHold, 5u);
    // Untouched keys keep their values
    EXPECT_EQ(p.guard.cooldownDuration, 60);
}

TEST_F(ParamsTest, ApplyConfigSlippageCoversBothSwaps) {
    ASSERT_TRUE(config_.ParseString("slippage=1%\n").success);
    
    EngineParams p = EngineParams::Default();
    ASSERT_TRUE(ApplyConfig(config_, "", p).success);
    EXPECT_EQ(p.treasury.slippageFraction, Pct(1));
    EXPECT_EQ(p.donationSlippageFraction, Pct(1));
}

TEST_F(ParamsTest, ApplyConfigRejectsMalformedFraction) {
    ASSERT_TRUE(config_.ParseString("[vault.bad]\ntaxfee=two\ncooldown=30\n").success);
    
    EngineParams p = EngineParams::Default();
    auto result = ApplyConfig(config_, "vault.bad", p);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("taxfee"), std::string::npos);
    EXPECT_NE(result.errorMessage.find("vault.bad"), std::string::npos);
    // Nothing applied
    EXPECT_EQ(p.guard.cooldownDuration, 60);
    EXPECT_EQ(p.tax.taxFeeFraction, Pct(2));
}

TEST_F(ParamsTest, ApplyConfigRejectsNegativeInteger) {
    ASSERT_TRUE(config_.ParseString("cooldown=-1\n").success);
    
    EngineParams p = EngineParams::Default();
    auto result = ApplyConfig(config_, "", p);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("cooldown"), std::string::npos);
}

TEST_F(ParamsTest, ApplyConfigRejectsNonNumericInteger) {
    ASSERT_TRUE(config_.ParseString("timetohold=1h\n").success);
    
    EngineParams p = EngineParams::Default();
    EXPECT_FALSE(ApplyConfig(config_, "", p).success);
    EXPECT_EQ(p.guard.timeToHold, 3600);
}

} // namespace test
} // namespace vault
} // namespace endow
