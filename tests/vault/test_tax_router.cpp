// ENDOW - Tax Router Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>

#include "endow/vault/tax_router.h"
#include "endow/vault/threshold_math.h"

#include "vault/vault_test_util.h"

namespace endow {
namespace vault {
namespace test {

// ============================================================================
// Router in Isolation
// ============================================================================

class StaticTreasuryStatus : public ITreasuryStatus {
public:
    bool IsTaxSuspended() const override { return suspended; }
    const Amount& LPHealthThreshold() const override { return threshold; }
    
    bool suspended{false};
    Amount threshold{Pct(5)};
};

class TaxRouterTest : public ::testing::Test {
protected:
    TaxRouterTest()
        : router_(EngineParams::Default().tax,
                  SystemAddresses{lm_, treasury_, donation_}, status_) {}
    
    /// Treasury and pool balances as percentages of supply
    TaxRouter::LedgerView View(unsigned treasuryPct, unsigned liquidityPct) const {
        return TaxRouter::LedgerView{Supply() * treasuryPct / 100,
                                     Supply() * liquidityPct / 100, Supply()};
    }
    
    const Address lm_ = Address::Filled(0xB0);
    const Address treasury_ = Address::Filled(0x30);
    const Address donation_ = Address::Filled(0x40);
    const Address alice_ = Address::Filled(0x71);
    const Address bob_ = Address::Filled(0x72);
    
    StaticTreasuryStatus status_;
    TaxRouter router_;
};

TEST_F(TaxRouterTest, SplitsWhenLiquidityIsLow) {
    TaxBreakdown b = router_.Route(alice_, bob_, 1000, View(10, 0));
    EXPECT_EQ(b.net, 980);
    EXPECT_EQ(b.toLiquidity, 10);
    EXPECT_EQ(b.toTreasury, 10);
    EXPECT_EQ(b.Tax(), 20);
}

TEST_F(TaxRouterTest, AllToTreasuryWhenLiquidityIsHealthy) {
    TaxBreakdown b = router_.Route(alice_, bob_, 1000, View(10, 5));
    EXPECT_EQ(b.net, 980);
    EXPECT_EQ(b.toLiquidity, 0);
    EXPECT_EQ(b.toTreasury, 20);
}

TEST_F(TaxRouterTest, UntaxedWhenTreasuryIsFull) {
    TaxBreakdown b = router_.Route(alice_, bob_, 1000, View(30, 0));
    EXPECT_EQ(b.net, 1000);
    EXPECT_EQ(b.Tax(), 0);
    
    EXPECT_TRUE(router_.IsTreasuryFull(View(30, 0)));
    EXPECT_FALSE(router_.IsTreasuryFull(View(29, 0)));
}

TEST_F(TaxRouterTest, UntaxedWhileSuspended) {
    status_.suspended = true;
    TaxBreakdown b = router_.Route(alice_, bob_, 1000, View(10, 0));
    EXPECT_EQ(b.net, 1000);
    EXPECT_EQ(b.Tax(), 0);
}

TEST_F(TaxRouterTest, SystemAndNullAddressesAreExempt) {
    EXPECT_TRUE(router_.IsExempt(alice_, treasury_));
    EXPECT_TRUE(router_.IsExempt(donation_, alice_));
    EXPECT_TRUE(router_.IsExempt(lm_, alice_));
    EXPECT_TRUE(router_.IsExempt(alice_, lm_));
    EXPECT_TRUE(router_.IsExempt(Address(), alice_));
    EXPECT_TRUE(router_.IsExempt(alice_, Address()));
    EXPECT_FALSE(router_.IsExempt(alice_, bob_));
    
    TaxBreakdown b = router_.Route(alice_, lm_, 1000, View(10, 0));
    EXPECT_EQ(b.net, 1000);
}

TEST_F(TaxRouterTest, ThresholdComesFromTreasury) {
    EXPECT_TRUE(router_.NeedsLiquiditySupport(View(10, 4)));
    status_.threshold = Pct(3);
    EXPECT_FALSE(router_.NeedsLiquiditySupport(View(10, 4)));
}

TEST_F(TaxRouterTest, EmptySupplyTreatedAsNoShare) {
    TaxRouter::LedgerView empty{0, 0, 0};
    EXPECT_FALSE(router_.IsTreasuryFull(empty));
    EXPECT_TRUE(router_.NeedsLiquiditySupport(empty));
}

TEST_F(TaxRouterTest, RejectsInvalidPolicy) {
    TaxPolicy policy = EngineParams::Default().tax;
    policy.configurableLPFraction = Pct(5);
    EXPECT_THROW({
        TaxRouter router(policy, SystemAddresses{lm_, treasury_, donation_}, status_);
    }, VaultError);
}

// ============================================================================
// Router Attached to a Token
// ============================================================================

class TokenTaxTest : public VaultTestBase {};

TEST_F(TokenTaxTest, TransferBetweenUsersIsTaxed) {
    CreateVault(Supply() / 10);
    FundraisingToken& token = Token();
    events_->Clear();
    
    TaxBreakdown b = token.Transfer(owner_, bob_, 1000, LAUNCH_TIME);
    EXPECT_EQ(b.net, 980);
    EXPECT_EQ(token.BalanceOf(bob_), 980);
    EXPECT_EQ(token.BalanceOf(venueAddr_), 10);
    EXPECT_EQ(token.BalanceOf(treasury_), Supply() / 10 + 10);
    EXPECT_EQ(token.BalanceOf(owner_), Supply() * 9 / 10 - 1000);
    EXPECT_EQ(token.TotalSupply(), Supply());
    
    EXPECT_EQ(events_->Count(EventType::Transfer), 1u);
    auto routed = events_->Filter(EventType::TaxRouted);
    ASSERT_EQ(routed.size(), 1u);
    EXPECT_EQ(routed[0].amount, 10);
    EXPECT_EQ(routed[0].secondary, 10);
}

TEST_F(TokenTaxTest, FullTreasuryStopsTax) {
    CreateVault(Supply() * 3 / 10);
    
    TaxBreakdown b = Token().Transfer(owner_, bob_, 1000);
    EXPECT_EQ(b.net, 1000);
    EXPECT_EQ(Token().BalanceOf(bob_), 1000);
}

TEST_F(TokenTaxTest, HealthyPoolSendsTaxToTreasury) {
    CreateVault(Supply() / 5);
    SeedPool(Supply() / 10);
    ASSERT_EQ(Token().BalanceOf(venueAddr_), Supply() / 10);
    
    Token().Transfer(owner_, bob_, 1000);
    EXPECT_EQ(Token().BalanceOf(bob_), 980);
    EXPECT_EQ(Token().BalanceOf(venueAddr_), Supply() / 10);
    EXPECT_EQ(Token().BalanceOf(treasury_), Supply() / 10 + 20);
}

TEST_F(TokenTaxTest, PauseSuspendsTax) {
    CreateVault(Supply() / 10);
    
    registry_->SetPause(At(admin_), owner_, VaultComponent::Treasury, true);
    EXPECT_EQ(Token().Transfer(owner_, bob_, 1000).net, 1000);
    registry_->SetPause(At(admin_), owner_, VaultComponent::Treasury, false);
    
    registry_->SetGlobalPause(At(admin_), true);
    EXPECT_EQ(Token().Transfer(owner_, bob_, 1000).net, 1000);
    registry_->SetGlobalPause(At(admin_), false);
    
    EXPECT_EQ(Token().Transfer(owner_, bob_, 1000).net, 980);
}

TEST_F(TokenTaxTest, TransfersToSystemAddressesAreUntaxed) {
    CreateVault(Supply() / 10);
    
    Token().Transfer(owner_, donation_, 1000);
    EXPECT_EQ(Token().BalanceOf(donation_), 1000);
    Token().Transfer(owner_, treasury_, 1000);
    EXPECT_EQ(Token().BalanceOf(treasury_), Supply() / 10 + 1000);
    // The pool account is the liquidity manager
    EXPECT_EQ(Token().Transfer(owner_, venueAddr_, 1000).net, 1000);
    EXPECT_EQ(Token().BalanceOf(venueAddr_), 1000);
}

TEST_F(TokenTaxTest, InsufficientBalance) {
    CreateVault(Supply() / 10);
    ExpectVaultError(ErrorCode::InsufficientBalance, [&] {
        Token().Transfer(alice_, bob_, 1);
    });
    ExpectVaultError(ErrorCode::InvalidAddress, [&] {
        Token().Transfer(owner_, Address(), 1);
    });
}

TEST_F(TokenTaxTest, RouterAttachedOnce) {
    CreateVault(Supply() / 10);
    EXPECT_TRUE(Token().HasTaxRouter());
    ExpectVaultError(ErrorCode::AlreadySet, [&] {
        Token().SetTaxRouter(registry_->GetVault(owner_).Router());
    });
}

} // namespace test
} // namespace vault
} // namespace endow
