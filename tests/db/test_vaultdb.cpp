// ENDOW - Vault Database Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>

#include "endow/db/leveldb.h"
#include "endow/db/vaultdb.h"

#include "vault/vault_test_util.h"

#include <memory>
#include <stdexcept>

namespace endow {
namespace db {
namespace test {

using vault::test::Supply;

// ============================================================================
// Test Fixtures
// ============================================================================

/// A vault with some history, persisted to an in-memory database
class VaultDBTest : public vault::test::VaultTestBase {
protected:
    static constexpr Timestamp DAY = 24 * 60 * 60;

    void SetUp() override {
        VaultTestBase::SetUp();
        auto mem = std::make_unique<MemoryDatabase>();
        mem_ = mem.get();
        db_ = std::make_unique<VaultDB>(std::move(mem));
    }

    /// Seed the pool, let alice buy, run one transfer-and-burn, pause donations
    void MakeHistory() {
        CreateVault(Supply() / 5);
        SeedPool(Supply() / 10);

        venue::PoolKey key = registry_->GetPoolKey(owner_);
        assets_->Credit(asset_, alice_, 5000);
        sim_->SwapExactInputSingle(At(alice_, 10, 10), key, 1000, 0,
                                   !key.ZeroForOneWhenSelling(token_), alice_);

        vault::UpkeepResult check = Treasury().CheckUpkeep(At(scheduler_, DAY));
        ASSERT_TRUE(check.needed);
        Treasury().PerformUpkeep(At(scheduler_, DAY), check.performData);

        registry_->SetPause(At(admin_), owner_, vault::VaultComponent::Donation, true);
    }

    /// Fresh registry and ledger, as after a restart that rebuilt vaults from config
    void Restart() {
        VaultTestBase::SetUp();
    }

    vault::VaultParams SecondParams() const {
        vault::VaultParams params = MakeParams(Supply() / 10);
        params.owner = Address::Filled(0x02);
        params.token = Address::Filled(0x11);
        params.treasury = Address::Filled(0x31);
        params.donation = Address::Filled(0x41);
        params.guard = Address::Filled(0x51);
        return params;
    }

    MemoryDatabase* mem_{nullptr};
    std::unique_ptr<VaultDB> db_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(VaultDBTest, RequiresDatabase) {
    std::unique_ptr<Database> none;
    EXPECT_THROW({ VaultDB db(std::move(none)); }, std::invalid_argument);
}

TEST_F(VaultDBTest, EmptyDatabase) {
    CreateVault(Supply() / 5);

    EXPECT_FALSE(db_->ReadVersion().has_value());
    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_TRUE(status.IsNotFound()) << status.ToString();
    EXPECT_EQ(db_->ForEachVault([](const vault::Vault&) { return true; }), 0u);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(VaultDBTest, WriteAndRestore) {
    MakeHistory();

    Amount supply = Token().TotalSupply();
    Amount treasuryTokens = Token().BalanceOf(treasury_);
    Amount donationTokens = Token().BalanceOf(donation_);
    Amount aliceTokens = Token().BalanceOf(alice_);
    Amount aliceAsset = assets_->BalanceOf(asset_, alice_);
    auto lastBuy = Guard().LastBuyTimestamp(alice_);
    ASSERT_TRUE(lastBuy.has_value());
    ASSERT_GT(aliceTokens, 0);
    ASSERT_LT(supply, Supply());

    Status status = db_->WriteState(*registry_, *assets_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    Restart();
    CreateVault(Supply() / 5);
    EXPECT_FALSE(registry_->GetVault(owner_).Record().isLPCreated);
    EXPECT_EQ(Token().TotalSupply(), Supply());

    status = db_->ReadState(*registry_, *assets_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    EXPECT_TRUE(registry_->GetVault(owner_).Record().isLPCreated);
    EXPECT_EQ(Token().TotalSupply(), supply);
    EXPECT_EQ(Token().BalanceOf(treasury_), treasuryTokens);
    EXPECT_EQ(Token().BalanceOf(donation_), donationTokens);
    EXPECT_EQ(Token().BalanceOf(alice_), aliceTokens);
    EXPECT_EQ(assets_->BalanceOf(asset_, alice_), aliceAsset);
    EXPECT_EQ(Treasury().LastTransferTimestamp(), LAUNCH_TIME + DAY);
    EXPECT_FALSE(Treasury().IsPaused());
    EXPECT_TRUE(Donation().IsPaused());
    EXPECT_EQ(Guard().LastBuyTimestamp(alice_), lastBuy);
    EXPECT_FALSE(Guard().LastBuyTimestamp(bob_).has_value());
}

TEST_F(VaultDBTest, RestoresGlobalPause) {
    CreateVault(Supply() / 5);
    registry_->SetGlobalPause(At(admin_), true);
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());

    Restart();
    CreateVault(Supply() / 5);
    EXPECT_FALSE(registry_->IsGloballyPaused());
    ASSERT_TRUE(db_->ReadState(*registry_, *assets_).ok());
    EXPECT_TRUE(registry_->IsGloballyPaused());
}

TEST_F(VaultDBTest, NewVaultWithoutStoredState) {
    MakeHistory();
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());

    Restart();
    CreateVault(Supply() / 5);
    vault::VaultHandle& second = CreateVault(SecondParams());

    Status status = db_->ReadState(*registry_, *assets_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    // The stored vault is restored; the new one keeps its creation state
    EXPECT_TRUE(Donation().IsPaused());
    EXPECT_FALSE(second.Donation().IsPaused());
    EXPECT_EQ(second.Token().TotalSupply(), Supply());
    EXPECT_EQ(second.Treasury().LastTransferTimestamp(), LAUNCH_TIME);
}

// ============================================================================
// Failures Roll Back
// ============================================================================

TEST_F(VaultDBTest, VersionMismatch) {
    CreateVault(Supply() / 5);
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    ASSERT_TRUE(mem_->Put(WriteOptions(), MakeKey(prefix::VERSION),
                          SerializeToString(VAULTDB_VERSION + 1)).ok());

    EXPECT_EQ(db_->ReadVersion(), VAULTDB_VERSION + 1);
    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_EQ(status.code(), Status::NOT_SUPPORTED) << status.ToString();
}

TEST_F(VaultDBTest, IdentityMismatch) {
    MakeHistory();
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());

    Restart();
    vault::VaultParams params = MakeParams(Supply() / 5);
    params.guard = Address::Filled(0x59);
    CreateVault(params);

    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();

    // Registry and ledger blobs were applied before the mismatch and rolled back
    EXPECT_FALSE(registry_->GetVault(owner_).Record().isLPCreated);
    EXPECT_EQ(assets_->BalanceOf(asset_, alice_), 0);
    EXPECT_EQ(Token().BalanceOf(treasury_), Supply() / 5);
    EXPECT_FALSE(Donation().IsPaused());
}

TEST_F(VaultDBTest, UndecodableBlob) {
    MakeHistory();
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    ASSERT_TRUE(mem_->Put(WriteOptions(), MakeKey(prefix::TREASURY, owner_), "x").ok());

    Restart();
    CreateVault(Supply() / 5);

    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(Token().TotalSupply(), Supply());
    EXPECT_EQ(Treasury().LastTransferTimestamp(), LAUNCH_TIME);
    EXPECT_FALSE(registry_->GetVault(owner_).Record().isLPCreated);
}

TEST_F(VaultDBTest, UndecodableVaultRecord) {
    MakeHistory();
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    ASSERT_TRUE(mem_->Put(WriteOptions(), MakeKey(prefix::VAULT, owner_), "x").ok());
    EXPECT_FALSE(db_->ReadVault(owner_).has_value());

    Restart();
    CreateVault(Supply() / 5);

    // Not mistaken for a vault that was never stored
    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(Token().TotalSupply(), Supply());
    EXPECT_EQ(Treasury().LastTransferTimestamp(), LAUNCH_TIME);
    EXPECT_FALSE(registry_->GetVault(owner_).Record().isLPCreated);
}

TEST_F(VaultDBTest, MissingComponentBlob) {
    CreateVault(Supply() / 5);
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    ASSERT_TRUE(mem_->Delete(WriteOptions(), MakeKey(prefix::GUARD, owner_)).ok());

    Status status = db_->ReadState(*registry_, *assets_);
    EXPECT_TRUE(status.IsNotFound()) << status.ToString();
}

// ============================================================================
// Records
// ============================================================================

TEST_F(VaultDBTest, VaultRecords) {
    CreateVault(Supply() / 5);
    CreateVault(SecondParams());
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());

    // Version, registry flags, ledger and five records per vault
    EXPECT_EQ(db_->GetWriteCount(), 13u);
    EXPECT_EQ(mem_->Size(), 13u);
    EXPECT_EQ(db_->ReadVersion(), VAULTDB_VERSION);

    auto record = db_->ReadVault(owner_);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->token, token_);
    EXPECT_EQ(record->guard, guard_);
    EXPECT_EQ(record->poolKey, registry_->GetPoolKey(owner_));
    EXPECT_FALSE(db_->ReadVault(alice_).has_value());

    size_t seen = 0;
    EXPECT_EQ(db_->ForEachVault([&](const vault::Vault&) { ++seen; return true; }), 2u);
    EXPECT_EQ(seen, 2u);
    EXPECT_EQ(db_->ForEachVault([](const vault::Vault&) { return false; }), 1u);
    EXPECT_GT(db_->GetReadCount(), 0u);
}

TEST_F(VaultDBTest, RewriteReplacesState) {
    CreateVault(Supply() / 5);
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    registry_->SetPause(At(admin_), owner_, vault::VaultComponent::Treasury, true);
    ASSERT_TRUE(db_->WriteState(*registry_, *assets_).ok());
    EXPECT_EQ(mem_->Size(), 8u);

    Restart();
    CreateVault(Supply() / 5);
    ASSERT_TRUE(db_->ReadState(*registry_, *assets_).ok());
    EXPECT_TRUE(Treasury().IsPaused());
}

} // namespace test
} // namespace db
} // namespace endow
