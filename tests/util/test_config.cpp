// ENDOW - Configuration File Parser Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>

#include "endow/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace endow {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/endow_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_EQ(result.ToString(), "ok");
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# interval=60
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
  interval  =  60
loglevel = debug
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 2u);
    EXPECT_EQ(config_.GetString("interval", "default"), "60");
    EXPECT_EQ(config_.GetString("loglevel", "default"), "debug");
    EXPECT_EQ(config_.GetString("missing", "default"), "default");
    EXPECT_FALSE(config_.TryGetString("missing").has_value());
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
key1="value with spaces"
key2='single quoted'
key3="with \"escaped\" quotes"
key4='keeps \"raw\"'
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key1", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("key2", ""), "single quoted");
    EXPECT_EQ(config_.GetString("key3", ""), "with \"escaped\" quotes");
    EXPECT_EQ(config_.GetString("key4", ""), "keeps \\\"raw\\\"");
}

TEST_F(ConfigTest, BareFlags) {
    std::string content = R"(
printtoconsole
nodebug
notify
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_EQ(config_.TryGetBool("debug"), false);
    EXPECT_FALSE(config_.HasKey("nodebug"));
    // "no" followed by a lowercase letter is a negation
    EXPECT_EQ(config_.TryGetBool("tify"), false);
}

TEST_F(ConfigTest, DuplicateKeyWarns) {
    auto result = config_.ParseString("interval=60\ninterval=90\n", "dup.conf");
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("dup.conf:2"), std::string::npos);
    EXPECT_EQ(config_.GetInt("interval", 0), 90);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("ENDOW_TEST_DIR", "/srv/endow", 1);
    unsetenv("ENDOW_TEST_UNSET");

    auto result = config_.ParseString(
        "datadir=${ENDOW_TEST_DIR}/data\nlogfile=${ENDOW_TEST_UNSET}keeper.log\nraw=${open\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/srv/endow/data");
    EXPECT_EQ(config_.GetString("logfile", ""), "keeper.log");
    EXPECT_EQ(config_.GetString("raw", ""), "${open");

    unsetenv("ENDOW_TEST_DIR");
}

// ============================================================================
// Sections
// ============================================================================

TEST_F(ConfigTest, VaultSections) {
    std::string content = R"(
interval=60

[vault.beta]
owner=0x0202020202020202020202020202020202020202

[vault.alpha]
owner=0x0101010101010101010101010101010101010101
taxfee=0.02

[other]
key=value
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success) << result.ToString();

    std::vector<std::string> sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 3u);
    EXPECT_EQ(sections[0], "other");
    EXPECT_EQ(sections[1], "vault.alpha");
    EXPECT_EQ(sections[2], "vault.beta");

    std::vector<std::string> vaults = config_.GetSectionsWithPrefix(VAULT_SECTION_PREFIX);
    ASSERT_EQ(vaults.size(), 2u);
    EXPECT_EQ(vaults[0], "alpha");
    EXPECT_EQ(vaults[1], "beta");

    EXPECT_TRUE(config_.HasKey(ConfigKeys::OWNER, "vault.alpha"));
    EXPECT_FALSE(config_.HasKey(ConfigKeys::OWNER));
    EXPECT_EQ(config_.GetString(ConfigKeys::TAXFEE, "", "vault.alpha"), "0.02");
    EXPECT_FALSE(config_.HasKey(ConfigKeys::TAXFEE, "vault.beta"));

    std::vector<std::string> keys = config_.GetKeys("vault.alpha");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "owner");
    EXPECT_EQ(keys[1], "taxfee");
    EXPECT_EQ(config_.GetKeys().size(), 1u);
}

TEST_F(ConfigTest, SameKeyInDifferentSectionsIsNotDuplicate) {
    auto result = config_.ParseString("[vault.a]\nfee=3000\n[vault.b]\nfee=500\n");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(config_.GetInt("fee", 0, "vault.a"), 3000);
    EXPECT_EQ(config_.GetInt("fee", 0, "vault.b"), 500);
}

// ============================================================================
// Parse Errors
// ============================================================================

TEST_F(ConfigTest, MissingClosingBracket) {
    auto result = config_.ParseString("interval=60\n[vault.main\n", "bad.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "bad.conf");
    EXPECT_EQ(result.ToString(), "bad.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidSectionName) {
    auto result = config_.ParseString("[vault main]\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("\n\nbad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 3);
    EXPECT_NE(result.errorMessage.find("bad key"), std::string::npos);

    EXPECT_FALSE(config_.ParseString("=value\n").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH, 'x') + "\n";
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, Integers) {
    auto result = config_.ParseString("a=42\nb=-7\nc=12x\nd=\ne=99999999999999999999\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_FALSE(config_.TryGetInt("e").has_value());
    EXPECT_EQ(config_.GetInt("c", 5), 5);
}

TEST_F(ConfigTest, Booleans) {
    auto result = config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));

    EXPECT_EQ(ConfigManager::ParseBool("True"), true);
    EXPECT_EQ(ConfigManager::ParseBool("no"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("").has_value());
}

TEST_F(ConfigTest, Addresses) {
    auto result = config_.ParseString(
        "scheduler=0xa2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2\nadmin=0x1234\n");
    ASSERT_TRUE(result.success);
    auto scheduler = config_.TryGetAddress(ConfigKeys::SCHEDULER);
    ASSERT_TRUE(scheduler.has_value());
    EXPECT_EQ(*scheduler, Address::Filled(0xA2));
    EXPECT_FALSE(config_.TryGetAddress(ConfigKeys::ADMIN).has_value());
    EXPECT_FALSE(config_.TryGetAddress(ConfigKeys::REGISTRY).has_value());
}

TEST_F(ConfigTest, Amounts) {
    auto result = config_.ParseString(
        "[vault.main]\nsupply=1000000000000000000000000000\nmaxbuy=-1\n");
    ASSERT_TRUE(result.success);
    auto supply = config_.TryGetAmount(ConfigKeys::SUPPLY, "vault.main");
    ASSERT_TRUE(supply.has_value());
    EXPECT_EQ(*supply, Amount(1000000000) * Amount(1000000000000000000ULL));
    EXPECT_FALSE(config_.TryGetAmount(ConfigKeys::MAXBUY, "vault.main").has_value());
}

// ============================================================================
// Overrides and Validation
// ============================================================================

TEST_F(ConfigTest, SetOverridesFileValue) {
    ASSERT_TRUE(config_.ParseString("loglevel=info\n").success);
    config_.Set(ConfigKeys::LOGLEVEL, "trace");
    config_.Set(ConfigKeys::FEE, "500", "vault.main");

    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "trace");
    EXPECT_EQ(config_.GetInt(ConfigKeys::FEE, 0, "vault.main"), 500);
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, ValidateUnknownKeys) {
    std::string content = R"(
interval=60
intervall=60

[vault.main]
fee=3000
bogus=1
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    // Nothing registered, nothing rejected
    EXPECT_TRUE(config_.Validate().empty());

    config_.AllowKey(ConfigKeys::INTERVAL);
    config_.AllowKey(ConfigKeys::FEE, VAULT_SECTION_PREFIX);

    std::vector<std::string> errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("intervall"), std::string::npos);
    EXPECT_NE(errors[1].find("vault.main:bogus"), std::string::npos);
}

// ============================================================================
// Files and Paths
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("interval=30\n[vault.main]\nfee=500\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetInt(ConfigKeys::INTERVAL, 0), 30);
    EXPECT_EQ(config_.GetInt(ConfigKeys::FEE, 0, "vault.main"), 500);
}

TEST_F(ConfigTest, ParseFileErrorsNameTheFile) {
    std::string path = CreateTempFile("ok=1\n[broken\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, path);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/endow/endow.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(ConfigManager::ExpandTilde("~/x"), std::string(home) + "/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), std::string(home));
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), std::string(home) + "/.endow");
}

TEST_F(ConfigTest, GetPathExpandsTilde) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }
    ASSERT_TRUE(config_.ParseString("datadir=~/vaults\n").success);
    EXPECT_EQ(config_.GetPath(ConfigKeys::DATADIR), std::string(home) + "/vaults");
    EXPECT_EQ(config_.GetPath(ConfigKeys::LOGFILE, "~/k.log"), std::string(home) + "/k.log");
}

} // namespace test
} // namespace util
} // namespace endow
