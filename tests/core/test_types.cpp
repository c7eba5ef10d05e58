// ENDOW - Core Types Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>
#include "endow/core/types.h"
#include "endow/core/hex.h"

#include <limits>
#include <map>
#include <stdexcept>

namespace endow {
namespace test {

// ============================================================================
// Byte Type Tests
// ============================================================================

TEST(ByteTest, SizeIsOneByte) {
    EXPECT_EQ(sizeof(Byte), 1u);
}

// ============================================================================
// Amount Tests
// ============================================================================

const char* const MAX_AMOUNT =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";

TEST(AmountTest, HoldsEighteenDecimalSupplies) {
    // 1e9 tokens with 18 decimals does not fit in 64 bits
    Amount supply = Amount(1000000000) * Amount(1000000000000000000ULL);
    EXPECT_EQ(AmountToString(supply), "1000000000000000000000000000");
    EXPECT_GT(supply, Amount(std::numeric_limits<uint64_t>::max()));
}

TEST(AmountTest, ParseDecimal) {
    EXPECT_EQ(ParseAmount("0"), Amount(0));
    EXPECT_EQ(ParseAmount("42"), Amount(42));
    EXPECT_EQ(ParseAmount("000123"), Amount(123));
    EXPECT_EQ(ParseAmount("1000000000000000000000000000"),
              Amount(1000000000) * Amount(1000000000000000000ULL));
}

TEST(AmountTest, ParseRejectsMalformed) {
    EXPECT_FALSE(ParseAmount("").has_value());
    EXPECT_FALSE(ParseAmount("-1").has_value());
    EXPECT_FALSE(ParseAmount("+1").has_value());
    EXPECT_FALSE(ParseAmount("1.5").has_value());
    EXPECT_FALSE(ParseAmount("1e18").has_value());
    EXPECT_FALSE(ParseAmount(" 1").has_value());
    EXPECT_FALSE(ParseAmount("0x10").has_value());
}

TEST(AmountTest, ParseBounds) {
    auto max = ParseAmount(MAX_AMOUNT);
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(*max, std::numeric_limits<Amount>::max());
    EXPECT_EQ(AmountToString(*max), MAX_AMOUNT);

    // One past the maximum
    std::string over = MAX_AMOUNT;
    over.back() = '6';
    EXPECT_FALSE(ParseAmount(over).has_value());
    EXPECT_FALSE(ParseAmount(std::string(79, '1')).has_value());
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
    EXPECT_EQ(addr.ToString(), "0x" + std::string(40, '0'));
}

TEST(AddressTest, Filled) {
    Address addr = Address::Filled(0xAB);
    EXPECT_FALSE(addr.IsNull());
    for (size_t i = 0; i < Address::SIZE; ++i) {
        EXPECT_EQ(addr.data()[i], 0xAB);
    }
    EXPECT_EQ(addr.ToShortString(), "0xabab..abab");
}

TEST(AddressTest, FromHex) {
    const std::string hex = "0x00112233445566778899aabbccddeeff00112233";
    auto addr = Address::FromHex(hex);
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->data()[0], 0x00);
    EXPECT_EQ(addr->data()[1], 0x11);
    EXPECT_EQ(addr->data()[19], 0x33);
    EXPECT_EQ(addr->ToString(), hex);

    // Bare and upper-case forms parse to the same address
    auto bare = Address::FromHex("00112233445566778899AABBCCDDEEFF00112233");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*bare, *addr);
}

TEST(AddressTest, FromHexRejectsMalformed) {
    EXPECT_FALSE(Address::FromHex("").has_value());
    EXPECT_FALSE(Address::FromHex("0x").has_value());
    EXPECT_FALSE(Address::FromHex("0x0011").has_value());
    EXPECT_FALSE(Address::FromHex("0x00112233445566778899aabbccddeeff0011223344").has_value());
    EXPECT_FALSE(Address::FromHex("0xzz112233445566778899aabbccddeeff00112233").has_value());
    EXPECT_FALSE(Address::FromHex("0x0112233445566778899aabbccddeeff00112233").has_value());
}

TEST(AddressTest, OrderingIsNumeric) {
    Address low = *Address::FromHex("0x00000000000000000000000000000000000000ff");
    Address high = *Address::FromHex("0x0100000000000000000000000000000000000000");
    EXPECT_LT(low, high);
    EXPECT_FALSE(high < low);
    EXPECT_LT(Address(), low);
    EXPECT_NE(low, high);

    std::map<Address, int> ordered{{high, 2}, {low, 1}, {Address(), 0}};
    int expected = 0;
    for (const auto& entry : ordered) {
        EXPECT_EQ(entry.second, expected++);
    }
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, RoundTrip) {
    std::vector<HexByte> bytes = {0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "007f80ff");
    EXPECT_EQ(HexToBytes("007f80ff"), bytes);
    EXPECT_EQ(HexToBytes("0x007F80FF"), bytes);
}

TEST(HexTest, Validation) {
    EXPECT_TRUE(IsValidHex("0xdeadbeef"));
    EXPECT_TRUE(IsValidHex("DEADBEEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0xgg"));

    EXPECT_EQ(StripHexPrefix("0Xab"), "ab");
    EXPECT_EQ(StripHexPrefix("ab"), "ab");

    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

} // namespace test
} // namespace endow
