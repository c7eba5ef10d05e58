// ENDOW - Serialization Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>
#include "endow/core/serialize.h"
#include "endow/core/types.h"

#include <ios>
#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace endow;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());
    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds(std::vector<uint8_t>{0x01, 0x02});
    uint32_t value;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, ToBytesReturnsUnreadData) {
    DataStream ds(std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    uint8_t first;
    ds >> first;
    EXPECT_EQ(first, 0xDE);
    EXPECT_EQ(ds.ToBytes(), (std::vector<uint8_t>{0xAD, 0xBE, 0xEF}));
    EXPECT_EQ(ds.ToHex(), "adbeef");
}

TEST(DataStreamTest, FromHex) {
    DataStream ds;
    ds.FromHex("0x2a000000");
    uint32_t value;
    ds >> value;
    EXPECT_EQ(value, 42u);

    EXPECT_THROW(ds.FromHex("2a0"), std::invalid_argument);
}

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(IntegerSerializeTest, LittleEndian) {
    DataStream ds;
    ds << uint32_t(0x01020304) << uint64_t(0x0102030405060708ULL);
    EXPECT_EQ(ds.ToHex(), "04030201" "0807060504030201");
}

TEST(IntegerSerializeTest, SignedValues) {
    DataStream ds;
    ds << int32_t(-887220) << int64_t(std::numeric_limits<int64_t>::min()) << true << false;

    int32_t tick;
    int64_t time;
    bool yes, no;
    ds >> tick >> time >> yes >> no;
    EXPECT_EQ(tick, -887220);
    EXPECT_EQ(time, std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(yes);
    EXPECT_FALSE(no);
    EXPECT_TRUE(ds.empty());
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Encoding) {
    auto encode = [](uint64_t n) {
        DataStream ds;
        WriteCompactSize(ds, n);
        return ds.ToHex();
    };
    EXPECT_EQ(encode(0), "00");
    EXPECT_EQ(encode(252), "fc");
    EXPECT_EQ(encode(253), "fdfd00");
    EXPECT_EQ(encode(0xFFFF), "fdffff");
    EXPECT_EQ(encode(0x10000), "fe00000100");
    EXPECT_EQ(encode(0x100000000ULL), "ff0000000001000000");
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds;
    ds.FromHex("fd0100");
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);

    ds.FromHex("fe00000100");
    EXPECT_EQ(ReadCompactSize(ds), 0x10000u);
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream ds;
    WriteCompactSize(ds, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Amount and Address
// ============================================================================

TEST(AmountSerializeTest, FixedWidthLittleEndian) {
    DataStream ds;
    ds << Amount(0x0102);
    EXPECT_EQ(ds.size(), AMOUNT_SERIALIZED_SIZE);
    EXPECT_EQ(ds.ToHex(), "0201" + std::string(60, '0'));
}

TEST(AmountSerializeTest, FullRange) {
    const Amount max = std::numeric_limits<Amount>::max();
    const Amount supply = Amount(1000000000) * Amount(1000000000000000000ULL);

    DataStream ds;
    ds << max << supply << Amount(0);
    EXPECT_EQ(ds.size(), 3 * AMOUNT_SERIALIZED_SIZE);

    Amount a, b, c;
    ds >> a >> b >> c;
    EXPECT_EQ(a, max);
    EXPECT_EQ(b, supply);
    EXPECT_EQ(c, 0);
}

TEST(AddressSerializeTest, RawBytes) {
    Address addr = Address::Filled(0x5A);
    DataStream ds;
    ds << addr;
    EXPECT_EQ(ds.size(), Address::SIZE);
    EXPECT_EQ(ds.ToHex(), addr.ToString().substr(2));

    Address decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, addr);
}

// ============================================================================
// Strings and Containers
// ============================================================================

TEST(ContainerSerializeTest, String) {
    DataStream ds;
    ds << std::string("abc") << std::string();
    EXPECT_EQ(ds.ToHex(), "0361626300");

    std::string a, b = "stale";
    ds >> a >> b;
    EXPECT_EQ(a, "abc");
    EXPECT_TRUE(b.empty());
}

TEST(ContainerSerializeTest, ByteVector) {
    std::vector<uint8_t> bytes = {0x01, 0x00, 0xff};
    DataStream ds;
    ds << bytes;
    EXPECT_EQ(ds.ToHex(), "030100ff");

    std::vector<uint8_t> decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, bytes);
}

TEST(ContainerSerializeTest, VectorOfAmounts) {
    std::vector<Amount> amounts = {Amount(1), Amount(20), Amount(300)};
    DataStream ds;
    ds << amounts;
    EXPECT_EQ(ds.size(), 1 + 3 * AMOUNT_SERIALIZED_SIZE);

    std::vector<Amount> decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, amounts);
}

TEST(ContainerSerializeTest, BalanceMap) {
    std::map<Address, Amount> balances;
    balances[Address::Filled(0x02)] = 500;
    balances[Address::Filled(0x01)] = 250;

    DataStream ds;
    ds << balances;
    EXPECT_EQ(ds.size(), 1 + 2 * (Address::SIZE + AMOUNT_SERIALIZED_SIZE));

    // Entries are written in key order
    EXPECT_EQ(ds.data()[1], 0x01);

    std::map<Address, Amount> decoded;
    decoded[Address::Filled(0x09)] = 1;
    ds >> decoded;
    EXPECT_EQ(decoded, balances);
}

TEST(ContainerSerializeTest, NestedMap) {
    std::map<Address, std::map<Address, Amount>> ledger;
    ledger[Address::Filled(0x20)][Address::Filled(0x71)] = 1000;
    ledger[Address()][Address::Filled(0x72)] = 7;

    DataStream ds;
    ds << ledger;
    std::map<Address, std::map<Address, Amount>> decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, ledger);
    EXPECT_TRUE(ds.empty());
}

TEST(ContainerSerializeTest, TruncatedMapThrows) {
    std::map<Address, bool> flags{{Address::Filled(0x01), true}};
    DataStream ds;
    ds << flags;
    std::vector<uint8_t> bytes = ds.ToBytes();
    bytes.pop_back();

    DataStream truncated(bytes);
    std::map<Address, bool> decoded;
    EXPECT_THROW(truncated >> decoded, std::ios_base::failure);
}
