// ARBITER - Serialization Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>
#include <arbiter/core/serialize.h>
#include <arbiter/core/types.h>
#include <ios>
#include <optional>
#include <string>
#include <vector>

using namespace arbiter;

namespace {

enum class Color : uint8_t { Red, Green, Blue };

} // namespace

// ============================================================================
// DataStream
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
    DataStream ds;
    ds << uint8_t(1);
    uint32_t value = 0;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, StrRoundTrip) {
    DataStream ds;
    ds << uint32_t(0xDEADBEEF) << std::string("arbiter");
    DataStream copy(ds.Str());

    uint32_t number = 0;
    std::string text;
    copy >> number >> text;
    EXPECT_EQ(number, 0xDEADBEEFu);
    EXPECT_EQ(text, "arbiter");
}

// ============================================================================
// Integers
// ============================================================================

TEST(SerializeTest, Uint32LittleEndian) {
    DataStream ds;
    ds << uint32_t(0x04030201);
    const auto& bytes = ds.Bytes();
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0x01);
    EXPECT_EQ(bytes[3], 0x04);
}

TEST(SerializeTest, NegativeAmount) {
    DataStream ds;
    Amount in = -5 * COIN;
    ds << in;
    Amount out = 0;
    ds >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, BoolRejectsOutOfRangeByte) {
    DataStream ds;
    ds << uint8_t(2);
    bool flag = false;
    EXPECT_THROW(ds >> flag, std::ios_base::failure);
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Widths) {
    DataStream small;
    WriteCompactSize(small, 252);
    EXPECT_EQ(small.size(), 1u);

    DataStream medium;
    WriteCompactSize(medium, 253);
    EXPECT_EQ(medium.size(), 3u);
    EXPECT_EQ(ReadCompactSize(medium), 253u);

    DataStream large;
    WriteCompactSize(large, 0x10000);
    EXPECT_EQ(large.size(), 5u);
}

TEST(CompactSizeTest, NonCanonicalRejected) {
    DataStream ds;
    ds << uint8_t(0xFD) << uint16_t(10);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

TEST(CompactSizeTest, OversizedRejected) {
    DataStream ds;
    WriteCompactSize(ds, MAX_SERIALIZED_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Strings, Hashes, Containers
// ============================================================================

TEST(SerializeTest, StringWithNulls) {
    std::string in("a\0b", 3);
    DataStream ds;
    ds << in;
    std::string out;
    ds >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, HashesAreRawBytes) {
    Hash256 hash = Hash256::FromHex(
        "0101010101010101010101010101010101010101010101010101010101010101");
    Address addr = Address::FromHex("0202020202020202020202020202020202020202");
    DataStream ds;
    ds << hash << addr;
    EXPECT_EQ(ds.size(), 52u);

    Hash256 hashOut;
    Address addrOut;
    ds >> hashOut >> addrOut;
    EXPECT_EQ(hashOut, hash);
    EXPECT_EQ(addrOut, addr);
}

TEST(SerializeTest, VectorOfStrings) {
    std::vector<std::string> in = {"one", "", "three"};
    DataStream ds;
    ds << in;
    std::vector<std::string> out;
    ds >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, OptionalPresentAndAbsent) {
    std::optional<uint32_t> present = 7;
    std::optional<uint32_t> absent;
    DataStream ds;
    ds << present << absent;
    EXPECT_EQ(ds.size(), 1u + 4u + 1u);

    std::optional<uint32_t> a = 99;
    std::optional<uint32_t> b = 99;
    ds >> a >> b;
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, 7u);
    EXPECT_FALSE(b.has_value());
}

// ============================================================================
// Enumerations
// ============================================================================

TEST(SerializeEnumTest, OneByteOnTheWire) {
    DataStream ds;
    SerializeEnum(ds, Color::Blue);
    EXPECT_EQ(ds.size(), 1u);

    Color out = Color::Red;
    UnserializeEnum(ds, out, Color::Blue);
    EXPECT_EQ(out, Color::Blue);
}

TEST(SerializeEnumTest, RejectsValueAboveMax) {
    DataStream ds;
    ds << uint8_t(3);
    Color out = Color::Red;
    EXPECT_THROW(UnserializeEnum(ds, out, Color::Blue), std::ios_base::failure);
}
