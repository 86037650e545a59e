// ARBITER - Core Type Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>
#include <arbiter/core/status.h>
#include <arbiter/core/types.h>
#include <set>
#include <stdexcept>
#include <vector>

using namespace arbiter;

// ============================================================================
// Hash256 / Address
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(hash[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    EXPECT_EQ(Address::SIZE, 20u);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::vector<Byte> bytes(32);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<Byte>(i + 1);
    }
    Hash256 hash(bytes.data(), bytes.size());
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 1);
    EXPECT_EQ(hash[31], 32);
}

TEST(Hash256Test, ShortInputIsZeroPadded) {
    Byte bytes[3] = {0xAA, 0xBB, 0xCC};
    Hash256 hash(bytes, sizeof(bytes));
    EXPECT_EQ(hash[2], 0xCC);
    EXPECT_EQ(hash[3], 0);
}

TEST(Hash256Test, EqualityAndOrdering) {
    Byte a[1] = {1};
    Byte b[1] = {2};
    Hash256 h1(a, 1);
    Hash256 h2(b, 1);
    Hash256 h3(a, 1);

    EXPECT_EQ(h1, h3);
    EXPECT_NE(h1, h2);
    EXPECT_TRUE(h1 < h2);
    EXPECT_FALSE(h2 < h1);
}

TEST(Hash256Test, HexRoundTrip) {
    const std::string hex =
        "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    Hash256 hash = Hash256::FromHex(hex);
    EXPECT_EQ(hash[0], 0x00);
    EXPECT_EQ(hash[1], 0x11);
    EXPECT_EQ(hash.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(AddressTest, UsableAsMapKey) {
    Byte a[1] = {7};
    Byte b[1] = {9};
    std::set<Address> addresses;
    addresses.insert(Address(a, 1));
    addresses.insert(Address(b, 1));
    addresses.insert(Address(a, 1));
    EXPECT_EQ(addresses.size(), 2u);
}

TEST(AddressTest, UppercaseHexAccepted) {
    Address addr = Address::FromHex("ABCDEF0123456789ABCDEF0123456789ABCDEF01");
    EXPECT_EQ(addr.ToHex(), "abcdef0123456789abcdef0123456789abcdef01");
}

// ============================================================================
// MarketRound
// ============================================================================

TEST(MarketRoundTest, OrdersByMarketThenRound) {
    EXPECT_LT((MarketRound{1, 5}), (MarketRound{2, 0}));
    EXPECT_LT((MarketRound{2, 0}), (MarketRound{2, 1}));
    EXPECT_FALSE((MarketRound{2, 1}) < (MarketRound{2, 1}));
    EXPECT_EQ((MarketRound{7, 3}), (MarketRound{7, 3}));
    EXPECT_NE((MarketRound{7, 3}), (MarketRound{7, 4}));
    EXPECT_EQ((MarketRound{42, 1}).ToString(), "42/1");
}

// ============================================================================
// Hex Helpers
// ============================================================================

TEST(HexTest, BytesToHex) {
    Byte data[] = {0x00, 0x0f, 0xf0, 0xff};
    EXPECT_EQ(BytesToHex(data, sizeof(data)), "000ff0ff");
    EXPECT_EQ(BytesToHex(data, 0), "");
}

TEST(HexTest, HexToBytes) {
    std::vector<Byte> out;
    ASSERT_TRUE(HexToBytes("deadBEEF", out));
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], 0xde);
    EXPECT_EQ(out[3], 0xef);

    EXPECT_FALSE(HexToBytes("abc", out));
    EXPECT_FALSE(HexToBytes("zz", out));
}

// ============================================================================
// Amounts
// ============================================================================

TEST(MoneyRangeTest, Bounds) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(COIN));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

// ============================================================================
// Status
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_TRUE(static_cast<bool>(status));
    EXPECT_EQ(status.code(), ErrorCode::OK);
}

TEST(StatusTest, ErrorCarriesCodeAndMessage) {
    Status status = Status::Error(ErrorCode::WINDOW_CLOSED, "support period over");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::WINDOW_CLOSED);
    EXPECT_EQ(status.message(), "support period over");
    EXPECT_NE(status.ToString().find("support period over"), std::string::npos);
}

TEST(StatusTest, ErrorCodeDescriptions) {
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::REENTRANT_CALL), "Reentrant call");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::INSOLVENT), "Ledger insolvent");
    EXPECT_EQ(Status().ToString(), "OK");
}
