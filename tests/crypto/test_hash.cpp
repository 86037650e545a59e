// ARBITER - Hash Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Known-answer vectors from FIPS 180-4 and FIPS 202.

#include <gtest/gtest.h>
#include <arbiter/crypto/hash.h>
#include <arbiter/core/serialize.h>
#include <arbiter/core/types.h>

#include <string>
#include <vector>

namespace arbiter {
namespace test {

namespace {

Hash256 Sha256Of(const std::string& text) {
    return SHA256Hash(reinterpret_cast<const Byte*>(text.data()), text.size());
}

Hash256 Sha3Of(const std::string& text) {
    return SHA3Hash(reinterpret_cast<const Byte*>(text.data()), text.size());
}

} // namespace

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(Sha256Of("").ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(Sha256Of("abc").ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    Hasher hasher(HashAlgorithm::SHA256);
    hasher.Write("a").Write("b").Write("c");
    EXPECT_EQ(hasher.Finalize(), Sha256Of("abc"));
}

// ============================================================================
// SHA3-256
// ============================================================================

TEST(SHA3Test, EmptyString) {
    EXPECT_EQ(Sha3Of("").ToHex(),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, Abc) {
    EXPECT_EQ(Sha3Of("abc").ToHex(),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, DiffersFromSHA256) {
    EXPECT_NE(Sha3Of("abc"), Sha256Of("abc"));
}

TEST(SHA3Test, StreamHashCoversUnreadBytes) {
    DataStream ss;
    ss << std::string("abc");
    std::vector<Byte> expected(ss.data(), ss.data() + ss.size());
    EXPECT_EQ(SHA3Hash(ss), SHA3Hash(expected));
}

// ============================================================================
// Hasher lifecycle
// ============================================================================

TEST(HasherTest, FinalizeResets) {
    Hasher hasher(HashAlgorithm::SHA3_256);
    hasher.Write("junk");
    Hash256 first = hasher.Finalize();
    EXPECT_EQ(first, Sha3Of("junk"));

    hasher.Write("abc");
    EXPECT_EQ(hasher.Finalize(), Sha3Of("abc"));
}

TEST(HasherTest, ExplicitReset) {
    Hasher hasher(HashAlgorithm::SHA256);
    hasher.Write("discarded");
    hasher.Reset();
    EXPECT_EQ(hasher.Finalize(), Sha256Of(""));
}

} // namespace test
} // namespace arbiter
