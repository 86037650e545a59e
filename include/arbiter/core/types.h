// ARBITER - Core Types Header
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Fundamental value types shared by every ARBITER module: amounts,
// timestamps, fixed-size hashes and participant addresses.

#ifndef ARBITER_CORE_TYPES_H
#define ARBITER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace arbiter {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Identifier of an external prediction market
using MarketId = uint64_t;

/**
 * One proposal cycle of a market. A rejected resolution sends the market
 * back to settlement and the next proposal opens round + 1; every record
 * and ledger account of a cycle is kept under its round.
 */
struct MarketRound {
    MarketId market{0};
    uint32_t round{0};

    bool operator==(const MarketRound& other) const {
        return market == other.market && round == other.round;
    }
    bool operator!=(const MarketRound& other) const { return !(*this == other); }
    bool operator<(const MarketRound& other) const {
        return market != other.market ? market < other.market : round < other.round;
    }

    /// "market/round"
    std::string ToString() const;
};

/// One whole native token in base units
constexpr Amount COIN = 100000000LL;

/// Upper bound on any single amount handled by the protocol
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width hash
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse lowercase or uppercase hex in storage order
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (commitments, evidence digests, feed identifiers)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (participant addresses)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Identity of a protocol participant
using Address = Hash160;

// ============================================================================
// Hex Helpers
// ============================================================================

/// Encode bytes as lowercase hex
std::string BytesToHex(const Byte* data, size_t len);

/// Decode hex; returns false on odd length or invalid characters
bool HexToBytes(const std::string& hex, std::vector<Byte>& out);

} // namespace arbiter

#endif // ARBITER_CORE_TYPES_H
