// ARBITER - Core Types Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/core/types.h>

namespace arbiter {

namespace {

int HexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string MarketRound::ToString() const {
    return std::to_string(market) + "/" + std::to_string(round);
}

// ============================================================================
// Hex Helpers
// ============================================================================

std::string BytesToHex(const Byte* data, size_t len) {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexChars[data[i] >> 4]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

bool HexToBytes(const std::string& hex, std::vector<Byte>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    std::vector<Byte> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = HexNibble(hex[i]);
        int low = HexNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        bytes.push_back(static_cast<Byte>((high << 4) | low));
    }
    out = std::move(bytes);
    return true;
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    std::vector<Byte> bytes;
    if (!HexToBytes(hex, bytes)) {
        throw std::invalid_argument("Invalid hex character");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace arbiter
