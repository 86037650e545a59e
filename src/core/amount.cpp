// ARBITER - Fixed-Point Amount Arithmetic Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/core/amount.h>

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace arbiter {

Amount MulDiv(Amount a, Amount b, Amount denom) {
    if (denom <= 0 || a < 0 || b < 0) {
        return 0;
    }
    unsigned __int128 product = static_cast<unsigned __int128>(a) *
                                static_cast<unsigned __int128>(b);
    unsigned __int128 result = product / static_cast<unsigned __int128>(denom);
    if (result > static_cast<unsigned __int128>(std::numeric_limits<Amount>::max())) {
        return std::numeric_limits<Amount>::max();
    }
    return static_cast<Amount>(result);
}

uint64_t ISqrt(uint64_t value) {
    if (value < 2) {
        return value;
    }
    // Newton iteration from an overestimate; ceil(value / 2) cannot overflow
    uint64_t x = value;
    uint64_t y = value / 2 + (value & 1);
    while (y < x) {
        x = y;
        y = (x + value / x) / 2;
    }
    return x;
}

std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    if (a < 0 || b < 0) {
        return std::nullopt;
    }
    if (a > std::numeric_limits<Amount>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

std::string FormatAmount(Amount amount) {
    bool negative = amount < 0;
    // Unsigned magnitude so that the minimum value does not overflow
    uint64_t magnitude = negative ? (0 - static_cast<uint64_t>(amount))
                                  : static_cast<uint64_t>(amount);

    std::ostringstream oss;
    oss << (negative ? "-" : "") << magnitude / static_cast<uint64_t>(COIN) << ".";
    oss << std::setfill('0') << std::setw(8) << magnitude % static_cast<uint64_t>(COIN);
    return oss.str();
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dotPos = str.find('.');
    std::string wholePart = (dotPos != std::string::npos) ? str.substr(0, dotPos) : str;
    std::string fracPart = (dotPos != std::string::npos) ? str.substr(dotPos + 1) : "";

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (fracPart.size() > 8) {
        return std::nullopt;
    }
    for (char c : wholePart + fracPart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    while (fracPart.size() < 8) {
        fracPart += '0';
    }
    if (wholePart.size() > 11) {
        return std::nullopt;
    }

    int64_t whole = wholePart.empty() ? 0 : std::stoll(wholePart);
    if (whole > MAX_MONEY / COIN) {
        return std::nullopt;
    }
    int64_t frac = std::stoll(fracPart);
    Amount amount = whole * COIN + frac;
    if (!MoneyRange(amount)) {
        return std::nullopt;
    }
    return amount;
}

} // namespace arbiter
