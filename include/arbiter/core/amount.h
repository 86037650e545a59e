// ARBITER - Fixed-Point Amount Arithmetic
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Integer-only helpers for basis-point and pro-rata math. No floating point
// is used anywhere in the protocol.

#ifndef ARBITER_CORE_AMOUNT_H
#define ARBITER_CORE_AMOUNT_H

#include <arbiter/core/types.h>

#include <optional>
#include <string>

namespace arbiter {

/// 10000 basis points = 100%
constexpr int64_t BPS_DENOMINATOR = 10000;

/**
 * Compute floor(a * b / denom) with a 128-bit intermediate.
 *
 * @return 0 when denom is not positive or an operand is negative
 */
Amount MulDiv(Amount a, Amount b, Amount denom);

/// Apply a basis-point rate to an amount, rounding down
inline Amount ApplyBps(Amount amount, int64_t bps) {
    return MulDiv(amount, bps, BPS_DENOMINATOR);
}

/// Integer square root (floor)
uint64_t ISqrt(uint64_t value);

/// Checked addition; nullopt on overflow or a negative operand
std::optional<Amount> CheckedAdd(Amount a, Amount b);

/// Format amount as "12.34500000"
std::string FormatAmount(Amount amount);

/// Parse "12.345" into base units; nullopt on malformed input
std::optional<Amount> ParseAmount(const std::string& str);

} // namespace arbiter

#endif // ARBITER_CORE_AMOUNT_H
