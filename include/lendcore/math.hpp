#ifndef LENDCORE_MATH_HPP
#define LENDCORE_MATH_HPP

#include <optional>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// Fixed-Point Constants
// =============================================================================

constexpr U128 WAD = 1000000000000000000ULL;  // 1e18
constexpr U128 BPS_DENOMINATOR = 10000;       // 100% in basis points
constexpr uint64_t SECONDS_PER_DAY = 86400;

// =============================================================================
// Checked Arithmetic
//
// Every helper reports overflow through std::nullopt. Nothing here wraps,
// saturates or truncates silently.
// =============================================================================

namespace fixed {

inline std::optional<U128> checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) return std::nullopt;
    return a + b;
}

inline std::optional<U128> checked_sub(U128 a, U128 b) {
    if (b > a) return std::nullopt;
    return a - b;
}

inline std::optional<U128> checked_mul(U128 a, U128 b) {
    if (a == 0 || b == 0) return static_cast<U128>(0);
    if (a > U128_MAX / b) return std::nullopt;
    return a * b;
}

// floor(a * b / c) with a 256-bit intermediate product.
// nullopt when c == 0 or the quotient does not fit in 128 bits.
std::optional<U128> mul_div(U128 a, U128 b, U128 c);

// Same as mul_div but distinguishes the two failure modes
int32_t mul_div(U128 a, U128 b, U128 c, U128& out);

// 10^exp for exp <= 38
std::optional<U128> pow10(uint32_t exp);

// amount * bps / 10000, floored
inline std::optional<U128> apply_bps(U128 amount, U128 bps) {
    return mul_div(amount, bps, BPS_DENOMINATOR);
}

} // namespace fixed

} // namespace lendcore

#endif // LENDCORE_MATH_HPP
