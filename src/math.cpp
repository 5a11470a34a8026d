// =============================================================================
// math.cpp - Overflow-checked fixed-point helpers
// =============================================================================

#include "lendcore/math.hpp"

namespace lendcore {
namespace fixed {

namespace {

constexpr U128 LOW64 = 0xFFFFFFFFFFFFFFFFULL;

// Full 256-bit product of two 128-bit operands, as (hi, lo)
void mul_wide(U128 a, U128 b, U128& hi, U128& lo) {
    U128 a0 = a & LOW64, a1 = a >> 64;
    U128 b0 = b & LOW64, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & LOW64) + (p10 & LOW64);

    lo = (mid << 64) | (p00 & LOW64);
    hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
}

} // namespace

int32_t mul_div(U128 a, U128 b, U128 c, U128& out) {
    if (c == 0) return errors::DIVISION_BY_ZERO;

    U128 hi = 0, lo = 0;
    mul_wide(a, b, hi, lo);

    if (hi == 0) {
        out = lo / c;
        return errors::OK;
    }

    // Quotient fits in 128 bits only if hi < c
    if (hi >= c) return errors::ARITHMETIC_OVERFLOW;

    // Restoring long division of (hi:lo) by c, remainder seeded with hi
    U128 rem = hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((lo >> i) & 1);
        if (carry || rem >= c) {
            rem -= c;
            quot |= static_cast<U128>(1) << i;
        }
    }

    out = quot;
    return errors::OK;
}

std::optional<U128> mul_div(U128 a, U128 b, U128 c) {
    U128 out = 0;
    if (mul_div(a, b, c, out) != errors::OK) return std::nullopt;
    return out;
}

std::optional<U128> pow10(uint32_t exp) {
    if (exp > 38) return std::nullopt;
    U128 result = 1;
    for (uint32_t i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace fixed
} // namespace lendcore
