// =============================================================================
// math.cpp - Exact 128/256-bit integer arithmetic for pool pricing
// =============================================================================

#include "cpamm/math.hpp"

#include <stdexcept>

namespace cpamm {
namespace math {

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

std::pair<U128, U128> divmod(const U256& num, U128 denom) {
    if (denom == 0) {
        throw std::domain_error("cpamm: division by zero");
    }
    if (num.hi == 0) {
        return {num.lo / denom, num.lo % denom};
    }
    if (num.hi >= denom) {
        throw std::overflow_error("cpamm: quotient exceeds 128 bits");
    }

    // Binary long division over the low limb; the remainder starts as the
    // high limb (already < denom) and stays below denom
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        // With carry set the true remainder is 2^128 + rem, which exceeds
        // denom; wrapping subtraction yields the right value
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return {quot, rem};
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    return divmod(mul_u128(a, b), denom).first;
}

U128 mul_div_up(U128 a, U128 b, U128 denom) {
    auto [quot, rem] = divmod(mul_u128(a, b), denom);
    if (rem != 0) {
        quot = checked_add(quot, 1);
    }
    return quot;
}

U128 isqrt(const U256& x) {
    if (x.is_zero()) return 0;

    // Greedy bit assignment from the top: keep a bit if its square fits
    U128 root = 0;
    for (int bit = 127; bit >= 0; --bit) {
        U128 candidate = root | (U128(1) << bit);
        if (mul_u128(candidate, candidate) <= x) {
            root = candidate;
        }
    }
    return root;
}

U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw std::overflow_error("cpamm: amount exceeds 128 bits");
    }
    return a + b;
}

} // namespace math
} // namespace cpamm
