#ifndef CPAMM_MATH_HPP
#define CPAMM_MATH_HPP

#include <utility>

#include "types.hpp"

namespace cpamm {
namespace math {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator>=(const U256& other) const { return !(*this < other); }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 256-bit product of two U128 values
U256 mul_u128(U128 a, U128 b);

// Quotient and remainder of num / denom.
// Throws std::domain_error on a zero denominator and std::overflow_error
// if the quotient does not fit in 128 bits.
std::pair<U128, U128> divmod(const U256& num, U128 denom);

// floor(a * b / denom) with a 256-bit intermediate
U128 mul_div(U128 a, U128 b, U128 denom);

// ceil(a * b / denom)
U128 mul_div_up(U128 a, U128 b, U128 denom);

// floor(sqrt(x)); the root of a 256-bit value always fits in 128 bits
U128 isqrt(const U256& x);

// a + b, throwing std::overflow_error on wrap
U128 checked_add(U128 a, U128 b);

} // namespace math
} // namespace cpamm

#endif // CPAMM_MATH_HPP
