#ifndef OMNI_UINT256_HPP
#define OMNI_UINT256_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace omni {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
//
// Carries on-chain cumulative price accumulators (UQ112x112 * seconds) and the
// wide intermediates of X18 multiply-then-divide.
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
    bool operator>=(const U256& other) const {
        return !(*this < other);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }

    static U256 shl(const U256& v, unsigned bits);
    static U256 shr(const U256& v, unsigned bits);

    // Modular arithmetic (accumulators are allowed to wrap)
    static U256 wrapping_add(const U256& a, const U256& b);
    static U256 wrapping_sub(const U256& a, const U256& b);

    // Full 256-bit quotient; zero when denom == 0
    static U256 div(const U256& num, U128 denom);

    // nullopt when the product does not fit in 256 bits
    static std::optional<U256> mul(const U256& a, U128 b);

    std::optional<U128> to_u128() const {
        if (hi != 0) return std::nullopt;
        return lo;
    }

    static std::optional<U256> from_string(const std::string& decimal);
    std::string to_string() const;
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b);

// a * b / denom with a 256-bit intermediate, truncating toward zero;
// nullopt on denom == 0 or a result outside I128
std::optional<I128> mul_div(I128 a, I128 b, I128 denom);

} // namespace omni

#endif // OMNI_UINT256_HPP
