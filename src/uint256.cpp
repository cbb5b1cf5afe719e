// =============================================================================
// uint256.cpp - 256-bit helpers for accumulators and wide X18 math
// =============================================================================

#include "omni/uint256.hpp"
#include <algorithm>

namespace omni {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;
constexpr U128 I128_MAX_U = (U128(1) << 127) - 1;

} // namespace

U256 U256::shl(const U256& v, unsigned bits) {
    if (bits == 0) return v;
    if (bits >= 256) return U256();
    if (bits >= 128) return U256(0, v.lo << (bits - 128));
    return U256(v.lo << bits, (v.hi << bits) | (v.lo >> (128 - bits)));
}

U256 U256::shr(const U256& v, unsigned bits) {
    if (bits == 0) return v;
    if (bits >= 256) return U256();
    if (bits >= 128) return U256(v.hi >> (bits - 128), 0);
    return U256((v.lo >> bits) | (v.hi << (128 - bits)), v.hi >> bits);
}

U256 U256::wrapping_add(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    U128 carry = r.lo < a.lo ? 1 : 0;
    r.hi = a.hi + b.hi + carry;
    return r;
}

U256 U256::wrapping_sub(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    U128 borrow = a.lo < b.lo ? 1 : 0;
    r.hi = a.hi - b.hi - borrow;
    return r;
}

U256 U256::div(const U256& num, U128 denom) {
    if (denom == 0) return U256();
    if (num.hi == 0) return U256(num.lo / denom);

    // Restoring long division, one bit per step
    U256 quot;
    U256 rem;
    U256 d(denom);
    for (int i = 255; i >= 0; --i) {
        rem = shl(rem, 1);
        U128 bit = i >= 128 ? (num.hi >> (i - 128)) & 1 : (num.lo >> i) & 1;
        rem.lo |= bit;
        if (rem >= d) {
            rem = wrapping_sub(rem, d);
            if (i >= 128) {
                quot.hi |= U128(1) << (i - 128);
            } else {
                quot.lo |= U128(1) << i;
            }
        }
    }
    return quot;
}

std::optional<U256> U256::mul(const U256& a, U128 b) {
    U256 low = mul_u128(a.lo, b);
    U256 high = mul_u128(a.hi, b);
    if (high.hi != 0) return std::nullopt;

    U128 sum = low.hi + high.lo;
    if (sum < low.hi) return std::nullopt;  // Carry out of bit 255
    return U256(low.lo, sum);
}

std::optional<U256> U256::from_string(const std::string& decimal) {
    if (decimal.empty()) return std::nullopt;

    U256 acc;
    for (char c : decimal) {
        if (c < '0' || c > '9') return std::nullopt;
        auto scaled = mul(acc, 10);
        if (!scaled) return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        U128 lo = scaled->lo + digit;
        U128 hi = scaled->hi + (lo < scaled->lo ? 1 : 0);
        if (hi < scaled->hi) return std::nullopt;
        acc = U256(lo, hi);
    }
    return acc;
}

std::string U256::to_string() const {
    if (hi == 0) return x18::to_string(lo);

    std::string out;
    U256 v = *this;
    while (!v.is_zero()) {
        U256 q = div(v, 10);
        auto back = mul(q, 10);
        U256 rem = wrapping_sub(v, *back);
        out.push_back(static_cast<char>('0' + static_cast<int>(rem.lo)));
        v = q;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// =============================================================================
// 128x128 -> 256 Multiply
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

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

std::optional<I128> mul_div(I128 a, I128 b, I128 denom) {
    if (denom == 0) return std::nullopt;

    bool neg = (a < 0) ^ (b < 0) ^ (denom < 0);
    U128 ua = a < 0 ? U128(0) - static_cast<U128>(a) : static_cast<U128>(a);
    U128 ub = b < 0 ? U128(0) - static_cast<U128>(b) : static_cast<U128>(b);
    U128 ud = denom < 0 ? U128(0) - static_cast<U128>(denom) : static_cast<U128>(denom);

    U256 quot = U256::div(mul_u128(ua, ub), ud);
    auto narrow = quot.to_u128();
    if (!narrow || *narrow > I128_MAX_U) return std::nullopt;

    I128 r = static_cast<I128>(*narrow);
    return neg ? -r : r;
}

} // namespace omni
