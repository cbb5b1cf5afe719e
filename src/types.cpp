// =============================================================================
// types.cpp - Fixed-point helpers, reference parsing and enum names
// =============================================================================

#include "omni/types.hpp"
#include <algorithm>
#include <cctype>

namespace omni {

namespace {

constexpr I128 I128_MAX = static_cast<I128>((U128(1) << 127) - 1);

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

// =============================================================================
// X18 Helpers
// =============================================================================

namespace x18 {

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v >= 0) return to_string(static_cast<U128>(v));
    // Negate through unsigned to stay defined for the minimum value
    U128 mag = U128(0) - static_cast<U128>(v);
    return "-" + to_string(mag);
}

std::optional<I128> parse(const std::string& s) {
    if (s.empty()) return std::nullopt;

    size_t pos = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = s[0] == '-';
        pos = 1;
    }
    if (pos == s.size()) return std::nullopt;

    U128 limit = neg ? (U128(1) << 127) : static_cast<U128>(I128_MAX);
    U128 acc = 0;
    for (; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (acc > (limit - digit) / 10) return std::nullopt;
        acc = acc * 10 + digit;
    }

    if (neg) return static_cast<I128>(U128(0) - acc);
    return static_cast<I128>(acc);
}

std::optional<I128> rescale(I128 value, int32_t decimals) {
    if (decimals == X18_DECIMALS) return value;

    if (decimals < X18_DECIMALS) {
        I128 factor = pow10(X18_DECIMALS - decimals);
        if (factor == 0) return std::nullopt;
        if (abs(value) > I128_MAX / factor) return std::nullopt;
        return value * factor;
    }

    I128 divisor = pow10(decimals - X18_DECIMALS);
    if (divisor == 0) return I128(0);  // Below 10^-38 resolution
    return value / divisor;
}

} // namespace x18

// =============================================================================
// Address Helpers
// =============================================================================

std::optional<Address> parse_address(const std::string& hex) {
    if (hex.size() != 42 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        return std::nullopt;
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 + 2 * i]);
        int lo = hex_value(hex[3 + 2 * i]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& a) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : a) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(FeedKind kind) {
    switch (kind) {
        case FeedKind::PULL_QUOTE: return "pull_quote";
        case FeedKind::PUSH_AGGREGATE: return "push_aggregate";
        case FeedKind::PROXY_READ: return "proxy_read";
        case FeedKind::CONFIDENCE_INTERVAL: return "confidence_interval";
    }
    return "unknown";
}

std::optional<FeedKind> parse_feed_kind(const std::string& name) {
    std::string n = lower(name);
    if (n == "pull_quote") return FeedKind::PULL_QUOTE;
    if (n == "push_aggregate") return FeedKind::PUSH_AGGREGATE;
    if (n == "proxy_read") return FeedKind::PROXY_READ;
    if (n == "confidence_interval") return FeedKind::CONFIDENCE_INTERVAL;
    return std::nullopt;
}

const char* to_string(OracleMode mode) {
    switch (mode) {
        case OracleMode::UNINITIALIZED: return "uninitialized";
        case OracleMode::PRODUCER: return "producer";
        case OracleMode::CONSUMER: return "consumer";
    }
    return "unknown";
}

std::optional<OracleMode> parse_mode(const std::string& name) {
    std::string n = lower(name);
    if (n == "producer") return OracleMode::PRODUCER;
    if (n == "consumer") return OracleMode::CONSUMER;
    if (n == "uninitialized") return OracleMode::UNINITIALIZED;
    return std::nullopt;
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case SOURCE_UNAVAILABLE: return "source unavailable";
        case SOURCE_STALE: return "source stale";
        case INSUFFICIENT_SOURCES: return "insufficient sources";
        case INVALID_CONFIGURATION: return "invalid configuration";
        case SOURCE_NOT_FOUND: return "source not found";
        case SOURCE_ALREADY_EXISTS: return "source already exists";
        case RATIO_UNDEFINED: return "ratio undefined";
        case INVALID_PRICE: return "invalid price";
        case INVALID_MODE: return "invalid mode";
        case INVALID_MODE_TRANSITION: return "invalid mode transition";
        case EMERGENCY_ACTIVE: return "emergency mode active";
        case CIRCUIT_BREAKER_TRIPPED: return "circuit breaker tripped";
        case DEVIATION_EXCEEDED: return "deviation exceeded";
        case READ_CHANNEL_UNSET: return "read channel unset";
        case PEER_INACTIVE: return "peer inactive";
        case PEER_NOT_CONFIGURED: return "peer not configured";
        case INVALID_TIMESTAMP: return "invalid timestamp";
        case STALE_CROSS_CHAIN_DATA: return "stale cross-chain data";
        case UNKNOWN_REQUEST: return "unknown request";
        case REQUEST_EXPIRED: return "request expired";
        case MALFORMED_PAYLOAD: return "malformed payload";
        case PEER_DISAGREEMENT: return "peer disagreement";
        case REENTRANCY: return "reentrancy";
    }
    return "unknown error";
}

} // namespace errors

} // namespace omni
