#ifndef OMNI_TYPES_HPP
#define OMNI_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <optional>

namespace omni {

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr int32_t X18_DECIMALS = 18;

// Largest power of ten representable in I128 is 10^38
constexpr int32_t MAX_POW10 = 38;

namespace x18 {

// 10^n for n in [0, 38]; 0 when out of range
constexpr I128 pow10(int32_t n) {
    if (n < 0 || n > MAX_POW10) return 0;
    I128 r = 1;
    for (int32_t i = 0; i < n; ++i) r *= 10;
    return r;
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline I128 abs(I128 v) { return v < 0 ? -v : v; }

// Decimal rendering of a raw 128-bit integer (fmt/iostream lack __int128)
std::string to_string(I128 v);
std::string to_string(U128 v);

// Parse a base-10 integer; nullopt on empty input, junk or overflow
std::optional<I128> parse(const std::string& s);

// value * 10^(18 - decimals), truncating; nullopt on overflow
std::optional<I128> rescale(I128 value, int32_t decimals);

} // namespace x18

// =============================================================================
// References (EVM 20-byte addresses) and Chain Identifiers
// =============================================================================

using Address = std::array<uint8_t, 20>;
using ChainId = uint32_t;

inline bool is_zero(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// "0x" + 40 hex digits, case-insensitive; nullopt otherwise
std::optional<Address> parse_address(const std::string& hex);
std::string to_hex(const Address& a);

// =============================================================================
// Feed Sources
// =============================================================================

enum class FeedKind : uint8_t {
    PULL_QUOTE = 0,           // Round-based latest-value feed
    PUSH_AGGREGATE = 1,       // Externally pushed reference feed
    PROXY_READ = 2,           // Single read-call feed at 1e18
    CONFIDENCE_INTERVAL = 3   // Price + exponent feed
};

constexpr size_t FEED_KIND_COUNT = 4;

const char* to_string(FeedKind kind);
std::optional<FeedKind> parse_feed_kind(const std::string& name);

constexpr uint32_t MAX_SOURCE_WEIGHT = 255;

struct FeedSource {
    FeedKind kind = FeedKind::PULL_QUOTE;
    Address endpoint{};             // Collaborator reference
    uint32_t weight = 0;            // 0..255
    uint64_t max_staleness = 0;     // Seconds
    bool active = true;
    std::string extra;              // Price id (confidence) or symbol (push)
};

// One adapter call's output
struct NormalizedQuote {
    I128 price_x18 = 0;
    bool valid = false;
    int32_t error = 0;              // errors::* when !valid
};

// =============================================================================
// Oracle Mode
// =============================================================================

enum class OracleMode : uint8_t {
    UNINITIALIZED = 0,
    PRODUCER = 1,       // Aggregates locally
    CONSUMER = 2        // Ingests peer-published prices
};

const char* to_string(OracleMode mode);
std::optional<OracleMode> parse_mode(const std::string& name);

// =============================================================================
// Time Windows (seconds)
// =============================================================================

namespace windows {
constexpr uint64_t DEFAULT_STALENESS = 3600;     // Feed staleness bound
constexpr uint64_t FALLBACK_MAX_AGE = 86400;     // Fallback cache usability
constexpr uint64_t LATEST_MAX_AGE = 86400;       // latest_price() cutoff
constexpr uint64_t LOCAL_FRESHNESS = 3600;       // validate() local window
constexpr uint64_t PEER_FRESHNESS = 3600;        // Peer price validity
constexpr uint64_t DEFAULT_TWAP_PERIOD = 1800;
constexpr uint64_t DEFAULT_REQUEST_TTL = 3600;
}

constexpr uint8_t MIN_VALID_SOURCES_LIMIT = 4;
constexpr uint32_t BPS_DENOMINATOR = 10000;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t SOURCE_UNAVAILABLE = -1;
constexpr int32_t SOURCE_STALE = -2;
constexpr int32_t INSUFFICIENT_SOURCES = -3;
constexpr int32_t INVALID_CONFIGURATION = -4;
constexpr int32_t SOURCE_NOT_FOUND = -5;
constexpr int32_t SOURCE_ALREADY_EXISTS = -6;
constexpr int32_t RATIO_UNDEFINED = -7;
constexpr int32_t INVALID_PRICE = -8;
constexpr int32_t INVALID_MODE = -10;
constexpr int32_t INVALID_MODE_TRANSITION = -11;
constexpr int32_t EMERGENCY_ACTIVE = -12;
constexpr int32_t CIRCUIT_BREAKER_TRIPPED = -13;
constexpr int32_t DEVIATION_EXCEEDED = -14;
constexpr int32_t READ_CHANNEL_UNSET = -20;
constexpr int32_t PEER_INACTIVE = -21;
constexpr int32_t PEER_NOT_CONFIGURED = -22;
constexpr int32_t INVALID_TIMESTAMP = -23;
constexpr int32_t STALE_CROSS_CHAIN_DATA = -24;
constexpr int32_t UNKNOWN_REQUEST = -25;
constexpr int32_t REQUEST_EXPIRED = -26;
constexpr int32_t MALFORMED_PAYLOAD = -27;
constexpr int32_t PEER_DISAGREEMENT = -28;
constexpr int32_t REENTRANCY = -30;

const char* to_string(int32_t code);
}

} // namespace omni

#endif // OMNI_TYPES_HPP
