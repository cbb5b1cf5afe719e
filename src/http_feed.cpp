// =============================================================================
// http_feed.cpp - JSON-over-HTTP feed and pool collaborators
// =============================================================================

#include "omni/http_feed.hpp"
#include "omni/log.hpp"

#include <limits>
#include <stdexcept>

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace omni {

using json = nlohmann::json;

// HTTP client wrapper
class HttpClient {
public:
    explicit HttpClient(const std::string& base_url) : base_url_(base_url) {}

    json get(const std::string& path) {
        auto response = cpr::Get(cpr::Url{base_url_ + path}, cpr::Timeout{10000});

        if (response.error) {
            throw std::runtime_error(base_url_ + path + ": " + response.error.message);
        }
        if (response.status_code != 200) {
            throw std::runtime_error("HTTP " + std::to_string(response.status_code) +
                                     " from " + base_url_ + path + ": " + response.text);
        }

        try {
            return json::parse(response.text);
        } catch (const json::parse_error& e) {
            throw std::runtime_error(base_url_ + path + ": " + e.what());
        }
    }

private:
    std::string base_url_;
};

namespace {

const json& field(const json& body, const char* key) {
    if (!body.is_object() || !body.contains(key)) {
        throw std::runtime_error(std::string("response is missing '") + key + "'");
    }
    return body.at(key);
}

I128 signed_field(const json& body, const char* key) {
    const json& v = field(body, key);
    if (v.is_number_integer()) return static_cast<I128>(v.get<int64_t>());
    if (v.is_string()) {
        auto parsed = x18::parse(v.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::runtime_error(std::string("'") + key + "' is not an integer");
}

U256 wide_field(const json& body, const char* key) {
    const json& v = field(body, key);
    if (v.is_number_unsigned()) return U256{static_cast<U128>(v.get<uint64_t>()), 0};
    if (v.is_string()) {
        auto parsed = U256::from_string(v.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::runtime_error(std::string("'") + key + "' is not an unsigned integer");
}

U128 unsigned_field(const json& body, const char* key) {
    auto narrow = wide_field(body, key).to_u128();
    if (!narrow) throw std::runtime_error(std::string("'") + key + "' exceeds 128 bits");
    return *narrow;
}

uint64_t u64_field(const json& body, const char* key) {
    U128 v = unsigned_field(body, key);
    if (v > std::numeric_limits<uint64_t>::max()) {
        throw std::runtime_error(std::string("'") + key + "' exceeds 64 bits");
    }
    return static_cast<uint64_t>(v);
}

} // namespace

// =============================================================================
// HttpJsonFeed
// =============================================================================

HttpJsonFeed::HttpJsonFeed(const std::string& base_url)
    : http_(std::make_unique<HttpClient>(base_url)) {}

HttpJsonFeed::~HttpJsonFeed() = default;

RoundData HttpJsonFeed::latest_value() {
    return parse_round_data(http_->get("/latest"));
}

uint8_t HttpJsonFeed::decimal_count() {
    return parse_decimals(http_->get("/decimals"));
}

PushPrice HttpJsonFeed::price_for(const std::string& symbol) {
    return parse_push_price(http_->get("/price/" + symbol));
}

ReferenceRate HttpJsonFeed::reference_rate(const std::string& base, const std::string& quote) {
    return parse_reference_rate(http_->get("/reference/" + base + "/" + quote));
}

ProxyValue HttpJsonFeed::read() {
    return parse_proxy_value(http_->get("/read"));
}

ConfidencePrice HttpJsonFeed::price_unsafe(const std::string& id) {
    return parse_confidence_price(http_->get("/price_feeds/" + id));
}

RoundData HttpJsonFeed::parse_round_data(const json& body) {
    return RoundData{signed_field(body, "answer"), u64_field(body, "updated_at")};
}

uint8_t HttpJsonFeed::parse_decimals(const json& body) {
    uint64_t d = u64_field(body, "decimals");
    if (d > 255) throw std::runtime_error("'decimals' out of range");
    return static_cast<uint8_t>(d);
}

PushPrice HttpJsonFeed::parse_push_price(const json& body) {
    return PushPrice{u64_field(body, "price"), u64_field(body, "timestamp")};
}

ReferenceRate HttpJsonFeed::parse_reference_rate(const json& body) {
    return ReferenceRate{unsigned_field(body, "rate"), u64_field(body, "updated_base"),
                         u64_field(body, "updated_quote")};
}

ProxyValue HttpJsonFeed::parse_proxy_value(const json& body) {
    return ProxyValue{signed_field(body, "value"), u64_field(body, "timestamp")};
}

ConfidencePrice HttpJsonFeed::parse_confidence_price(const json& body) {
    I128 price = signed_field(body, "price");
    I128 expo = signed_field(body, "expo");
    if (price > std::numeric_limits<int64_t>::max() ||
        price < std::numeric_limits<int64_t>::min()) {
        throw std::runtime_error("'price' exceeds 64 bits");
    }
    if (expo > std::numeric_limits<int32_t>::max() ||
        expo < std::numeric_limits<int32_t>::min()) {
        throw std::runtime_error("'expo' out of range");
    }

    ConfidencePrice p{};
    p.price = static_cast<int64_t>(price);
    p.confidence = u64_field(body, "conf");
    p.exponent = static_cast<int32_t>(expo);
    p.publish_time = u64_field(body, "publish_time");
    return p;
}

// =============================================================================
// HttpJsonPool
// =============================================================================

HttpJsonPool::HttpJsonPool(const std::string& base_url)
    : http_(std::make_unique<HttpClient>(base_url)) {}

HttpJsonPool::~HttpJsonPool() = default;

PoolReserves HttpJsonPool::reserves() {
    return parse_reserves(http_->get("/reserves"));
}

Address HttpJsonPool::token0() {
    return parse_token(http_->get("/tokens"), "token0");
}

Address HttpJsonPool::token1() {
    return parse_token(http_->get("/tokens"), "token1");
}

U256 HttpJsonPool::cumulative_price0() {
    return parse_cumulative(http_->get("/cumulative"), "price0");
}

U256 HttpJsonPool::cumulative_price1() {
    return parse_cumulative(http_->get("/cumulative"), "price1");
}

PoolReserves HttpJsonPool::parse_reserves(const json& body) {
    uint64_t ts = u64_field(body, "block_timestamp_last");
    if (ts > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("'block_timestamp_last' exceeds 32 bits");
    }
    return PoolReserves{unsigned_field(body, "reserve0"), unsigned_field(body, "reserve1"),
                        static_cast<uint32_t>(ts)};
}

Address HttpJsonPool::parse_token(const json& body, const char* key) {
    const json& v = field(body, key);
    if (!v.is_string()) throw std::runtime_error(std::string("'") + key + "' is not a string");

    auto addr = parse_address(v.get<std::string>());
    if (!addr) throw std::runtime_error(std::string("'") + key + "' is not an address");
    return *addr;
}

U256 HttpJsonPool::parse_cumulative(const json& body, const char* key) {
    return wide_field(body, key);
}

// =============================================================================
// Collaborator Factory
// =============================================================================

Collaborators http_collaborators() {
    Collaborators c;

    c.bind_feed = [](FeedDirectory& directory, const FeedSettings& feed) {
        if (feed.url.empty()) return;

        auto http = std::make_shared<HttpJsonFeed>(feed.url);
        const Address& endpoint = feed.source.endpoint;
        switch (feed.source.kind) {
            case FeedKind::PULL_QUOTE:
                directory.bind(endpoint, std::static_pointer_cast<IPullQuoteFeed>(http));
                break;
            case FeedKind::PUSH_AGGREGATE:
                directory.bind(endpoint, std::static_pointer_cast<IPushAggregateFeed>(http));
                break;
            case FeedKind::PROXY_READ:
                directory.bind(endpoint, std::static_pointer_cast<IProxyReadFeed>(http));
                break;
            case FeedKind::CONFIDENCE_INTERVAL:
                directory.bind(endpoint, std::static_pointer_cast<IConfidenceFeed>(http));
                break;
        }
        log::get()->debug("feed {} bound to {}", feed.id, feed.url);
    };

    c.make_pool = [](const PoolSettings& pool) -> std::shared_ptr<ILiquidityPool> {
        if (pool.url.empty()) {
            throw std::runtime_error("pool " + to_hex(pool.address) + " has no url");
        }
        return std::make_shared<HttpJsonPool>(pool.url);
    };

    return c;
}

} // namespace omni
