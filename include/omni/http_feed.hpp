#ifndef OMNI_HTTP_FEED_HPP
#define OMNI_HTTP_FEED_HPP

#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "sources.hpp"
#include "liquidity.hpp"
#include "config.hpp"

namespace omni {

// =============================================================================
// HTTP Collaborators
//
// JSON-over-HTTP stand-ins for on-chain feeds and pools. Integers may be JSON
// numbers or decimal strings so 128/256-bit values survive the trip.
// Transport, HTTP and format errors throw std::runtime_error.
// =============================================================================

class HttpClient;

class HttpJsonFeed : public IPullQuoteFeed,
                     public IPushAggregateFeed,
                     public IProxyReadFeed,
                     public IConfidenceFeed {
public:
    explicit HttpJsonFeed(const std::string& base_url);
    ~HttpJsonFeed() override;

    // IPullQuoteFeed: GET /latest, GET /decimals
    RoundData latest_value() override;
    uint8_t decimal_count() override;

    // IPushAggregateFeed: GET /price/{symbol}, GET /reference/{base}/{quote}
    PushPrice price_for(const std::string& symbol) override;
    ReferenceRate reference_rate(const std::string& base, const std::string& quote) override;

    // IProxyReadFeed: GET /read
    ProxyValue read() override;

    // IConfidenceFeed: GET /price_feeds/{id}
    ConfidencePrice price_unsafe(const std::string& id) override;

    // Response parsing
    static RoundData parse_round_data(const nlohmann::json& body);
    static uint8_t parse_decimals(const nlohmann::json& body);
    static PushPrice parse_push_price(const nlohmann::json& body);
    static ReferenceRate parse_reference_rate(const nlohmann::json& body);
    static ProxyValue parse_proxy_value(const nlohmann::json& body);
    static ConfidencePrice parse_confidence_price(const nlohmann::json& body);

private:
    std::unique_ptr<HttpClient> http_;
};

class HttpJsonPool : public ILiquidityPool {
public:
    explicit HttpJsonPool(const std::string& base_url);
    ~HttpJsonPool() override;

    // GET /reserves
    PoolReserves reserves() override;

    // GET /tokens
    Address token0() override;
    Address token1() override;

    // GET /cumulative
    U256 cumulative_price0() override;
    U256 cumulative_price1() override;

    static PoolReserves parse_reserves(const nlohmann::json& body);
    static Address parse_token(const nlohmann::json& body, const char* key);
    static U256 parse_cumulative(const nlohmann::json& body, const char* key);

private:
    std::unique_ptr<HttpClient> http_;
};

// Feeds and pools with a url become HTTP collaborators
Collaborators http_collaborators();

} // namespace omni

#endif // OMNI_HTTP_FEED_HPP
