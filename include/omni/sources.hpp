#ifndef OMNI_SOURCES_HPP
#define OMNI_SOURCES_HPP

#include <array>
#include <memory>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace omni {

// =============================================================================
// Feed Collaborator Contracts
//
// Implementations report transport or format failures by throwing an exception
// derived from std::exception. Adapters convert those into invalid quotes.
// =============================================================================

struct RoundData {
    I128 answer;
    uint64_t updated_at;
};

class IPullQuoteFeed {
public:
    virtual ~IPullQuoteFeed() = default;
    virtual RoundData latest_value() = 0;
    virtual uint8_t decimal_count() = 0;
};

struct PushPrice {
    uint64_t price_e9;       // Price at 1e9
    uint64_t timestamp;
};

struct ReferenceRate {
    U128 rate_x18;           // Rate at 1e18
    uint64_t updated_base;
    uint64_t updated_quote;
};

class IPushAggregateFeed {
public:
    virtual ~IPushAggregateFeed() = default;
    virtual PushPrice price_for(const std::string& symbol) = 0;
    virtual ReferenceRate reference_rate(const std::string& base, const std::string& quote) = 0;
};

struct ProxyValue {
    I128 value_x18;
    uint64_t timestamp;
};

class IProxyReadFeed {
public:
    virtual ~IProxyReadFeed() = default;
    virtual ProxyValue read() = 0;
};

struct ConfidencePrice {
    int64_t price;
    uint64_t confidence;
    int32_t exponent;
    uint64_t publish_time;
};

class IConfidenceFeed {
public:
    virtual ~IConfidenceFeed() = default;
    virtual ConfidencePrice price_unsafe(const std::string& id) = 0;
};

// =============================================================================
// FeedDirectory - endpoint reference -> bound collaborator
// =============================================================================

class FeedDirectory {
public:
    void bind(const Address& endpoint, std::shared_ptr<IPullQuoteFeed> feed);
    void bind(const Address& endpoint, std::shared_ptr<IPushAggregateFeed> feed);
    void bind(const Address& endpoint, std::shared_ptr<IProxyReadFeed> feed);
    void bind(const Address& endpoint, std::shared_ptr<IConfidenceFeed> feed);

    std::shared_ptr<IPullQuoteFeed> pull_quote(const Address& endpoint) const;
    std::shared_ptr<IPushAggregateFeed> push_aggregate(const Address& endpoint) const;
    std::shared_ptr<IProxyReadFeed> proxy_read(const Address& endpoint) const;
    std::shared_ptr<IConfidenceFeed> confidence(const Address& endpoint) const;

private:
    std::unordered_map<Address, std::shared_ptr<IPullQuoteFeed>, AddressHash> pull_quotes_;
    std::unordered_map<Address, std::shared_ptr<IPushAggregateFeed>, AddressHash> push_aggregates_;
    std::unordered_map<Address, std::shared_ptr<IProxyReadFeed>, AddressHash> proxy_reads_;
    std::unordered_map<Address, std::shared_ptr<IConfidenceFeed>, AddressHash> confidences_;
};

// =============================================================================
// Feed Adapter Interface
//
// fetch() never throws: every failure is reported through NormalizedQuote.
// =============================================================================

class IFeedAdapter {
public:
    virtual ~IFeedAdapter() = default;

    virtual FeedKind kind() const = 0;
    virtual NormalizedQuote fetch(const FeedSource& source, uint64_t now) const = 0;
};

class PullQuoteAdapter : public IFeedAdapter {
public:
    explicit PullQuoteAdapter(const FeedDirectory& directory) : directory_(directory) {}

    FeedKind kind() const override { return FeedKind::PULL_QUOTE; }
    NormalizedQuote fetch(const FeedSource& source, uint64_t now) const override;

    // Decimal count assumed when the feed cannot report one
    static constexpr uint8_t FALLBACK_DECIMALS = 8;

private:
    const FeedDirectory& directory_;
};

class PushAggregateAdapter : public IFeedAdapter {
public:
    explicit PushAggregateAdapter(const FeedDirectory& directory) : directory_(directory) {}

    FeedKind kind() const override { return FeedKind::PUSH_AGGREGATE; }
    NormalizedQuote fetch(const FeedSource& source, uint64_t now) const override;

    static constexpr const char* QUOTE_SYMBOL = "USD";

private:
    std::optional<NormalizedQuote> fetch_structured(IPushAggregateFeed& feed,
                                                    const FeedSource& source,
                                                    uint64_t now) const;
    NormalizedQuote fetch_legacy(IPushAggregateFeed& feed, const FeedSource& source,
                                 uint64_t now) const;

    const FeedDirectory& directory_;
};

class ProxyReadAdapter : public IFeedAdapter {
public:
    explicit ProxyReadAdapter(const FeedDirectory& directory) : directory_(directory) {}

    FeedKind kind() const override { return FeedKind::PROXY_READ; }
    NormalizedQuote fetch(const FeedSource& source, uint64_t now) const override;

private:
    const FeedDirectory& directory_;
};

class ConfidenceIntervalAdapter : public IFeedAdapter {
public:
    explicit ConfidenceIntervalAdapter(const FeedDirectory& directory) : directory_(directory) {}

    FeedKind kind() const override { return FeedKind::CONFIDENCE_INTERVAL; }
    NormalizedQuote fetch(const FeedSource& source, uint64_t now) const override;

private:
    const FeedDirectory& directory_;
};

// =============================================================================
// AdapterTable - dispatch keyed by FeedKind
// =============================================================================

class AdapterTable {
public:
    AdapterTable() = default;

    // One adapter per kind, all resolving through `directory`
    static AdapterTable with_defaults(const FeedDirectory& directory);

    // Replaces the adapter registered for adapter->kind()
    void install(std::unique_ptr<IFeedAdapter> adapter);

    const IFeedAdapter* find(FeedKind kind) const;

    // Dispatch; SOURCE_UNAVAILABLE when no adapter handles the kind
    NormalizedQuote fetch(const FeedSource& source, uint64_t now) const;

private:
    std::array<std::unique_ptr<IFeedAdapter>, FEED_KIND_COUNT> adapters_;
};

// Shared quote checks
NormalizedQuote invalid_quote(int32_t error);
bool is_stale(uint64_t updated_at, uint64_t now, uint64_t max_staleness);

} // namespace omni

#endif // OMNI_SOURCES_HPP
