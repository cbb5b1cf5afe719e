// =============================================================================
// sources.cpp - Feed adapters normalizing external quotes to X18
// =============================================================================

#include "omni/sources.hpp"
#include "omni/log.hpp"

#include <algorithm>
#include <exception>

namespace omni {

// =============================================================================
// Shared Quote Checks
// =============================================================================

NormalizedQuote invalid_quote(int32_t error) {
    NormalizedQuote q;
    q.price_x18 = 0;
    q.valid = false;
    q.error = error;
    return q;
}

bool is_stale(uint64_t updated_at, uint64_t now, uint64_t max_staleness) {
    // A report from the future cannot be aged
    if (updated_at > now) return true;
    return now - updated_at > max_staleness;
}

namespace {

NormalizedQuote valid_quote(I128 price_x18) {
    NormalizedQuote q;
    q.price_x18 = price_x18;
    q.valid = true;
    q.error = errors::OK;
    return q;
}

NormalizedQuote from_scaled(const std::optional<I128>& scaled) {
    if (!scaled || *scaled <= 0) return invalid_quote(errors::INVALID_PRICE);
    return valid_quote(*scaled);
}

void log_failure(const FeedSource& source, const char* call, const std::exception& e) {
    log::get()->warn("{} feed {} {} failed: {}", to_string(source.kind),
                     to_hex(source.endpoint), call, e.what());
}

} // namespace

// =============================================================================
// FeedDirectory
// =============================================================================

void FeedDirectory::bind(const Address& endpoint, std::shared_ptr<IPullQuoteFeed> feed) {
    pull_quotes_[endpoint] = std::move(feed);
}

void FeedDirectory::bind(const Address& endpoint, std::shared_ptr<IPushAggregateFeed> feed) {
    push_aggregates_[endpoint] = std::move(feed);
}

void FeedDirectory::bind(const Address& endpoint, std::shared_ptr<IProxyReadFeed> feed) {
    proxy_reads_[endpoint] = std::move(feed);
}

void FeedDirectory::bind(const Address& endpoint, std::shared_ptr<IConfidenceFeed> feed) {
    confidences_[endpoint] = std::move(feed);
}

std::shared_ptr<IPullQuoteFeed> FeedDirectory::pull_quote(const Address& endpoint) const {
    auto it = pull_quotes_.find(endpoint);
    return it == pull_quotes_.end() ? nullptr : it->second;
}

std::shared_ptr<IPushAggregateFeed> FeedDirectory::push_aggregate(const Address& endpoint) const {
    auto it = push_aggregates_.find(endpoint);
    return it == push_aggregates_.end() ? nullptr : it->second;
}

std::shared_ptr<IProxyReadFeed> FeedDirectory::proxy_read(const Address& endpoint) const {
    auto it = proxy_reads_.find(endpoint);
    return it == proxy_reads_.end() ? nullptr : it->second;
}

std::shared_ptr<IConfidenceFeed> FeedDirectory::confidence(const Address& endpoint) const {
    auto it = confidences_.find(endpoint);
    return it == confidences_.end() ? nullptr : it->second;
}

// =============================================================================
// PullQuote: latest answer + reported decimals
// =============================================================================

NormalizedQuote PullQuoteAdapter::fetch(const FeedSource& source, uint64_t now) const {
    auto feed = directory_.pull_quote(source.endpoint);
    if (!feed) return invalid_quote(errors::SOURCE_UNAVAILABLE);

    RoundData round{};
    try {
        round = feed->latest_value();
    } catch (const std::exception& e) {
        log_failure(source, "latest_value", e);
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    if (round.answer <= 0) return invalid_quote(errors::INVALID_PRICE);
    if (is_stale(round.updated_at, now, source.max_staleness)) {
        return invalid_quote(errors::SOURCE_STALE);
    }

    uint8_t decimals = FALLBACK_DECIMALS;
    try {
        decimals = feed->decimal_count();
    } catch (const std::exception& e) {
        log::get()->debug("pull_quote feed {} decimals unavailable, assuming {}: {}",
                          to_hex(source.endpoint), FALLBACK_DECIMALS, e.what());
        decimals = FALLBACK_DECIMALS;
    }

    return from_scaled(x18::rescale(round.answer, decimals));
}

// =============================================================================
// PushAggregate: structured call first, legacy reference rate second
// =============================================================================

std::optional<NormalizedQuote> PushAggregateAdapter::fetch_structured(
        IPushAggregateFeed& feed, const FeedSource& source, uint64_t now) const {
    PushPrice price{};
    try {
        price = feed.price_for(source.extra);
    } catch (const std::exception& e) {
        log_failure(source, "price_for", e);
        return std::nullopt;
    }

    // Zero price or timestamp is a format mismatch: try the legacy call
    if (price.price_e9 == 0 || price.timestamp == 0) return std::nullopt;

    if (is_stale(price.timestamp, now, source.max_staleness)) {
        return invalid_quote(errors::SOURCE_STALE);
    }
    return from_scaled(x18::rescale(static_cast<I128>(price.price_e9), 9));
}

NormalizedQuote PushAggregateAdapter::fetch_legacy(IPushAggregateFeed& feed,
                                                   const FeedSource& source,
                                                   uint64_t now) const {
    ReferenceRate rate{};
    try {
        rate = feed.reference_rate(source.extra, QUOTE_SYMBOL);
    } catch (const std::exception& e) {
        log_failure(source, "reference_rate", e);
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    if (rate.rate_x18 == 0) return invalid_quote(errors::INVALID_PRICE);
    if (rate.rate_x18 > static_cast<U128>((U128(1) << 127) - 1)) {
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    uint64_t updated = std::max(rate.updated_base, rate.updated_quote);
    if (is_stale(updated, now, source.max_staleness)) {
        return invalid_quote(errors::SOURCE_STALE);
    }
    return valid_quote(static_cast<I128>(rate.rate_x18));
}

NormalizedQuote PushAggregateAdapter::fetch(const FeedSource& source, uint64_t now) const {
    auto feed = directory_.push_aggregate(source.endpoint);
    if (!feed) return invalid_quote(errors::SOURCE_UNAVAILABLE);

    auto structured = fetch_structured(*feed, source, now);
    if (structured) return *structured;
    return fetch_legacy(*feed, source, now);
}

// =============================================================================
// ProxyRead: value already at 1e18
// =============================================================================

NormalizedQuote ProxyReadAdapter::fetch(const FeedSource& source, uint64_t now) const {
    auto feed = directory_.proxy_read(source.endpoint);
    if (!feed) return invalid_quote(errors::SOURCE_UNAVAILABLE);

    ProxyValue value{};
    try {
        value = feed->read();
    } catch (const std::exception& e) {
        log_failure(source, "read", e);
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    if (value.value_x18 <= 0) return invalid_quote(errors::INVALID_PRICE);
    if (value.timestamp == 0) return invalid_quote(errors::SOURCE_UNAVAILABLE);
    if (is_stale(value.timestamp, now, source.max_staleness)) {
        return invalid_quote(errors::SOURCE_STALE);
    }
    return valid_quote(value.value_x18);
}

// =============================================================================
// ConfidenceInterval: price * 10^(18 + exponent)
// =============================================================================

NormalizedQuote ConfidenceIntervalAdapter::fetch(const FeedSource& source, uint64_t now) const {
    auto feed = directory_.confidence(source.endpoint);
    if (!feed) return invalid_quote(errors::SOURCE_UNAVAILABLE);

    ConfidencePrice price{};
    try {
        price = feed->price_unsafe(source.extra);
    } catch (const std::exception& e) {
        log_failure(source, "price_unsafe", e);
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    if (price.price <= 0) return invalid_quote(errors::INVALID_PRICE);
    if (is_stale(price.publish_time, now, source.max_staleness)) {
        return invalid_quote(errors::SOURCE_STALE);
    }
    if (price.exponent < -MAX_POW10 * 2 || price.exponent > MAX_POW10 * 2) {
        return invalid_quote(errors::SOURCE_UNAVAILABLE);
    }

    // 18 + exponent >= 0 multiplies, otherwise divides
    return from_scaled(x18::rescale(static_cast<I128>(price.price), -price.exponent));
}

// =============================================================================
// AdapterTable
// =============================================================================

AdapterTable AdapterTable::with_defaults(const FeedDirectory& directory) {
    AdapterTable table;
    table.install(std::make_unique<PullQuoteAdapter>(directory));
    table.install(std::make_unique<PushAggregateAdapter>(directory));
    table.install(std::make_unique<ProxyReadAdapter>(directory));
    table.install(std::make_unique<ConfidenceIntervalAdapter>(directory));
    return table;
}

void AdapterTable::install(std::unique_ptr<IFeedAdapter> adapter) {
    if (!adapter) return;
    size_t slot = static_cast<size_t>(adapter->kind());
    adapters_[slot] = std::move(adapter);
}

const IFeedAdapter* AdapterTable::find(FeedKind kind) const {
    size_t slot = static_cast<size_t>(kind);
    if (slot >= adapters_.size()) return nullptr;
    return adapters_[slot].get();
}

NormalizedQuote AdapterTable::fetch(const FeedSource& source, uint64_t now) const {
    const IFeedAdapter* adapter = find(source.kind);
    if (!adapter) return invalid_quote(errors::SOURCE_UNAVAILABLE);
    return adapter->fetch(source, now);
}

} // namespace omni
