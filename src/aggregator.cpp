// =============================================================================
// aggregator.cpp - Weighted multi-source aggregation with fallback ladder
// =============================================================================

#include "omni/aggregator.hpp"
#include "omni/log.hpp"
#include "omni/uint256.hpp"

namespace omni {

const char* to_string(AggregationTier tier) {
    switch (tier) {
        case AggregationTier::LIVE: return "live";
        case AggregationTier::SINGLE_SOURCE: return "single_source";
        case AggregationTier::FALLBACK_CACHE: return "fallback_cache";
    }
    return "unknown";
}

WeightedAggregator::WeightedAggregator(const AdapterTable& adapters)
    : adapters_(adapters) {}

// =============================================================================
// Configuration
// =============================================================================

int32_t WeightedAggregator::validate(const FeedSource& source) {
    if (static_cast<size_t>(source.kind) >= FEED_KIND_COUNT) {
        return errors::INVALID_CONFIGURATION;
    }
    if (is_zero(source.endpoint)) return errors::INVALID_CONFIGURATION;
    if (source.weight > MAX_SOURCE_WEIGHT) return errors::INVALID_CONFIGURATION;
    if (source.max_staleness == 0) return errors::INVALID_CONFIGURATION;

    bool needs_identifier = source.kind == FeedKind::PUSH_AGGREGATE ||
                            source.kind == FeedKind::CONFIDENCE_INTERVAL;
    if (needs_identifier && source.extra.empty()) {
        return errors::INVALID_CONFIGURATION;
    }
    return errors::OK;
}

int32_t WeightedAggregator::add_source(uint32_t source_id, const FeedSource& source) {
    int32_t rc = validate(source);
    if (rc != errors::OK) return rc;

    if (sources_.find(source_id) != sources_.end()) {
        return errors::SOURCE_ALREADY_EXISTS;
    }

    sources_[source_id] = source;
    log::get()->info("added {} source {} (weight {}, staleness {}s)",
                     to_string(source.kind), source_id, source.weight, source.max_staleness);
    return errors::OK;
}

int32_t WeightedAggregator::update_source(uint32_t source_id, const FeedSource& source) {
    auto it = sources_.find(source_id);
    if (it == sources_.end()) return errors::SOURCE_NOT_FOUND;

    int32_t rc = validate(source);
    if (rc != errors::OK) return rc;

    it->second = source;
    return errors::OK;
}

int32_t WeightedAggregator::remove_source(uint32_t source_id) {
    if (sources_.erase(source_id) == 0) return errors::SOURCE_NOT_FOUND;
    return errors::OK;
}

int32_t WeightedAggregator::set_weight(uint32_t source_id, uint32_t weight) {
    auto it = sources_.find(source_id);
    if (it == sources_.end()) return errors::SOURCE_NOT_FOUND;
    if (weight > MAX_SOURCE_WEIGHT) return errors::INVALID_CONFIGURATION;

    it->second.weight = weight;
    return errors::OK;
}

int32_t WeightedAggregator::set_active(uint32_t source_id, bool active) {
    auto it = sources_.find(source_id);
    if (it == sources_.end()) return errors::SOURCE_NOT_FOUND;

    it->second.active = active;
    return errors::OK;
}

std::optional<FeedSource> WeightedAggregator::get_source(uint32_t source_id) const {
    auto it = sources_.find(source_id);
    if (it == sources_.end()) return std::nullopt;
    return it->second;
}

std::vector<uint32_t> WeightedAggregator::source_ids() const {
    std::vector<uint32_t> ids;
    ids.reserve(sources_.size());
    for (const auto& [id, source] : sources_) {
        ids.push_back(id);
    }
    return ids;
}

size_t WeightedAggregator::active_count() const {
    size_t count = 0;
    for (const auto& [id, source] : sources_) {
        if (source.active && source.weight > 0) count++;
    }
    return count;
}

int32_t WeightedAggregator::set_min_valid_sources(uint8_t min_valid) {
    if (min_valid == 0 || min_valid > MIN_VALID_SOURCES_LIMIT) {
        return errors::INVALID_CONFIGURATION;
    }
    min_valid_sources_ = min_valid;
    return errors::OK;
}

// =============================================================================
// Aggregation
// =============================================================================

std::vector<SourceReading> WeightedAggregator::collect(
    const std::map<uint32_t, FeedSource>& sources, uint64_t now) const {
    std::vector<SourceReading> readings;
    for (const auto& [id, source] : sources) {
        if (!source.active || source.weight == 0) continue;
        readings.push_back(SourceReading{id, source.kind, source.weight,
                                         adapters_.fetch(source, now)});
    }
    return readings;
}

std::optional<AggregatedResult> WeightedAggregator::aggregate(uint64_t now) {
    return aggregate(collect(sources_, now), now);
}

std::optional<AggregatedResult> WeightedAggregator::aggregate(std::vector<SourceReading> readings,
                                                              uint64_t now) {
    last_readings_ = std::move(readings);

    // Each term is below 2^135, so the sum cannot leave 256 bits
    U256 weighted_sum;
    uint64_t total_weight = 0;
    size_t valid_count = 0;
    I128 lone_price = 0;

    for (const SourceReading& reading : last_readings_) {
        const NormalizedQuote& quote = reading.quote;
        if (!quote.valid || quote.price_x18 <= 0) {
            log::get()->debug("source {} invalid: {}", reading.source_id,
                              errors::to_string(quote.error));
            continue;
        }

        log::get()->debug("source {} price {}", reading.source_id,
                          x18::to_string(quote.price_x18));
        weighted_sum = U256::wrapping_add(
            weighted_sum, mul_u128(static_cast<U128>(quote.price_x18), reading.weight));
        total_weight += reading.weight;
        lone_price = quote.price_x18;
        valid_count++;
    }

    // Tier 1: enough live sources
    if (valid_count >= min_valid_sources_ && total_weight > 0) {
        // A weighted mean never exceeds the largest price, so it fits I128
        I128 price = static_cast<I128>(U256::div(weighted_sum, total_weight).lo);
        fallback_.price_x18 = price;
        fallback_.timestamp = now;
        return AggregatedResult{price, now, false, valid_count, AggregationTier::LIVE};
    }

    // Tier 2: a single live source stands in, flagged degraded
    if (valid_count == 1 && min_valid_sources_ > 1) {
        log::get()->warn("only 1 of {} required sources valid, using it degraded",
                         min_valid_sources_);
        return AggregatedResult{lone_price, now, true, valid_count,
                                AggregationTier::SINGLE_SOURCE};
    }

    // Tier 3: last live result while it is at most 24h old
    if (fallback_.present() && fallback_.timestamp <= now &&
        now - fallback_.timestamp <= windows::FALLBACK_MAX_AGE) {
        log::get()->warn("{} valid sources, serving fallback price from {}",
                         valid_count, fallback_.timestamp);
        return AggregatedResult{fallback_.price_x18, fallback_.timestamp, true, valid_count,
                                AggregationTier::FALLBACK_CACHE};
    }

    log::get()->error("aggregation failed: {} valid of {} required, no usable fallback",
                      valid_count, min_valid_sources_);
    return std::nullopt;
}

} // namespace omni
