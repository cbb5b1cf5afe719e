#ifndef OMNI_AGGREGATOR_HPP
#define OMNI_AGGREGATOR_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "sources.hpp"

namespace omni {

// =============================================================================
// Aggregation Results
// =============================================================================

enum class AggregationTier : uint8_t {
    LIVE = 0,             // valid_count >= min_valid_sources
    SINGLE_SOURCE = 1,    // Lone valid source below the minimum
    FALLBACK_CACHE = 2    // Last live result, at most 24h old
};

const char* to_string(AggregationTier tier);

struct AggregatedResult {
    I128 price_x18;
    uint64_t timestamp;
    bool degraded;
    size_t valid_count;
    AggregationTier tier;
};

// Last live aggregation; timestamp == 0 means empty
struct FallbackCache {
    I128 price_x18 = 0;
    uint64_t timestamp = 0;

    bool present() const { return timestamp != 0; }
};

// Per-source outcome of one pass, kept for diagnostics
struct SourceReading {
    uint32_t source_id;
    FeedKind kind;
    uint32_t weight;
    NormalizedQuote quote;
};

// =============================================================================
// WeightedAggregator
//
// Not internally synchronized; OmniOracle serializes access.
// =============================================================================

class WeightedAggregator {
public:
    explicit WeightedAggregator(const AdapterTable& adapters);
    ~WeightedAggregator() = default;

    WeightedAggregator(const WeightedAggregator&) = delete;
    WeightedAggregator& operator=(const WeightedAggregator&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    int32_t add_source(uint32_t source_id, const FeedSource& source);
    int32_t update_source(uint32_t source_id, const FeedSource& source);
    int32_t remove_source(uint32_t source_id);
    int32_t set_weight(uint32_t source_id, uint32_t weight);
    int32_t set_active(uint32_t source_id, bool active);

    std::optional<FeedSource> get_source(uint32_t source_id) const;
    std::vector<uint32_t> source_ids() const;
    const std::map<uint32_t, FeedSource>& sources() const { return sources_; }
    size_t active_count() const;

    // 1..4
    int32_t set_min_valid_sources(uint8_t min_valid);
    uint8_t min_valid_sources() const { return min_valid_sources_; }

    // Rejects a source that could never produce a quote
    static int32_t validate(const FeedSource& source);

    // =========================================================================
    // Aggregation
    // =========================================================================

    // Query every active, weighted source; touches no aggregator state
    std::vector<SourceReading> collect(const std::map<uint32_t, FeedSource>& sources,
                                       uint64_t now) const;

    // Run the fallback ladder over one pass of readings; nullopt means
    // INSUFFICIENT_SOURCES
    std::optional<AggregatedResult> aggregate(std::vector<SourceReading> readings, uint64_t now);

    // collect() then aggregate() over the configured sources
    std::optional<AggregatedResult> aggregate(uint64_t now);

    const std::vector<SourceReading>& last_readings() const { return last_readings_; }
    const FallbackCache& fallback() const { return fallback_; }

    // Seed the cache (restoring persisted state)
    void restore_fallback(const FallbackCache& cache) { fallback_ = cache; }

private:
    const AdapterTable& adapters_;

    // Ordered so that passes are deterministic
    std::map<uint32_t, FeedSource> sources_;
    uint8_t min_valid_sources_ = 2;

    FallbackCache fallback_;
    std::vector<SourceReading> last_readings_;
};

} // namespace omni

#endif // OMNI_AGGREGATOR_HPP
