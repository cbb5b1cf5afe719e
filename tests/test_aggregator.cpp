// Weighted aggregation and fallback ladder tests

#include <catch2/catch_test_macros.hpp>

#include <omni/aggregator.hpp>

#include "mocks.hpp"

using namespace omni;
using namespace omni_test;

namespace {

constexpr uint64_t NOW = 1700000000;

struct AggregatorFixture {
    FeedDirectory directory;
    AdapterTable table = AdapterTable::with_defaults(directory);
    WeightedAggregator aggregator{table};
    std::map<uint32_t, std::shared_ptr<MockProxyFeed>> feeds;

    std::shared_ptr<MockProxyFeed> add(uint32_t id, uint32_t weight, int64_t price) {
        auto feed = std::make_shared<MockProxyFeed>();
        feed->value = ProxyValue{usd(price), NOW};
        directory.bind(addr(static_cast<uint8_t>(id)), std::static_pointer_cast<IProxyReadFeed>(feed));

        FeedSource s;
        s.kind = FeedKind::PROXY_READ;
        s.endpoint = addr(static_cast<uint8_t>(id));
        s.weight = weight;
        s.max_staleness = 3600;
        REQUIRE(aggregator.add_source(id, s) == errors::OK);

        feeds[id] = feed;
        return feed;
    }
};

} // namespace

TEST_CASE("Weighted mean of valid sources", "[aggregator]") {
    AggregatorFixture f;
    f.add(1, 40, 100);   // A
    f.add(2, 30, 102);   // B
    auto c = f.add(3, 30, 0);
    c->fail = true;      // C unavailable
    f.add(4, 30, 98);    // D

    auto result = f.aggregator.aggregate(NOW);
    REQUIRE(result.has_value());
    REQUIRE(result->price_x18 == usd(100));
    REQUIRE_FALSE(result->degraded);
    REQUIRE(result->valid_count == 3);
    REQUIRE(result->tier == AggregationTier::LIVE);
    REQUIRE(result->timestamp == NOW);

    // Every polled source is recorded, valid or not
    REQUIRE(f.aggregator.last_readings().size() == 4);
    REQUIRE(f.aggregator.fallback().price_x18 == usd(100));
    REQUIRE(f.aggregator.fallback().timestamp == NOW);
}

TEST_CASE("Weighted mean truncates", "[aggregator]") {
    AggregatorFixture f;
    auto a = f.add(1, 1, 0);
    auto b = f.add(2, 2, 0);
    a->value.value_x18 = 1;
    b->value.value_x18 = 2;

    // (1*1 + 2*2) / 3 = 1.66 -> 1
    REQUIRE(f.aggregator.aggregate(NOW)->price_x18 == 1);
}

TEST_CASE("Weighted sum of large prices stays exact", "[aggregator]") {
    AggregatorFixture f;
    const I128 big = x18::parse("10000000000000000000000000000000000000").value();  // 1e37
    auto a = f.add(1, 255, 0);
    auto b = f.add(2, 255, 0);
    a->value.value_x18 = big;
    b->value.value_x18 = big;

    auto result = f.aggregator.aggregate(NOW);
    REQUIRE(result.has_value());
    REQUIRE(result->price_x18 == big);
    REQUIRE(f.aggregator.fallback().price_x18 == big);

    // Largest representable price against 1: (2^127 - 1 + 1) / 2
    a->value.value_x18 = static_cast<I128>((static_cast<U128>(1) << 127) - 1);
    b->value.value_x18 = 1;
    const I128 half = static_cast<I128>(static_cast<U128>(1) << 126);
    REQUIRE(f.aggregator.aggregate(NOW)->price_x18 == half);
}

TEST_CASE("More than 255 sources are counted", "[aggregator]") {
    AggregatorFixture f;
    f.add(1, 1, 100);
    for (uint32_t id = 2; id <= 300; id++) {
        FeedSource s = *f.aggregator.get_source(1);
        REQUIRE(f.aggregator.add_source(id, s) == errors::OK);
    }
    REQUIRE(f.aggregator.set_min_valid_sources(4) == errors::OK);

    REQUIRE(f.aggregator.active_count() == 300);
    auto result = f.aggregator.aggregate(NOW);
    REQUIRE(result->valid_count == 300);
    REQUIRE(result->tier == AggregationTier::LIVE);
    REQUIRE(result->price_x18 == usd(100));
}

TEST_CASE("Collection leaves aggregator state alone", "[aggregator]") {
    AggregatorFixture f;
    f.add(1, 10, 100);
    f.add(2, 10, 200);

    std::vector<SourceReading> readings = f.aggregator.collect(f.aggregator.sources(), NOW);
    REQUIRE(readings.size() == 2);
    REQUIRE(f.aggregator.last_readings().empty());
    REQUIRE_FALSE(f.aggregator.fallback().present());

    REQUIRE(f.aggregator.aggregate(std::move(readings), NOW)->price_x18 == usd(150));
    REQUIRE(f.aggregator.last_readings().size() == 2);
}

TEST_CASE("Inactive and zero-weight sources are skipped", "[aggregator]") {
    AggregatorFixture f;
    f.add(1, 10, 100);
    f.add(2, 10, 200);
    f.add(3, 10, 10000);
    REQUIRE(f.aggregator.set_active(3, false) == errors::OK);
    f.add(4, 0, 10000);

    auto result = f.aggregator.aggregate(NOW);
    REQUIRE(result->price_x18 == usd(150));
    REQUIRE(f.aggregator.last_readings().size() == 2);
    REQUIRE(f.aggregator.active_count() == 2);
}

TEST_CASE("Fallback ladder", "[aggregator]") {
    AggregatorFixture f;
    auto a = f.add(1, 50, 3000);
    auto b = f.add(2, 50, 3010);

    SECTION("Single valid source below the minimum is used, degraded") {
        b->fail = true;
        auto result = f.aggregator.aggregate(NOW);
        REQUIRE(result.has_value());
        REQUIRE(result->price_x18 == usd(3000));
        REQUIRE(result->degraded);
        REQUIRE(result->tier == AggregationTier::SINGLE_SOURCE);

        // Degraded results never refresh the cache
        REQUIRE_FALSE(f.aggregator.fallback().present());
    }

    SECTION("No valid source and no cache fails") {
        a->fail = true;
        b->fail = true;
        REQUIRE_FALSE(f.aggregator.aggregate(NOW).has_value());
    }

    SECTION("Cache within 24h is served with its own timestamp") {
        REQUIRE(f.aggregator.aggregate(NOW)->price_x18 == usd(3005));

        a->fail = true;
        b->fail = true;
        uint64_t later = NOW + 86400;
        auto result = f.aggregator.aggregate(later);
        REQUIRE(result.has_value());
        REQUIRE(result->price_x18 == usd(3005));
        REQUIRE(result->timestamp == NOW);
        REQUIRE(result->degraded);
        REQUIRE(result->tier == AggregationTier::FALLBACK_CACHE);
    }

    SECTION("Cache older than 24h is unusable") {
        REQUIRE(f.aggregator.aggregate(NOW).has_value());

        a->fail = true;
        b->fail = true;
        REQUIRE_FALSE(f.aggregator.aggregate(NOW + 86401).has_value());
    }

    SECTION("Restored cache") {
        a->fail = true;
        b->fail = true;
        f.aggregator.restore_fallback(FallbackCache{usd(2950), NOW - 60});
        REQUIRE(f.aggregator.aggregate(NOW)->price_x18 == usd(2950));
    }

    SECTION("min_valid_sources of 1 serves a lone source live") {
        REQUIRE(f.aggregator.set_min_valid_sources(1) == errors::OK);
        b->fail = true;
        auto result = f.aggregator.aggregate(NOW);
        REQUIRE_FALSE(result->degraded);
        REQUIRE(result->tier == AggregationTier::LIVE);
    }
}

TEST_CASE("Source configuration", "[aggregator]") {
    AggregatorFixture f;
    f.add(1, 10, 100);

    FeedSource s = f.aggregator.get_source(1).value();

    SECTION("Duplicate identifiers") {
        REQUIRE(f.aggregator.add_source(1, s) == errors::SOURCE_ALREADY_EXISTS);
    }

    SECTION("Invalid sources are rejected") {
        FeedSource bad = s;
        bad.endpoint = Address{};
        REQUIRE(f.aggregator.add_source(2, bad) == errors::INVALID_CONFIGURATION);

        bad = s;
        bad.weight = 256;
        REQUIRE(f.aggregator.add_source(2, bad) == errors::INVALID_CONFIGURATION);

        bad = s;
        bad.max_staleness = 0;
        REQUIRE(f.aggregator.add_source(2, bad) == errors::INVALID_CONFIGURATION);

        bad = s;
        bad.kind = FeedKind::CONFIDENCE_INTERVAL;
        bad.extra.clear();
        REQUIRE(f.aggregator.add_source(2, bad) == errors::INVALID_CONFIGURATION);
    }

    SECTION("Weight bounds") {
        REQUIRE(f.aggregator.set_weight(1, 255) == errors::OK);
        REQUIRE(f.aggregator.set_weight(1, 256) == errors::INVALID_CONFIGURATION);
        REQUIRE(f.aggregator.set_weight(7, 1) == errors::SOURCE_NOT_FOUND);
    }

    SECTION("Update and remove") {
        s.weight = 77;
        REQUIRE(f.aggregator.update_source(1, s) == errors::OK);
        REQUIRE(f.aggregator.get_source(1)->weight == 77);
        REQUIRE(f.aggregator.update_source(9, s) == errors::SOURCE_NOT_FOUND);

        REQUIRE(f.aggregator.remove_source(1) == errors::OK);
        REQUIRE(f.aggregator.remove_source(1) == errors::SOURCE_NOT_FOUND);
        REQUIRE(f.aggregator.source_ids().empty());
    }

    SECTION("Minimum valid sources between 1 and 4") {
        REQUIRE(f.aggregator.set_min_valid_sources(0) == errors::INVALID_CONFIGURATION);
        REQUIRE(f.aggregator.set_min_valid_sources(5) == errors::INVALID_CONFIGURATION);
        REQUIRE(f.aggregator.set_min_valid_sources(4) == errors::OK);
        REQUIRE(f.aggregator.min_valid_sources() == 4);
    }
}
