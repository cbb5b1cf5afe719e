// JSON settings loading and application tests

#include <catch2/catch_test_macros.hpp>

#include <omni/config.hpp>
#include <omni/oracle.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "mocks.hpp"

using namespace omni;
using namespace omni_test;

namespace {

const char* FULL_CONFIG = R"({
    "local_chain_id": 96369,
    "mode": "producer",
    "min_valid_sources": 2,
    "log": { "level": "debug" },
    "feeds": [
        { "id": 1, "kind": "pull_quote",
          "endpoint": "0x0000000000000000000000000000000000000001", "weight": 40 },
        { "id": 2, "kind": "confidence_interval",
          "endpoint": "0x0000000000000000000000000000000000000002", "weight": 30,
          "max_staleness": 120, "extra": "0xff61491a" },
        { "id": 3, "kind": "proxy_read",
          "endpoint": "0x0000000000000000000000000000000000000003", "weight": 30,
          "active": false }
    ],
    "liquidity": {
        "twap_enabled": false,
        "twap_period": 900,
        "pools": [
            { "address": "0x00000000000000000000000000000000000000c1",
              "native_token": "0x00000000000000000000000000000000000000a0",
              "native_decimals": 18, "asset_decimals": 6 }
        ]
    },
    "deviation": { "max_bps": 1500, "grace_period": 3600 },
    "peers": {
        "confirmations": 15,
        "min_agreement": 1,
        "endpoints": [
            { "chain_id": 8453, "oracle": "0x00000000000000000000000000000000000000be" },
            { "chain_id": 10, "active": false }
        ]
    }
})";

} // namespace

TEST_CASE("Settings parsing", "[config]") {
    SECTION("Full document") {
        OracleSettings s = OracleSettings::from_string(FULL_CONFIG);
        REQUIRE(s.local_chain_id == 96369);
        REQUIRE(s.mode == OracleMode::PRODUCER);
        REQUIRE(s.log.level == "debug");
        REQUIRE(s.feeds.size() == 3);
        REQUIRE(s.feeds[0].source.kind == FeedKind::PULL_QUOTE);
        REQUIRE(s.feeds[0].source.max_staleness == windows::DEFAULT_STALENESS);
        REQUIRE(s.feeds[1].source.extra == "0xff61491a");
        REQUIRE(s.feeds[1].source.max_staleness == 120);
        REQUIRE_FALSE(s.feeds[2].source.active);
        REQUIRE_FALSE(s.liquidity.twap_enabled);
        REQUIRE(s.liquidity.twap_period == 900);
        REQUIRE(s.liquidity.pools.at(0).asset_decimals == 6);
        REQUIRE(s.deviation.max_bps == 1500);
        REQUIRE(s.peers.confirmations == 15);
        REQUIRE(s.peers.read_channel_id == DEFAULT_READ_CHANNEL);
        REQUIRE(s.peers.request_ttl == windows::DEFAULT_REQUEST_TTL);
        REQUIRE(s.peers.endpoints.size() == 2);
        REQUIRE(is_zero(s.peers.endpoints[1].oracle));
    }

    SECTION("Defaults") {
        OracleSettings s = OracleSettings::from_string(R"({"local_chain_id": 1})");
        REQUIRE_FALSE(s.mode.has_value());
        REQUIRE(s.min_valid_sources == 2);
        REQUIRE(s.liquidity.twap_enabled);
        REQUIRE(s.liquidity.twap_period == windows::DEFAULT_TWAP_PERIOD);
        REQUIRE(s.peers.confirmations == DEFAULT_CONFIRMATIONS);
        REQUIRE(s.log.level == "info");
    }

    SECTION("Rejected documents") {
        REQUIRE_THROWS_AS(OracleSettings::from_string("{"), std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string("{}"), std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string(R"({"local_chain_id": 1, "mode": "relay"})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string(
                              R"({"local_chain_id": 1, "feeds": [{"id": 1, "kind": "x",
                                  "endpoint": "0x0000000000000000000000000000000000000001"}]})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string(
                              R"({"local_chain_id": 1, "feeds": [{"id": 1, "kind": "proxy_read",
                                  "endpoint": "0x01"}]})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string(R"({"local_chain_id": -4})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(OracleSettings::from_string(
                              R"({"local_chain_id": 1, "min_valid_sources": 300})"),
                          std::runtime_error);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(OracleSettings::from_file("/nonexistent/omni.json"), std::runtime_error);
    }
}

TEST_CASE("Applying settings", "[config]") {
    FixedClock clock;
    OmniOracle oracle(96369, clock.fn());
    OracleSettings s = OracleSettings::from_string(FULL_CONFIG);

    auto pool = std::make_shared<MockPool>();
    Collaborators collaborators;
    collaborators.make_pool = [pool](const PoolSettings&) -> std::shared_ptr<ILiquidityPool> {
        return pool;
    };

    SECTION("Configures every component") {
        REQUIRE(apply_settings(oracle, s, collaborators) == errors::OK);
        REQUIRE(oracle.mode() == OracleMode::PRODUCER);
        REQUIRE(oracle.source_ids() == std::vector<uint32_t>{1, 2, 3});
        REQUIRE(oracle.get_source(2)->weight == 30);
        REQUIRE(oracle.twap_state(0).has_value());
        REQUIRE(oracle.active_peers() == std::vector<ChainId>{8453});

        OracleStatus status = oracle.status();
        REQUIRE(status.max_deviation_bps == 1500);
        REQUIRE(status.active_sources == 2);
    }

    SECTION("Reapplying updates existing sources") {
        REQUIRE(apply_settings(oracle, s) == errors::OK);
        s.feeds[0].source.weight = 99;
        REQUIRE(apply_settings(oracle, s) == errors::OK);
        REQUIRE(oracle.get_source(1)->weight == 99);
    }

    SECTION("Feeds are bound through the collaborator hook") {
        int bound = 0;
        collaborators.bind_feed = [&bound](FeedDirectory&, const FeedSettings&) { bound++; };
        REQUIRE(apply_settings(oracle, s, collaborators) == errors::OK);
        REQUIRE(bound == 3);
    }

    SECTION("Chain mismatch") {
        s.local_chain_id = 1;
        REQUIRE(apply_settings(oracle, s) == errors::INVALID_CONFIGURATION);
    }

    SECTION("Invalid source surfaces its status") {
        s.feeds[1].source.extra.clear();
        REQUIRE(apply_settings(oracle, s) == errors::INVALID_CONFIGURATION);
    }

    SECTION("Pool that does not hold the native token") {
        pool->t0 = addr(0x55);
        REQUIRE(apply_settings(oracle, s, collaborators) == errors::INVALID_CONFIGURATION);
    }

    SECTION("Minimum sources out of range") {
        s.min_valid_sources = 9;
        REQUIRE(apply_settings(oracle, s) == errors::INVALID_CONFIGURATION);
    }
}
