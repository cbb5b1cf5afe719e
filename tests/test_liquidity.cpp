// Spot and TWAP liquidity ratio tests

#include <catch2/catch_test_macros.hpp>

#include "mocks.hpp"

using namespace omni;
using namespace omni_test;

namespace {

constexpr uint32_t T0 = 1000;
constexpr uint32_t T1 = 2800;
constexpr uint64_t PERIOD = 1800;

// Average of 2^100 per second over the window: raw ratio (2^100 * 1e18) >> 112
const U256 WINDOW_DELTA = mul_u128(U128(1) << 100, PERIOD);
constexpr I128 RAW_RATIO = 244140625000000;   // 1e18 / 4096

PoolConfig pool_config(std::shared_ptr<MockPool> pool, uint8_t native_dec, uint8_t asset_dec,
                       bool native_is_token0 = true) {
    PoolConfig cfg;
    cfg.pool = pool;
    cfg.native_token = native_is_token0 ? pool->t0 : pool->t1;
    cfg.native_decimals = native_dec;
    cfg.asset_decimals = asset_dec;
    return cfg;
}

std::shared_ptr<MockPool> twap_pool() {
    auto pool = std::make_shared<MockPool>();
    pool->r = PoolReserves{1000, 1000, T0};
    return pool;
}

void advance_window(MockPool& pool, bool native_is_token0 = true) {
    pool.r.last_timestamp = T1;
    if (native_is_token0) {
        pool.cumulative0 = WINDOW_DELTA;
    } else {
        pool.cumulative1 = WINDOW_DELTA;
    }
}

} // namespace

TEST_CASE("TWAP window reproduces the reference fixture", "[liquidity][twap]") {
    SECTION("Equal decimals") {
        auto pool = twap_pool();
        TwapEstimator est(pool_config(pool, 18, 18));
        REQUIRE(est.resolve_tokens() == errors::OK);
        est.init();
        REQUIRE(est.state().initialized);
        REQUIRE(est.state().last_timestamp == T0);

        advance_window(*pool);
        auto r = est.update(PERIOD);
        REQUIRE(r.has_value());
        REQUIRE(r->from_twap);
        REQUIRE(r->ratio_x18 == RAW_RATIO);
        REQUIRE(est.state().ratio_x18 == RAW_RATIO);
        REQUIRE(est.state().last_timestamp == T1);
    }

    SECTION("Native decimals above asset decimals multiply") {
        auto pool = twap_pool();
        TwapEstimator est(pool_config(pool, 18, 6));
        REQUIRE(est.resolve_tokens() == errors::OK);
        est.init();
        advance_window(*pool);

        auto r = est.update(PERIOD);
        REQUIRE(r.has_value());
        REQUIRE(r->ratio_x18 == RAW_RATIO * x18::pow10(12));
    }

    SECTION("Native decimals below asset decimals divide") {
        auto pool = twap_pool();
        TwapEstimator est(pool_config(pool, 6, 18));
        REQUIRE(est.resolve_tokens() == errors::OK);
        est.init();
        advance_window(*pool);

        auto r = est.update(PERIOD);
        REQUIRE(r.has_value());
        REQUIRE(r->ratio_x18 == RAW_RATIO / x18::pow10(12));   // 244
    }

    SECTION("Native token in slot 1 reads the second accumulator") {
        auto pool = twap_pool();
        TwapEstimator est(pool_config(pool, 18, 18, false));
        REQUIRE(est.resolve_tokens() == errors::OK);
        est.init();
        advance_window(*pool, false);

        REQUIRE(est.update(PERIOD)->ratio_x18 == RAW_RATIO);
    }
}

TEST_CASE("TWAP window boundaries", "[liquidity][twap]") {
    auto pool = twap_pool();
    TwapEstimator est(pool_config(pool, 18, 18));
    REQUIRE(est.resolve_tokens() == errors::OK);

    SECTION("Uninitialized estimator never completes a window") {
        advance_window(*pool);
        REQUIRE_FALSE(est.update(PERIOD).has_value());
    }

    SECTION("Short window keeps the snapshot") {
        est.init();
        pool->r.last_timestamp = T0 + 1799;
        pool->cumulative0 = WINDOW_DELTA;
        REQUIRE_FALSE(est.update(PERIOD).has_value());
        REQUIRE(est.state().last_timestamp == T0);
    }

    SECTION("32-bit timestamp wrap") {
        pool->r.last_timestamp = 0xFFFFFF00u;
        pool->cumulative0 = U256::wrapping_sub(U256(), U256(5));
        est.init();

        // 0xFFFFFF00 + 1800 wraps to 1544; accumulator wraps as well
        pool->r.last_timestamp = 1544;
        pool->cumulative0 = U256::wrapping_sub(WINDOW_DELTA, U256(5));
        REQUIRE(est.update(PERIOD)->ratio_x18 == RAW_RATIO);
    }

    SECTION("Unreadable pool") {
        est.init();
        pool->fail = true;
        advance_window(*pool);
        REQUIRE_FALSE(est.update(PERIOD).has_value());
    }
}

TEST_CASE("Spot ratio", "[liquidity]") {
    auto pool = std::make_shared<MockPool>();

    SECTION("Asset per native from reserves") {
        TwapEstimator est(pool_config(pool, 18, 18));
        REQUIRE(est.resolve_tokens() == errors::OK);
        pool->r = PoolReserves{static_cast<U128>(usd(10)), static_cast<U128>(usd(25)), T0};

        auto r = est.spot();
        REQUIRE(r.has_value());
        REQUIRE(r->ratio_x18 == x18::parse("2500000000000000000").value());
        REQUIRE_FALSE(r->from_twap);
        REQUIRE(r->native_reserve == static_cast<U128>(usd(10)));
    }

    SECTION("Decimal correction for a 6-decimal asset") {
        TwapEstimator est(pool_config(pool, 18, 6));
        REQUIRE(est.resolve_tokens() == errors::OK);
        // 1 native : 3000 asset (6 decimals)
        pool->r = PoolReserves{static_cast<U128>(usd(1)), 3000000000, T0};
        REQUIRE(est.spot()->ratio_x18 == usd(3000));
    }

    SECTION("Zero reserve") {
        TwapEstimator est(pool_config(pool, 18, 18));
        REQUIRE(est.resolve_tokens() == errors::OK);
        pool->r = PoolReserves{0, 100, T0};
        REQUIRE_FALSE(est.spot().has_value());
    }

    SECTION("Native token absent from the pair") {
        PoolConfig cfg = pool_config(pool, 18, 18);
        cfg.native_token = addr(0x77);
        TwapEstimator est(cfg);
        REQUIRE(est.resolve_tokens() == errors::INVALID_CONFIGURATION);
    }
}

TEST_CASE("Liquidity ratio estimator", "[liquidity]") {
    LiquidityRatioEstimator estimator;

    SECTION("No pools") {
        REQUIRE_FALSE(estimator.ratio().has_value());
    }

    SECTION("At most two pools") {
        auto p1 = std::make_shared<MockPool>();
        auto p2 = std::make_shared<MockPool>();
        auto p3 = std::make_shared<MockPool>();
        REQUIRE(estimator.add_pool(pool_config(p1, 18, 18)) == errors::OK);
        REQUIRE(estimator.add_pool(pool_config(p2, 18, 18)) == errors::OK);
        REQUIRE(estimator.add_pool(pool_config(p3, 18, 18)) == errors::INVALID_CONFIGURATION);
        REQUIRE(estimator.pool_count() == 2);
    }

    SECTION("Reserve-weighted across pools") {
        auto p1 = std::make_shared<MockPool>();
        auto p2 = std::make_shared<MockPool>();
        p1->r = PoolReserves{static_cast<U128>(usd(30)), static_cast<U128>(usd(60)), T0};   // 2.0
        p2->r = PoolReserves{static_cast<U128>(usd(10)), static_cast<U128>(usd(60)), T0};   // 6.0
        REQUIRE(estimator.add_pool(pool_config(p1, 18, 18)) == errors::OK);
        REQUIRE(estimator.add_pool(pool_config(p2, 18, 18)) == errors::OK);
        estimator.set_twap_enabled(false);

        // (2 * 30 + 6 * 10) / 40 = 3
        REQUIRE(estimator.ratio() == usd(3));
        REQUIRE(estimator.spot_ratio() == usd(3));
    }

    SECTION("Ratio from observations read earlier") {
        auto p1 = std::make_shared<MockPool>();
        p1->r = PoolReserves{static_cast<U128>(usd(30)), static_cast<U128>(usd(60)), T0};
        REQUIRE(estimator.add_pool(pool_config(p1, 18, 18)) == errors::OK);
        estimator.set_twap_enabled(false);

        auto observations = LiquidityRatioEstimator::observe(estimator.handles());
        REQUIRE(observations.size() == 1);
        p1->r.reserve1 = static_cast<U128>(usd(300));

        REQUIRE(estimator.ratio(observations) == usd(2));
        REQUIRE_FALSE(estimator.ratio({std::nullopt}).has_value());
        REQUIRE(estimator.ratio() == usd(10));
    }

    SECTION("Unreadable pool is left out") {
        auto p1 = std::make_shared<MockPool>();
        auto p2 = std::make_shared<MockPool>();
        p1->r = PoolReserves{static_cast<U128>(usd(30)), static_cast<U128>(usd(60)), T0};
        REQUIRE(estimator.add_pool(pool_config(p1, 18, 18)) == errors::OK);
        REQUIRE(estimator.add_pool(pool_config(p2, 18, 18)) == errors::OK);
        p2->fail = true;
        estimator.set_twap_enabled(false);

        REQUIRE(estimator.ratio() == usd(2));
    }

    SECTION("TWAP initializes lazily and falls back to spot inside a window") {
        auto pool = twap_pool();
        pool->r.reserve0 = static_cast<U128>(usd(10));
        pool->r.reserve1 = static_cast<U128>(usd(20));
        REQUIRE(estimator.add_pool(pool_config(pool, 18, 18)) == errors::OK);

        REQUIRE(estimator.ratio() == usd(2));
        REQUIRE(estimator.pool(0)->state().initialized);

        advance_window(*pool);
        REQUIRE(estimator.ratio() == RAW_RATIO);
    }

    SECTION("TWAP period bounds") {
        REQUIRE(estimator.set_twap_period(0) == errors::INVALID_CONFIGURATION);
        REQUIRE(estimator.set_twap_period(uint64_t(UINT32_MAX) + 1) == errors::INVALID_CONFIGURATION);
        REQUIRE(estimator.set_twap_period(600) == errors::OK);
        REQUIRE(estimator.twap_period() == 600);
    }
}

TEST_CASE("Derived price composer", "[liquidity]") {
    // Native at $3000, 1500 asset per native -> $2 per asset
    REQUIRE(compose_asset_usd(usd(3000), usd(1500)) == usd(2));

    REQUIRE_FALSE(compose_asset_usd(usd(3000), 0).has_value());
    REQUIRE_FALSE(compose_asset_usd(0, usd(1500)).has_value());
    REQUIRE_FALSE(compose_asset_usd(usd(3000), -1).has_value());

    // Ratio so large the price truncates to zero
    REQUIRE_FALSE(compose_asset_usd(1, usd(2)).has_value());
}
