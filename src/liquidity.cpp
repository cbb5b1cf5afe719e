// =============================================================================
// liquidity.cpp - Spot and TWAP asset/native ratios from pool reserves
// =============================================================================

#include "omni/liquidity.hpp"
#include "omni/log.hpp"

#include <algorithm>
#include <exception>

namespace omni {

namespace {

constexpr U128 I128_MAX_U = (U128(1) << 127) - 1;

// Reserves of a constant-product pair fit in 112 bits
constexpr unsigned RESERVE_BITS = 112;

unsigned bit_length(U128 v) {
    unsigned n = 0;
    while (v != 0) { v >>= 1; n++; }
    return n;
}

} // namespace

std::optional<PoolObservation> observe_pool(ILiquidityPool& pool) {
    try {
        PoolObservation observation;
        observation.reserves = pool.reserves();
        observation.cumulative0 = pool.cumulative_price0();
        observation.cumulative1 = pool.cumulative_price1();
        return observation;
    } catch (const std::exception& e) {
        log::get()->warn("pool unreadable: {}", e.what());
        return std::nullopt;
    }
}

// =============================================================================
// TwapEstimator
// =============================================================================

TwapEstimator::TwapEstimator(PoolConfig config) : config_(std::move(config)) {}

int32_t TwapEstimator::resolve_tokens() {
    if (!config_.pool || is_zero(config_.native_token)) {
        return errors::INVALID_CONFIGURATION;
    }
    if (config_.native_decimals > MAX_POW10 || config_.asset_decimals > MAX_POW10) {
        return errors::INVALID_CONFIGURATION;
    }

    try {
        Address t0 = config_.pool->token0();
        Address t1 = config_.pool->token1();
        if (t0 == config_.native_token) {
            native_token0_ = true;
        } else if (t1 == config_.native_token) {
            native_token0_ = false;
        } else {
            return errors::INVALID_CONFIGURATION;
        }
    } catch (const std::exception& e) {
        log::get()->warn("pool token lookup failed: {}", e.what());
        return errors::SOURCE_UNAVAILABLE;
    }
    return errors::OK;
}

std::optional<I128> TwapEstimator::correct_decimals(const U256& raw_x18) const {
    int32_t diff = static_cast<int32_t>(config_.native_decimals) -
                   static_cast<int32_t>(config_.asset_decimals);

    U256 corrected = raw_x18;
    if (diff > 0) {
        auto scaled = U256::mul(raw_x18, static_cast<U128>(x18::pow10(diff)));
        if (!scaled) return std::nullopt;
        corrected = *scaled;
    } else if (diff < 0) {
        corrected = U256::div(raw_x18, static_cast<U128>(x18::pow10(-diff)));
    }

    auto narrow = corrected.to_u128();
    if (!narrow || *narrow == 0 || *narrow > I128_MAX_U) return std::nullopt;
    return static_cast<I128>(*narrow);
}

void TwapEstimator::init() {
    auto observation = observe_pool(*config_.pool);
    if (!observation) {
        log::get()->warn("TWAP init skipped, pool unreadable");
        return;
    }
    init(*observation);
}

void TwapEstimator::init(const PoolObservation& observation) {
    state_.cumulative0_last = observation.cumulative0;
    state_.cumulative1_last = observation.cumulative1;
    state_.last_timestamp = observation.reserves.last_timestamp;
    state_.ratio_x18 = 0;
    state_.initialized = true;
}

std::optional<PoolRatio> TwapEstimator::update(uint64_t period) {
    if (!state_.initialized) return std::nullopt;

    auto observation = observe_pool(*config_.pool);
    if (!observation) return std::nullopt;
    return update(*observation, period);
}

std::optional<PoolRatio> TwapEstimator::update(const PoolObservation& observation,
                                               uint64_t period) {
    if (!state_.initialized) return std::nullopt;

    const PoolReserves& r = observation.reserves;

    // 32-bit pool timestamps wrap; modular difference is intended
    uint32_t elapsed = r.last_timestamp - state_.last_timestamp;
    if (elapsed == 0 || elapsed < period) return std::nullopt;

    const U256& now_acc = native_token0_ ? observation.cumulative0 : observation.cumulative1;
    const U256& last_acc = native_token0_ ? state_.cumulative0_last : state_.cumulative1_last;

    U256 average = U256::div(U256::wrapping_sub(now_acc, last_acc), elapsed);

    state_.cumulative0_last = observation.cumulative0;
    state_.cumulative1_last = observation.cumulative1;
    state_.last_timestamp = r.last_timestamp;

    auto scaled = U256::mul(average, static_cast<U128>(X18_ONE));
    if (!scaled) {
        log::get()->warn("TWAP average overflows 256 bits");
        return std::nullopt;
    }

    auto ratio = correct_decimals(U256::shr(*scaled, UQ112_SHIFT));
    if (!ratio) return std::nullopt;

    state_.ratio_x18 = *ratio;
    U128 native_reserve = native_token0_ ? r.reserve0 : r.reserve1;
    return PoolRatio{*ratio, native_reserve, true};
}

std::optional<PoolRatio> TwapEstimator::spot() const {
    auto observation = observe_pool(*config_.pool);
    if (!observation) return std::nullopt;
    return spot(*observation);
}

std::optional<PoolRatio> TwapEstimator::spot(const PoolObservation& observation) const {
    const PoolReserves& r = observation.reserves;
    U128 native_reserve = native_token0_ ? r.reserve0 : r.reserve1;
    U128 asset_reserve = native_token0_ ? r.reserve1 : r.reserve0;
    if (native_reserve == 0 || asset_reserve == 0) return std::nullopt;

    U256 raw = U256::div(mul_u128(asset_reserve, static_cast<U128>(X18_ONE)), native_reserve);
    auto ratio = correct_decimals(raw);
    if (!ratio) return std::nullopt;
    return PoolRatio{*ratio, native_reserve, false};
}

std::optional<PoolRatio> TwapEstimator::resolve(const PoolObservation& observation,
                                                bool twap_enabled, uint64_t period) {
    if (twap_enabled) {
        if (!state_.initialized) init(observation);

        auto twap = update(observation, period);
        if (twap) return twap;
    }
    return spot(observation);
}

// =============================================================================
// LiquidityRatioEstimator
// =============================================================================

int32_t LiquidityRatioEstimator::add_pool(const PoolConfig& config) {
    if (pools_.size() >= MAX_POOLS) return errors::INVALID_CONFIGURATION;

    TwapEstimator estimator(config);
    int32_t rc = estimator.resolve_tokens();
    if (rc != errors::OK) return rc;

    pools_.push_back(std::move(estimator));
    log::get()->info("added liquidity pool {} (native {}d, asset {}d)", pools_.size(),
                     config.native_decimals, config.asset_decimals);
    return errors::OK;
}

int32_t LiquidityRatioEstimator::set_twap_period(uint64_t period) {
    if (period == 0 || period > UINT32_MAX) return errors::INVALID_CONFIGURATION;
    twap_period_ = period;
    return errors::OK;
}

void LiquidityRatioEstimator::init_twap() {
    for (auto& pool : pools_) {
        pool.init();
    }
}

std::vector<std::shared_ptr<ILiquidityPool>> LiquidityRatioEstimator::handles() const {
    std::vector<std::shared_ptr<ILiquidityPool>> out;
    out.reserve(pools_.size());
    for (const auto& pool : pools_) {
        out.push_back(pool.config().pool);
    }
    return out;
}

std::vector<std::optional<PoolObservation>> LiquidityRatioEstimator::observe(
    const std::vector<std::shared_ptr<ILiquidityPool>>& handles) {
    std::vector<std::optional<PoolObservation>> observations;
    observations.reserve(handles.size());
    for (const auto& handle : handles) {
        observations.push_back(observe_pool(*handle));
    }
    return observations;
}

std::optional<I128> LiquidityRatioEstimator::ratio(
    const std::vector<std::optional<PoolObservation>>& observations) {
    std::vector<PoolRatio> ratios;
    size_t count = std::min(pools_.size(), observations.size());
    for (size_t i = 0; i < count; i++) {
        if (!observations[i]) continue;

        auto r = pools_[i].resolve(*observations[i], twap_enabled_, twap_period_);
        if (r) ratios.push_back(*r);
    }
    return combine(ratios);
}

std::optional<I128> LiquidityRatioEstimator::ratio() {
    return ratio(observe(handles()));
}

std::optional<I128> LiquidityRatioEstimator::spot_ratio() const {
    std::vector<PoolRatio> ratios;
    for (const auto& pool : pools_) {
        auto r = pool.spot();
        if (r) ratios.push_back(*r);
    }
    return combine(ratios);
}

const TwapEstimator* LiquidityRatioEstimator::pool(size_t index) const {
    if (index >= pools_.size()) return nullptr;
    return &pools_[index];
}

std::optional<I128> LiquidityRatioEstimator::combine(const std::vector<PoolRatio>& ratios) {
    if (ratios.empty()) return std::nullopt;
    if (ratios.size() == 1) return ratios.front().ratio_x18;

    // Shrink weights so each stays within 112 bits; sums then cannot overflow
    unsigned widest = 0;
    for (const auto& r : ratios) {
        widest = std::max(widest, bit_length(r.native_reserve));
    }
    unsigned shift = widest > RESERVE_BITS ? widest - RESERVE_BITS : 0;

    U256 numerator;
    U128 total = 0;
    for (const auto& r : ratios) {
        U128 weight = r.native_reserve >> shift;
        numerator = U256::wrapping_add(numerator,
                                       mul_u128(static_cast<U128>(r.ratio_x18), weight));
        total += weight;
    }
    if (total == 0) return std::nullopt;

    auto narrow = U256::div(numerator, total).to_u128();
    if (!narrow || *narrow == 0 || *narrow > I128_MAX_U) return std::nullopt;
    return static_cast<I128>(*narrow);
}

// =============================================================================
// Derived Price Composer
// =============================================================================

std::optional<I128> compose_asset_usd(I128 native_usd_x18, I128 asset_per_native_x18) {
    if (asset_per_native_x18 <= 0 || native_usd_x18 <= 0) return std::nullopt;

    auto price = mul_div(native_usd_x18, X18_ONE, asset_per_native_x18);
    if (!price || *price <= 0) return std::nullopt;
    return price;
}

} // namespace omni
