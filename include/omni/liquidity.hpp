#ifndef OMNI_LIQUIDITY_HPP
#define OMNI_LIQUIDITY_HPP

#include <memory>
#include <optional>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"

namespace omni {

// =============================================================================
// Liquidity Pool Collaborator (constant-product pair, read-only)
// =============================================================================

struct PoolReserves {
    U128 reserve0;
    U128 reserve1;
    uint32_t last_timestamp;
};

class ILiquidityPool {
public:
    virtual ~ILiquidityPool() = default;

    virtual PoolReserves reserves() = 0;
    virtual Address token0() = 0;
    virtual Address token1() = 0;

    // UQ112x112 price accumulators, summed per second
    virtual U256 cumulative_price0() = 0;
    virtual U256 cumulative_price1() = 0;
};

// =============================================================================
// Pool Configuration and TWAP State
// =============================================================================

// ratio_x18 is asset units per one native unit, decimal corrected
struct PoolConfig {
    std::shared_ptr<ILiquidityPool> pool;
    Address native_token{};
    uint8_t native_decimals = 18;
    uint8_t asset_decimals = 18;
};

struct TwapState {
    U256 cumulative0_last;
    U256 cumulative1_last;
    uint32_t last_timestamp = 0;
    I128 ratio_x18 = 0;
    bool initialized = false;
};

// One read of a pool's reserves and both accumulators
struct PoolObservation {
    PoolReserves reserves;
    U256 cumulative0;
    U256 cumulative1;
};

// nullopt when the pool cannot be read
std::optional<PoolObservation> observe_pool(ILiquidityPool& pool);

// Ratio of one pool plus the native-side reserve used for weighting
struct PoolRatio {
    I128 ratio_x18;
    U128 native_reserve;
    bool from_twap;
};

constexpr unsigned UQ112_SHIFT = 112;
constexpr size_t MAX_POOLS = 2;

// =============================================================================
// TwapEstimator - one pool's spot and time-weighted ratio
// =============================================================================

class TwapEstimator {
public:
    explicit TwapEstimator(PoolConfig config);

    // Snapshot accumulators; no-op when the pool cannot be read
    void init();
    void init(const PoolObservation& observation);

    // Completes a window when elapsed >= period; returns the new TWAP ratio
    std::optional<PoolRatio> update(uint64_t period);
    std::optional<PoolRatio> update(const PoolObservation& observation, uint64_t period);

    // Ratio from current reserves; nullopt on a zero reserve or read failure
    std::optional<PoolRatio> spot() const;
    std::optional<PoolRatio> spot(const PoolObservation& observation) const;

    // TWAP when enabled and a window completes, spot otherwise. An enabled but
    // uninitialized TWAP is first seeded from the observation.
    std::optional<PoolRatio> resolve(const PoolObservation& observation, bool twap_enabled,
                                     uint64_t period);

    const TwapState& state() const { return state_; }
    const PoolConfig& config() const { return config_; }

    // Locates the native token in the pair; INVALID_CONFIGURATION when absent
    int32_t resolve_tokens();

private:
    std::optional<I128> correct_decimals(const U256& raw_x18) const;

    PoolConfig config_;
    TwapState state_;
    bool native_token0_ = true;
};

// =============================================================================
// LiquidityRatioEstimator - combines up to two pools
//
// Not internally synchronized; OmniOracle serializes access.
// =============================================================================

class LiquidityRatioEstimator {
public:
    LiquidityRatioEstimator() = default;

    LiquidityRatioEstimator(const LiquidityRatioEstimator&) = delete;
    LiquidityRatioEstimator& operator=(const LiquidityRatioEstimator&) = delete;

    int32_t add_pool(const PoolConfig& config);
    size_t pool_count() const { return pools_.size(); }

    void set_twap_enabled(bool enabled) { twap_enabled_ = enabled; }
    bool twap_enabled() const { return twap_enabled_; }
    int32_t set_twap_period(uint64_t period);
    uint64_t twap_period() const { return twap_period_; }

    // Snapshot every pool's accumulators
    void init_twap();

    // Pool handles, so reads can run without the owner's lock held
    std::vector<std::shared_ptr<ILiquidityPool>> handles() const;

    // One observation per handle, nullopt where the pool cannot be read
    static std::vector<std::optional<PoolObservation>> observe(
        const std::vector<std::shared_ptr<ILiquidityPool>>& handles);

    // Per-pool TWAP-or-spot over observations in pool order, reserve-weighted
    // across pools; pools without an observation are left out
    std::optional<I128> ratio(const std::vector<std::optional<PoolObservation>>& observations);

    // observe() then ratio() over the configured pools
    std::optional<I128> ratio();

    // Spot ratios only, no state change
    std::optional<I128> spot_ratio() const;

    const TwapEstimator* pool(size_t index) const;

    static std::optional<I128> combine(const std::vector<PoolRatio>& ratios);

private:
    std::vector<TwapEstimator> pools_;
    bool twap_enabled_ = true;
    uint64_t twap_period_ = windows::DEFAULT_TWAP_PERIOD;
};

// =============================================================================
// Derived Price Composer
// =============================================================================

// asset_usd = native_usd * 1e18 / ratio (ratio = asset per native)
std::optional<I128> compose_asset_usd(I128 native_usd_x18, I128 asset_per_native_x18);

} // namespace omni

#endif // OMNI_LIQUIDITY_HPP
