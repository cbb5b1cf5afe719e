// =============================================================================
// oracle.cpp - OmniOracle mode state machine and price pipeline
// =============================================================================

#include "omni/oracle.hpp"
#include "omni/log.hpp"
#include "omni/uint256.hpp"

#include <chrono>
#include <map>

namespace omni {

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

namespace {

bool within(uint64_t timestamp, uint64_t now, uint64_t max_age) {
    if (timestamp == 0 || timestamp > now) return false;
    return now - timestamp <= max_age;
}

// Claims the in-flight flag for one pipeline call
class InFlight {
public:
    explicit InFlight(std::atomic<bool>& flag) : flag_(flag), owns_(!flag.exchange(true)) {}
    ~InFlight() {
        if (owns_) flag_.store(false);
    }

    InFlight(const InFlight&) = delete;
    InFlight& operator=(const InFlight&) = delete;

    bool owns() const { return owns_; }

private:
    std::atomic<bool>& flag_;
    bool owns_;
};

UpdateReport failed(int32_t status) {
    return UpdateReport{status, 0, 0, 0, 0, false, AggregationTier::LIVE};
}

} // namespace

OmniOracle::OmniOracle(ChainId local_chain, Clock clock)
    : local_chain_(local_chain)
    , clock_(clock ? std::move(clock) : Clock(system_clock_seconds))
    , feeds_()
    , adapters_(AdapterTable::with_defaults(feeds_))
    , aggregator_(adapters_)
    , liquidity_()
    , peers_(local_chain) {}

// =============================================================================
// Mode
// =============================================================================

int32_t OmniOracle::set_mode(OracleMode mode) {
    if (mode == OracleMode::UNINITIALIZED) return errors::INVALID_MODE_TRANSITION;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (mode_ != mode) {
        log::get()->info("mode {} -> {}", to_string(mode_), to_string(mode));
        mode_ = mode;
    }
    return errors::OK;
}

OracleMode OmniOracle::mode() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return mode_;
}

// =============================================================================
// Source Configuration
// =============================================================================

int32_t OmniOracle::add_source(uint32_t source_id, const FeedSource& source) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.add_source(source_id, source);
}

int32_t OmniOracle::update_source(uint32_t source_id, const FeedSource& source) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.update_source(source_id, source);
}

int32_t OmniOracle::remove_source(uint32_t source_id) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.remove_source(source_id);
}

int32_t OmniOracle::set_source_weight(uint32_t source_id, uint32_t weight) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.set_weight(source_id, weight);
}

int32_t OmniOracle::set_source_active(uint32_t source_id, bool active) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.set_active(source_id, active);
}

int32_t OmniOracle::set_min_valid_sources(uint8_t min_valid) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.set_min_valid_sources(min_valid);
}

std::optional<FeedSource> OmniOracle::get_source(uint32_t source_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.get_source(source_id);
}

std::vector<uint32_t> OmniOracle::source_ids() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.source_ids();
}

std::vector<SourceReading> OmniOracle::last_readings() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.last_readings();
}

FallbackCache OmniOracle::fallback() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return aggregator_.fallback();
}

// =============================================================================
// Liquidity Configuration
// =============================================================================

int32_t OmniOracle::add_pool(const PoolConfig& config) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return liquidity_.add_pool(config);
}

int32_t OmniOracle::configure_twap(bool enabled, uint64_t period) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    int32_t rc = liquidity_.set_twap_period(period);
    if (rc != errors::OK) return rc;
    liquidity_.set_twap_enabled(enabled);
    return errors::OK;
}

void OmniOracle::init_twap() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    liquidity_.init_twap();
}

std::optional<TwapState> OmniOracle::twap_state(size_t pool_index) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    const TwapEstimator* pool = liquidity_.pool(pool_index);
    if (!pool) return std::nullopt;
    return pool->state();
}

// =============================================================================
// Peer Configuration
// =============================================================================

int32_t OmniOracle::register_peer(ChainId chain_id, const Address& remote_oracle, bool active) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return peers_.register_peer(chain_id, remote_oracle, active);
}

void OmniOracle::set_read_channel(uint32_t channel_id, std::shared_ptr<IReadChannel> channel) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    peers_.set_read_channel(channel_id, std::move(channel));
}

int32_t OmniOracle::configure_reads(uint16_t confirmations, uint64_t request_ttl) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    int32_t rc = peers_.set_request_ttl(request_ttl);
    if (rc != errors::OK) return rc;
    peers_.set_confirmations(confirmations);
    return errors::OK;
}

size_t OmniOracle::sync_peers_from_registry(const IEndpointRegistry& registry,
                                            const std::vector<ChainId>& chain_ids) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return peers_.sync_from_registry(registry, chain_ids);
}

int32_t OmniOracle::set_peer_agreement(uint8_t min_agreement, uint32_t tolerance_bps) {
    if (min_agreement == 0) return errors::INVALID_CONFIGURATION;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    min_peer_agreement_ = min_agreement;
    agreement_tolerance_bps_ = tolerance_bps;
    return errors::OK;
}

// =============================================================================
// Emergency Override & Circuit Breaker
// =============================================================================

int32_t OmniOracle::activate_emergency_mode(I128 price_x18) {
    if (price_x18 <= 0) return errors::INVALID_PRICE;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    emergency_mode_ = true;
    emergency_price_x18_ = price_x18;
    emergency_since_ = clock_();
    log::get()->warn("emergency mode on, price pinned at {}", x18::to_string(price_x18));
    return errors::OK;
}

void OmniOracle::deactivate_emergency_mode() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (!emergency_mode_) return;

    emergency_mode_ = false;
    emergency_price_x18_ = 0;
    emergency_since_ = 0;
    log::get()->warn("emergency mode off");
}

void OmniOracle::set_deviation_gate(uint32_t max_deviation_bps, uint64_t grace_period) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    max_deviation_bps_ = max_deviation_bps;
    grace_period_ = grace_period;
}

void OmniOracle::reset_circuit_breaker() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (breaker_tripped_) log::get()->info("circuit breaker reset");
    breaker_tripped_ = false;
}

bool OmniOracle::in_grace_period(uint64_t now) const {
    if (!price_initialized_ || grace_period_ == 0) return false;
    return now < first_accepted_at_ + grace_period_;
}

bool OmniOracle::deviates(I128 price_x18) const {
    if (max_deviation_bps_ == 0 || !price_initialized_ || latest_price_x18_ <= 0) return false;

    auto bps = mul_div(x18::abs(price_x18 - latest_price_x18_), BPS_DENOMINATOR,
                       latest_price_x18_);
    // Unrepresentable deviation is certainly too large
    if (!bps) return true;
    return *bps > static_cast<I128>(max_deviation_bps_);
}

// =============================================================================
// Price Pipeline (Producer)
// =============================================================================

int32_t OmniOracle::pipeline_blocked() const {
    if (mode_ != OracleMode::PRODUCER) return errors::INVALID_MODE;
    if (emergency_mode_) return errors::EMERGENCY_ACTIVE;
    if (breaker_tripped_) return errors::CIRCUIT_BREAKER_TRIPPED;
    return errors::OK;
}

UpdateReport OmniOracle::update_price() {
    InFlight guard(in_flight_);
    if (!guard.owns()) return failed(errors::REENTRANCY);

    std::map<uint32_t, FeedSource> sources;
    std::vector<std::shared_ptr<ILiquidityPool>> pools;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        int32_t rc = pipeline_blocked();
        if (rc != errors::OK) return failed(rc);

        sources = aggregator_.sources();
        pools = liquidity_.handles();
    }

    uint64_t now = clock_();

    // Collaborator reads run unlocked
    std::vector<SourceReading> readings = aggregator_.collect(sources, now);
    auto observations = LiquidityRatioEstimator::observe(pools);

    std::unique_lock<std::shared_mutex> lock(state_mutex_);

    // Mode or overrides may have changed while reading
    int32_t rc = pipeline_blocked();
    if (rc != errors::OK) return failed(rc);

    // 1. Native/USD from the feed sources
    auto native = aggregator_.aggregate(std::move(readings), now);
    if (!native) {
        log::get()->error("price update failed: insufficient sources");
        return failed(errors::INSUFFICIENT_SOURCES);
    }

    // 2. Asset-per-native from the pools
    auto ratio = liquidity_.ratio(observations);
    if (!ratio) {
        log::get()->error("price update failed: liquidity ratio undefined");
        return failed(errors::RATIO_UNDEFINED);
    }

    // 3. Compose
    auto asset = compose_asset_usd(native->price_x18, *ratio);
    if (!asset) {
        log::get()->error("price update failed: cannot compose {} / {}",
                          x18::to_string(native->price_x18), x18::to_string(*ratio));
        return failed(errors::RATIO_UNDEFINED);
    }

    // 4. Deviation gate
    if (!in_grace_period(now) && deviates(*asset)) {
        breaker_tripped_ = true;
        log::get()->error("circuit breaker tripped: {} vs last {}", x18::to_string(*asset),
                          x18::to_string(latest_price_x18_));
        return failed(errors::DEVIATION_EXCEEDED);
    }

    // 5. Commit; a cached native price carries its own age forward
    latest_price_x18_ = *asset;
    latest_timestamp_ = native->timestamp;
    native_price_x18_ = native->price_x18;
    native_timestamp_ = native->timestamp;
    last_degraded_ = native->degraded;
    if (!price_initialized_) {
        price_initialized_ = true;
        first_accepted_at_ = now;
    }

    if (native->degraded) {
        log::get()->warn("degraded update ({}): asset {} native {}", to_string(native->tier),
                         x18::to_string(*asset), x18::to_string(native->price_x18));
    } else {
        log::get()->info("price updated: asset {} native {} ({} sources)",
                         x18::to_string(*asset), x18::to_string(native->price_x18),
                         native->valid_count);
    }

    return UpdateReport{errors::OK, *asset, native->price_x18, *ratio, native->timestamp,
                        native->degraded, native->tier};
}

// =============================================================================
// Cross-Chain Sync
// =============================================================================

RequestTicket OmniOracle::quote_fee(ChainId chain_id, const std::vector<uint8_t>& options) {
    InFlight guard(in_flight_);
    if (!guard.owns()) return RequestTicket{errors::REENTRANCY, 0, FeeQuote{0, 0}};

    OutboundRead read{};
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        read = peers_.prepare_read(chain_id, clock_(), false);
    }
    return PeerSyncManager::quote_read(read, options);
}

RequestTicket OmniOracle::request_remote_price(ChainId chain_id,
                                               const std::vector<uint8_t>& options) {
    InFlight guard(in_flight_);
    if (!guard.owns()) return RequestTicket{errors::REENTRANCY, 0, FeeQuote{0, 0}};

    uint64_t now = clock_();
    OutboundRead read{};
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        peers_.expire_requests(now);
        read = peers_.prepare_read(chain_id, now, true);
    }

    // The channel runs unlocked
    RequestTicket ticket = PeerSyncManager::send_read(read, options);
    if (ticket.status != errors::OK) return ticket;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    peers_.record_pending(read.request, ticket.fee, now);
    return ticket;
}

int32_t OmniOracle::on_remote_response(uint64_t correlation_id,
                                       const std::vector<uint8_t>& payload) {
    InFlight guard(in_flight_);
    if (!guard.owns()) return errors::REENTRANCY;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    uint64_t now = clock_();
    ResponseMatch match = peers_.match_response(correlation_id, payload, now);
    if (match.status != errors::OK) return match.status;

    return apply_response(match.chain_id, match.response.price_x18, match.response.timestamp,
                          now);
}

int32_t OmniOracle::on_remote_response(ChainId chain_id, I128 price_x18, uint64_t timestamp) {
    InFlight guard(in_flight_);
    if (!guard.owns()) return errors::REENTRANCY;

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return apply_response(chain_id, price_x18, timestamp, clock_());
}

int32_t OmniOracle::apply_response(ChainId chain_id, I128 price_x18, uint64_t timestamp,
                                   uint64_t now) {
    int32_t rc = peers_.on_remote_response(chain_id, price_x18, timestamp, now);
    if (rc != errors::OK) return rc;

    // Producers only cache peer prices
    if (mode_ != OracleMode::CONSUMER) return errors::OK;

    if (emergency_mode_) {
        log::get()->info("chain {} price cached; emergency mode blocks adoption", chain_id);
        return errors::OK;
    }
    if (price_x18 <= 0) return errors::INVALID_PRICE;
    if (timestamp < latest_timestamp_) {
        log::get()->debug("chain {} price at {} older than local {}", chain_id, timestamp,
                          latest_timestamp_);
        return errors::STALE_CROSS_CHAIN_DATA;
    }

    if (min_peer_agreement_ > 1) {
        size_t agreeing = peers_.count_agreeing(price_x18, agreement_tolerance_bps_, now);
        if (agreeing < min_peer_agreement_) {
            log::get()->warn("chain {} price {} not adopted: {} of {} peers agree", chain_id,
                             x18::to_string(price_x18), agreeing, min_peer_agreement_);
            return errors::PEER_DISAGREEMENT;
        }
    }

    latest_price_x18_ = price_x18;
    latest_timestamp_ = timestamp;
    last_degraded_ = false;
    if (!price_initialized_) {
        price_initialized_ = true;
        first_accepted_at_ = now;
    }
    log::get()->info("adopted chain {} price {} at {}", chain_id, x18::to_string(price_x18),
                     timestamp);
    return errors::OK;
}

std::optional<std::vector<uint8_t>> OmniOracle::serve_read(uint32_t call_selector) const {
    if (call_selector != SELECTOR_LATEST_PRICE) return std::nullopt;

    LatestPrice latest = latest_price();
    return codec::encode_price_response(latest.price_x18, latest.timestamp);
}

size_t OmniOracle::expire_requests() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return peers_.expire_requests(clock_());
}

// =============================================================================
// Queries
// =============================================================================

LatestPrice OmniOracle::effective_latest() const {
    if (emergency_mode_) return LatestPrice{emergency_price_x18_, emergency_since_};
    if (!price_initialized_) return LatestPrice{0, 0};
    return LatestPrice{latest_price_x18_, latest_timestamp_};
}

LatestPrice OmniOracle::latest_price() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    LatestPrice latest = effective_latest();
    if (latest.price_x18 <= 0 || !within(latest.timestamp, clock_(), windows::LATEST_MAX_AGE)) {
        return LatestPrice{0, 0};
    }
    return latest;
}

std::optional<LatestPrice> OmniOracle::native_price() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (native_price_x18_ <= 0 || native_timestamp_ == 0) return std::nullopt;
    return LatestPrice{native_price_x18_, native_timestamp_};
}

PeerPrice OmniOracle::get_peer_price(ChainId chain_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return peers_.get_peer_price(chain_id, clock_());
}

std::vector<ChainId> OmniOracle::active_peers() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return peers_.active_peers();
}

ValidationReport OmniOracle::validate() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    uint64_t now = clock_();
    LatestPrice latest = effective_latest();

    ValidationReport report{};
    report.local_valid = latest.price_x18 > 0 &&
                         within(latest.timestamp, now, windows::LOCAL_FRESHNESS);
    report.cross_chain_valid = peers_.cross_chain_valid(now);
    return report;
}

bool OmniOracle::is_fresh() const {
    return validate().local_valid;
}

OracleStatus OmniOracle::status() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    uint64_t now = clock_();

    OracleStatus s{};
    s.mode = mode_;
    s.emergency_mode = emergency_mode_;
    s.emergency_price_x18 = emergency_price_x18_;
    s.circuit_breaker_tripped = breaker_tripped_;
    s.in_grace_period = in_grace_period(now);
    s.active_sources = aggregator_.active_count();
    s.min_valid_sources = aggregator_.min_valid_sources();
    s.max_deviation_bps = max_deviation_bps_;
    s.active_peers = peers_.active_peers().size();
    s.pending_requests = peers_.pending_count();
    s.price_initialized = price_initialized_;
    s.last_degraded = last_degraded_;
    return s;
}

} // namespace omni
