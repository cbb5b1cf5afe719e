#ifndef OMNI_ORACLE_HPP
#define OMNI_ORACLE_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "sources.hpp"
#include "aggregator.hpp"
#include "liquidity.hpp"
#include "peer.hpp"

namespace omni {

// Seconds since the epoch
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// =============================================================================
// Query Results
// =============================================================================

// (0, 0) means "no data", never a zero price
struct LatestPrice {
    I128 price_x18;
    uint64_t timestamp;
};

struct ValidationReport {
    bool local_valid;
    bool cross_chain_valid;
};

struct UpdateReport {
    int32_t status;
    I128 asset_price_x18;
    I128 native_price_x18;
    I128 ratio_x18;
    uint64_t timestamp;
    bool degraded;
    AggregationTier tier;
};

struct OracleStatus {
    OracleMode mode;
    bool emergency_mode;
    I128 emergency_price_x18;
    bool circuit_breaker_tripped;
    bool in_grace_period;
    size_t active_sources;
    uint8_t min_valid_sources;
    uint32_t max_deviation_bps;
    size_t active_peers;
    size_t pending_requests;
    bool price_initialized;
    bool last_degraded;
};

// =============================================================================
// OmniOracle - canonical asset/USD price with cross-chain sync
//
// Mutating pipeline calls (update_price, request_remote_price, responses) are
// mutually exclusive and non-reentrant: a call made while another is in
// flight returns errors::REENTRANCY. Queries take a shared lock. Feeds, pools
// and the read channel are called with no lock held, so they may query the
// oracle.
// =============================================================================

class OmniOracle {
public:
    explicit OmniOracle(ChainId local_chain, Clock clock = Clock());
    ~OmniOracle() = default;

    // Non-copyable
    OmniOracle(const OmniOracle&) = delete;
    OmniOracle& operator=(const OmniOracle&) = delete;

    // Collaborator bindings; bind before the oracle is shared across threads
    FeedDirectory& feeds() { return feeds_; }

    // =========================================================================
    // Mode
    // =========================================================================

    int32_t set_mode(OracleMode mode);
    OracleMode mode() const;

    // =========================================================================
    // Source Configuration
    // =========================================================================

    int32_t add_source(uint32_t source_id, const FeedSource& source);
    int32_t update_source(uint32_t source_id, const FeedSource& source);
    int32_t remove_source(uint32_t source_id);
    int32_t set_source_weight(uint32_t source_id, uint32_t weight);
    int32_t set_source_active(uint32_t source_id, bool active);
    int32_t set_min_valid_sources(uint8_t min_valid);

    std::optional<FeedSource> get_source(uint32_t source_id) const;
    std::vector<uint32_t> source_ids() const;
    std::vector<SourceReading> last_readings() const;
    FallbackCache fallback() const;

    // =========================================================================
    // Liquidity Configuration
    // =========================================================================

    int32_t add_pool(const PoolConfig& config);
    int32_t configure_twap(bool enabled, uint64_t period);
    void init_twap();
    std::optional<TwapState> twap_state(size_t pool_index) const;

    // =========================================================================
    // Peer Configuration
    // =========================================================================

    int32_t register_peer(ChainId chain_id, const Address& remote_oracle, bool active = true);
    void set_read_channel(uint32_t channel_id, std::shared_ptr<IReadChannel> channel);
    int32_t configure_reads(uint16_t confirmations, uint64_t request_ttl);
    size_t sync_peers_from_registry(const IEndpointRegistry& registry,
                                    const std::vector<ChainId>& chain_ids);

    // Consumer adoption needs min_agreement valid peers within tolerance_bps;
    // 1 adopts every accepted response (last write wins)
    int32_t set_peer_agreement(uint8_t min_agreement, uint32_t tolerance_bps);

    // =========================================================================
    // Emergency Override & Circuit Breaker
    // =========================================================================

    // Fixed operator price; blocks pipeline updates and peer adoption
    int32_t activate_emergency_mode(I128 price_x18);
    void deactivate_emergency_mode();

    // max_deviation_bps == 0 disables the gate
    void set_deviation_gate(uint32_t max_deviation_bps, uint64_t grace_period);
    void reset_circuit_breaker();

    // =========================================================================
    // Price Pipeline (Producer)
    // =========================================================================

    UpdateReport update_price();

    // =========================================================================
    // Cross-Chain Sync
    // =========================================================================

    RequestTicket quote_fee(ChainId chain_id, const std::vector<uint8_t>& options = {});
    RequestTicket request_remote_price(ChainId chain_id, const std::vector<uint8_t>& options = {});

    // Inbound payload for a pending request
    int32_t on_remote_response(uint64_t correlation_id, const std::vector<uint8_t>& payload);

    // Already-decoded response from chain_id
    int32_t on_remote_response(ChainId chain_id, I128 price_x18, uint64_t timestamp);

    // Answer a peer's read; nullopt for an unknown selector
    std::optional<std::vector<uint8_t>> serve_read(uint32_t call_selector) const;

    size_t expire_requests();

    // =========================================================================
    // Queries
    // =========================================================================

    LatestPrice latest_price() const;
    std::optional<LatestPrice> native_price() const;
    PeerPrice get_peer_price(ChainId chain_id) const;
    std::vector<ChainId> active_peers() const;
    ValidationReport validate() const;
    bool is_fresh() const;
    OracleStatus status() const;

    ChainId local_chain() const { return local_chain_; }

private:
    int32_t apply_response(ChainId chain_id, I128 price_x18, uint64_t timestamp, uint64_t now);
    int32_t pipeline_blocked() const;
    bool in_grace_period(uint64_t now) const;
    bool deviates(I128 price_x18) const;
    LatestPrice effective_latest() const;

    ChainId local_chain_;
    Clock clock_;

    // Declaration order matters: adapters_ resolve through feeds_
    FeedDirectory feeds_;
    AdapterTable adapters_;
    WeightedAggregator aggregator_;
    LiquidityRatioEstimator liquidity_;
    PeerSyncManager peers_;

    OracleMode mode_ = OracleMode::UNINITIALIZED;

    // Local latest price
    I128 latest_price_x18_ = 0;
    uint64_t latest_timestamp_ = 0;
    I128 native_price_x18_ = 0;
    uint64_t native_timestamp_ = 0;
    bool price_initialized_ = false;
    uint64_t first_accepted_at_ = 0;
    bool last_degraded_ = false;

    // Emergency override
    bool emergency_mode_ = false;
    I128 emergency_price_x18_ = 0;
    uint64_t emergency_since_ = 0;

    // Deviation gate
    uint32_t max_deviation_bps_ = 0;
    uint64_t grace_period_ = 0;
    bool breaker_tripped_ = false;

    // Consumer adoption
    uint8_t min_peer_agreement_ = 1;
    uint32_t agreement_tolerance_bps_ = 0;

    mutable std::shared_mutex state_mutex_;
    std::atomic<bool> in_flight_{false};
};

} // namespace omni

#endif // OMNI_ORACLE_HPP
