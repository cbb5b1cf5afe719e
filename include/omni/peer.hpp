#ifndef OMNI_PEER_HPP
#define OMNI_PEER_HPP

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "codec.hpp"

namespace omni {

// =============================================================================
// Cross-Chain Collaborators
// =============================================================================

struct FeeQuote {
    U128 native_fee;
    U128 token_fee;
};

// Transport for outbound remote reads. Failures are reported by throwing.
class IReadChannel {
public:
    virtual ~IReadChannel() = default;

    virtual FeeQuote quote(const ReadRequest& request, const std::vector<uint8_t>& options) = 0;
    virtual void send(const ReadRequest& request, const std::vector<uint8_t>& encoded) = 0;
};

struct OracleEndpointConfig {
    Address primary;
    uint32_t read_channel_id;
    bool configured;
};

class IEndpointRegistry {
public:
    virtual ~IEndpointRegistry() = default;

    virtual Address endpoint_for(ChainId chain_id) const = 0;
    virtual OracleEndpointConfig oracle_config_for(ChainId chain_id) const = 0;
};

// =============================================================================
// Peer State
// =============================================================================

struct PeerEndpoint {
    ChainId chain_id = 0;
    Address remote_oracle{};
    bool active = false;

    // Last accepted response
    I128 last_price_x18 = 0;
    uint64_t last_timestamp = 0;
};

struct PeerPrice {
    I128 price_x18;
    uint64_t timestamp;
    bool valid;
};

// Result of request_remote_price / quote_fee
struct RequestTicket {
    int32_t status;
    uint64_t correlation_id;
    FeeQuote fee;
};

struct PendingRequest {
    ReadRequest request;
    uint64_t issued_at;
    uint64_t expires_at;
};

// A read built under the owner's lock and handed to the channel outside it
struct OutboundRead {
    int32_t status;
    ReadRequest request;
    std::shared_ptr<IReadChannel> channel;
};

// Outcome of matching a response payload to its request
struct ResponseMatch {
    int32_t status;
    ChainId chain_id;
    PriceResponse response;
};

constexpr uint32_t DEFAULT_READ_CHANNEL = 4294967295u;
constexpr uint16_t DEFAULT_CONFIRMATIONS = 20;

// =============================================================================
// PeerSyncManager
//
// Not internally synchronized; OmniOracle serializes access.
// =============================================================================

class PeerSyncManager {
public:
    explicit PeerSyncManager(ChainId local_chain);

    PeerSyncManager(const PeerSyncManager&) = delete;
    PeerSyncManager& operator=(const PeerSyncManager&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    int32_t register_peer(ChainId chain_id, const Address& remote_oracle, bool active = true);

    void set_read_channel(uint32_t channel_id, std::shared_ptr<IReadChannel> channel);
    uint32_t read_channel_id() const { return read_channel_id_; }

    void set_confirmations(uint16_t confirmations) { confirmations_ = confirmations; }
    int32_t set_request_ttl(uint64_t ttl);

    // Register every configured chain; returns the number registered
    size_t sync_from_registry(const IEndpointRegistry& registry,
                              const std::vector<ChainId>& chain_ids);

    // =========================================================================
    // Remote Reads
    // =========================================================================

    RequestTicket quote_fee(ChainId chain_id, uint64_t now,
                            const std::vector<uint8_t>& options = {});

    RequestTicket request_remote_price(ChainId chain_id, uint64_t now,
                                       const std::vector<uint8_t>& options = {});

    // request_remote_price in three steps so that no lock is held while the
    // channel runs: prepare_read, then send_read, then record_pending on success
    OutboundRead prepare_read(ChainId chain_id, uint64_t now, bool assign_id);
    static RequestTicket quote_read(const OutboundRead& read, const std::vector<uint8_t>& options);
    static RequestTicket send_read(const OutboundRead& read, const std::vector<uint8_t>& options);
    void record_pending(const ReadRequest& request, const FeeQuote& fee, uint64_t now);

    // Match and decode a payload; the request is consumed either way
    ResponseMatch match_response(uint64_t correlation_id, const std::vector<uint8_t>& payload,
                                 uint64_t now);

    // Update the peer cache. A zero timestamp or one ahead of now is
    // INVALID_TIMESTAMP, an older one STALE_CROSS_CHAIN_DATA; both leave it untouched.
    int32_t on_remote_response(ChainId chain_id, I128 price_x18, uint64_t timestamp,
                               uint64_t now);

    // Drop requests past their expiry; returns how many were dropped
    size_t expire_requests(uint64_t now);

    // =========================================================================
    // Queries
    // =========================================================================

    PeerPrice get_peer_price(ChainId chain_id, uint64_t now) const;
    bool cross_chain_valid(uint64_t now) const;

    // Active peers whose price is valid and within tolerance_bps of price_x18
    size_t count_agreeing(I128 price_x18, uint32_t tolerance_bps, uint64_t now) const;

    std::optional<PeerEndpoint> get_peer(ChainId chain_id) const;
    const std::vector<ChainId>& active_peers() const { return active_ids_; }
    size_t pending_count() const { return pending_.size(); }
    std::optional<PendingRequest> pending(uint64_t correlation_id) const;

    ChainId local_chain() const { return local_chain_; }

private:
    void remove_active(ChainId chain_id);

    ChainId local_chain_;

    std::unordered_map<ChainId, PeerEndpoint> peers_;
    std::vector<ChainId> active_ids_;   // Order-irrelevant

    std::shared_ptr<IReadChannel> channel_;
    uint32_t read_channel_id_ = 0;
    uint16_t confirmations_ = DEFAULT_CONFIRMATIONS;
    uint64_t request_ttl_ = windows::DEFAULT_REQUEST_TTL;

    std::unordered_map<uint64_t, PendingRequest> pending_;
    uint64_t next_correlation_id_ = 1;
};

} // namespace omni

#endif // OMNI_PEER_HPP
