// =============================================================================
// peer.cpp - Peer endpoint registry and the remote-read request cycle
// =============================================================================

#include "omni/peer.hpp"
#include "omni/log.hpp"
#include "omni/uint256.hpp"

#include <algorithm>
#include <exception>

namespace omni {

PeerSyncManager::PeerSyncManager(ChainId local_chain) : local_chain_(local_chain) {}

// =============================================================================
// Configuration
// =============================================================================

int32_t PeerSyncManager::register_peer(ChainId chain_id, const Address& remote_oracle,
                                       bool active) {
    if (chain_id == 0 || chain_id == local_chain_) return errors::INVALID_CONFIGURATION;
    if (active && is_zero(remote_oracle)) return errors::INVALID_CONFIGURATION;

    PeerEndpoint& peer = peers_[chain_id];
    bool was_active = peer.active;

    peer.chain_id = chain_id;
    peer.remote_oracle = remote_oracle;
    peer.active = active;

    if (active && !was_active) {
        active_ids_.push_back(chain_id);
    } else if (!active && was_active) {
        remove_active(chain_id);
    }

    log::get()->info("peer {} {} at {}", chain_id, active ? "active" : "inactive",
                     to_hex(remote_oracle));
    return errors::OK;
}

void PeerSyncManager::remove_active(ChainId chain_id) {
    auto it = std::find(active_ids_.begin(), active_ids_.end(), chain_id);
    if (it == active_ids_.end()) return;

    // Swap with last, then truncate
    *it = active_ids_.back();
    active_ids_.pop_back();
}

void PeerSyncManager::set_read_channel(uint32_t channel_id, std::shared_ptr<IReadChannel> channel) {
    read_channel_id_ = channel_id;
    channel_ = std::move(channel);
}

int32_t PeerSyncManager::set_request_ttl(uint64_t ttl) {
    if (ttl == 0) return errors::INVALID_CONFIGURATION;
    request_ttl_ = ttl;
    return errors::OK;
}

size_t PeerSyncManager::sync_from_registry(const IEndpointRegistry& registry,
                                           const std::vector<ChainId>& chain_ids) {
    size_t registered = 0;

    try {
        OracleEndpointConfig local = registry.oracle_config_for(local_chain_);
        if (local.configured && local.read_channel_id != 0) {
            read_channel_id_ = local.read_channel_id;
        }
    } catch (const std::exception& e) {
        log::get()->warn("registry lookup for local chain {} failed: {}", local_chain_, e.what());
    }

    for (ChainId chain_id : chain_ids) {
        if (chain_id == local_chain_) continue;

        OracleEndpointConfig cfg{};
        try {
            cfg = registry.oracle_config_for(chain_id);
        } catch (const std::exception& e) {
            log::get()->warn("registry lookup for chain {} failed: {}", chain_id, e.what());
            continue;
        }
        if (!cfg.configured || is_zero(cfg.primary)) continue;

        if (register_peer(chain_id, cfg.primary, true) == errors::OK) {
            registered++;
        }
    }
    return registered;
}

// =============================================================================
// Remote Reads
// =============================================================================

OutboundRead PeerSyncManager::prepare_read(ChainId chain_id, uint64_t now, bool assign_id) {
    OutboundRead read{errors::OK, ReadRequest{}, channel_};
    if (!channel_ || read_channel_id_ == 0) {
        read.status = errors::READ_CHANNEL_UNSET;
        return read;
    }

    auto it = peers_.find(chain_id);
    if (it == peers_.end() || !it->second.active) {
        read.status = errors::PEER_INACTIVE;
        return read;
    }
    if (is_zero(it->second.remote_oracle)) {
        read.status = errors::PEER_NOT_CONFIGURED;
        return read;
    }

    read.request.correlation_id = assign_id ? next_correlation_id_++ : 0;
    read.request.target_chain = chain_id;
    read.request.target = it->second.remote_oracle;
    read.request.call_selector = SELECTOR_LATEST_PRICE;
    read.request.timestamp_hint = now;
    read.request.confirmations = confirmations_;
    return read;
}

RequestTicket PeerSyncManager::quote_read(const OutboundRead& read,
                                          const std::vector<uint8_t>& options) {
    if (read.status != errors::OK) return RequestTicket{read.status, 0, FeeQuote{0, 0}};

    try {
        return RequestTicket{errors::OK, 0, read.channel->quote(read.request, options)};
    } catch (const std::exception& e) {
        log::get()->error("fee quote for chain {} failed: {}", read.request.target_chain,
                          e.what());
        return RequestTicket{errors::SOURCE_UNAVAILABLE, 0, FeeQuote{0, 0}};
    }
}

RequestTicket PeerSyncManager::send_read(const OutboundRead& read,
                                         const std::vector<uint8_t>& options) {
    if (read.status != errors::OK) return RequestTicket{read.status, 0, FeeQuote{0, 0}};

    FeeQuote fee{0, 0};
    try {
        fee = read.channel->quote(read.request, options);
        read.channel->send(read.request, codec::encode_read_request(read.request, options));
    } catch (const std::exception& e) {
        log::get()->error("remote read to chain {} failed: {}", read.request.target_chain,
                          e.what());
        return RequestTicket{errors::SOURCE_UNAVAILABLE, 0, FeeQuote{0, 0}};
    }
    return RequestTicket{errors::OK, read.request.correlation_id, fee};
}

void PeerSyncManager::record_pending(const ReadRequest& request, const FeeQuote& fee,
                                     uint64_t now) {
    pending_[request.correlation_id] = PendingRequest{request, now, now + request_ttl_};
    log::get()->info("remote read {} sent to chain {} (fee {})", request.correlation_id,
                     request.target_chain, x18::to_string(fee.native_fee));
}

RequestTicket PeerSyncManager::quote_fee(ChainId chain_id, uint64_t now,
                                         const std::vector<uint8_t>& options) {
    return quote_read(prepare_read(chain_id, now, false), options);
}

RequestTicket PeerSyncManager::request_remote_price(ChainId chain_id, uint64_t now,
                                                    const std::vector<uint8_t>& options) {
    expire_requests(now);

    OutboundRead read = prepare_read(chain_id, now, true);
    RequestTicket ticket = send_read(read, options);
    if (ticket.status == errors::OK) record_pending(read.request, ticket.fee, now);
    return ticket;
}

ResponseMatch PeerSyncManager::match_response(uint64_t correlation_id,
                                              const std::vector<uint8_t>& payload,
                                              uint64_t now) {
    ResponseMatch match{errors::OK, 0, PriceResponse{0, 0}};

    auto it = pending_.find(correlation_id);
    if (it == pending_.end()) {
        match.status = errors::UNKNOWN_REQUEST;
        return match;
    }

    PendingRequest request = it->second;
    pending_.erase(it);
    match.chain_id = request.request.target_chain;

    if (now > request.expires_at) {
        log::get()->warn("response {} from chain {} arrived after expiry", correlation_id,
                         match.chain_id);
        match.status = errors::REQUEST_EXPIRED;
        return match;
    }

    auto decoded = codec::decode_price_response(payload);
    if (!decoded) {
        log::get()->warn("malformed response {} from chain {} ({} bytes)", correlation_id,
                         match.chain_id, payload.size());
        match.status = errors::MALFORMED_PAYLOAD;
        return match;
    }

    match.response = *decoded;
    return match;
}

int32_t PeerSyncManager::on_remote_response(ChainId chain_id, I128 price_x18, uint64_t timestamp,
                                            uint64_t now) {
    if (timestamp == 0) return errors::INVALID_TIMESTAMP;
    if (timestamp > now) {
        log::get()->warn("chain {} response at {} is ahead of local time {}", chain_id,
                         timestamp, now);
        return errors::INVALID_TIMESTAMP;
    }

    auto it = peers_.find(chain_id);
    if (it == peers_.end()) return errors::PEER_NOT_CONFIGURED;

    PeerEndpoint& peer = it->second;
    if (timestamp < peer.last_timestamp) {
        log::get()->warn("chain {} response at {} older than cached {}", chain_id, timestamp,
                         peer.last_timestamp);
        return errors::STALE_CROSS_CHAIN_DATA;
    }

    peer.last_price_x18 = price_x18;
    peer.last_timestamp = timestamp;
    log::get()->info("chain {} price {} at {}", chain_id, x18::to_string(price_x18), timestamp);
    return errors::OK;
}

size_t PeerSyncManager::expire_requests(uint64_t now) {
    size_t dropped = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now > it->second.expires_at) {
            it = pending_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        log::get()->debug("expired {} unanswered remote reads", dropped);
    }
    return dropped;
}

// =============================================================================
// Queries
// =============================================================================

PeerPrice PeerSyncManager::get_peer_price(ChainId chain_id, uint64_t now) const {
    auto it = peers_.find(chain_id);
    if (it == peers_.end()) return PeerPrice{0, 0, false};

    const PeerEndpoint& peer = it->second;
    bool fresh = peer.last_timestamp <= now &&
                 now - peer.last_timestamp <= windows::PEER_FRESHNESS;
    bool valid = peer.active && peer.last_timestamp > 0 && fresh;
    return PeerPrice{peer.last_price_x18, peer.last_timestamp, valid};
}

bool PeerSyncManager::cross_chain_valid(uint64_t now) const {
    for (ChainId chain_id : active_ids_) {
        if (get_peer_price(chain_id, now).valid) return true;
    }
    return false;
}

size_t PeerSyncManager::count_agreeing(I128 price_x18, uint32_t tolerance_bps,
                                       uint64_t now) const {
    if (price_x18 <= 0) return 0;

    size_t count = 0;
    for (ChainId chain_id : active_ids_) {
        PeerPrice peer = get_peer_price(chain_id, now);
        if (!peer.valid) continue;

        auto bps = mul_div(x18::abs(peer.price_x18 - price_x18), BPS_DENOMINATOR, price_x18);
        if (bps && *bps <= static_cast<I128>(tolerance_bps)) count++;
    }
    return count;
}

std::optional<PeerEndpoint> PeerSyncManager::get_peer(ChainId chain_id) const {
    auto it = peers_.find(chain_id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

std::optional<PendingRequest> PeerSyncManager::pending(uint64_t correlation_id) const {
    auto it = pending_.find(correlation_id);
    if (it == pending_.end()) return std::nullopt;
    return it->second;
}

} // namespace omni
