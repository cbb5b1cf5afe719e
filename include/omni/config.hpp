#ifndef OMNI_CONFIG_HPP
#define OMNI_CONFIG_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "sources.hpp"
#include "liquidity.hpp"
#include "peer.hpp"

namespace omni {

class OmniOracle;

// =============================================================================
// Settings
// =============================================================================

struct LogSettings {
    std::string level = "info";
    std::string file;
};

struct FeedSettings {
    uint32_t id = 0;
    FeedSource source;
    std::string url;    // HTTP collaborator base URL, optional
};

struct PoolSettings {
    Address address{};
    Address native_token{};
    uint8_t native_decimals = 18;
    uint8_t asset_decimals = 18;
    std::string url;
};

struct LiquiditySettings {
    bool twap_enabled = true;
    uint64_t twap_period = windows::DEFAULT_TWAP_PERIOD;
    std::vector<PoolSettings> pools;
};

struct DeviationSettings {
    uint32_t max_bps = 0;
    uint64_t grace_period = 0;
};

struct PeerSettings {
    ChainId chain_id = 0;
    Address oracle{};
    bool active = true;
};

struct PeersSettings {
    uint32_t read_channel_id = DEFAULT_READ_CHANNEL;
    uint16_t confirmations = DEFAULT_CONFIRMATIONS;
    uint64_t request_ttl = windows::DEFAULT_REQUEST_TTL;
    uint8_t min_agreement = 1;
    uint32_t agreement_tolerance_bps = 0;
    std::vector<PeerSettings> endpoints;
};

struct OracleSettings {
    ChainId local_chain_id = 0;
    std::optional<OracleMode> mode;
    uint8_t min_valid_sources = 2;
    LogSettings log;
    std::vector<FeedSettings> feeds;
    LiquiditySettings liquidity;
    DeviationSettings deviation;
    PeersSettings peers;

    // Throw std::runtime_error on unreadable files or invalid values
    static OracleSettings from_file(const std::string& path);
    static OracleSettings from_json(const nlohmann::json& doc);
    static OracleSettings from_string(const std::string& content);
};

// =============================================================================
// Applying Settings
// =============================================================================

// Builders for the collaborators behind configured references. Any may be
// empty: feeds are then expected to be bound already, pools and the read
// channel are skipped. Exceptions thrown by a builder propagate.
struct Collaborators {
    std::function<void(FeedDirectory&, const FeedSettings&)> bind_feed;
    std::function<std::shared_ptr<ILiquidityPool>(const PoolSettings&)> make_pool;
    std::function<std::shared_ptr<IReadChannel>(const PeersSettings&)> make_channel;
};

// Push settings into an oracle; returns the first failing status code
int32_t apply_settings(OmniOracle& oracle, const OracleSettings& settings,
                       const Collaborators& collaborators = Collaborators());

} // namespace omni

#endif // OMNI_CONFIG_HPP
