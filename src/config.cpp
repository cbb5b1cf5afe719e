// =============================================================================
// config.cpp - JSON oracle settings
// =============================================================================

#include "omni/config.hpp"
#include "omni/oracle.hpp"
#include "omni/log.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace omni {

using json = nlohmann::json;

namespace {

template <typename T>
T unsigned_field(const json& obj, const char* key, T fallback) {
    if (!obj.contains(key)) return fallback;

    const json& v = obj.at(key);
    if (!v.is_number_unsigned()) {
        throw std::runtime_error(std::string("'") + key + "' must be a non-negative integer");
    }
    uint64_t raw = v.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::string("'") + key + "' out of range");
    }
    return static_cast<T>(raw);
}

bool bool_field(const json& obj, const char* key, bool fallback) {
    if (!obj.contains(key)) return fallback;
    if (!obj.at(key).is_boolean()) {
        throw std::runtime_error(std::string("'") + key + "' must be a boolean");
    }
    return obj.at(key).get<bool>();
}

std::string string_field(const json& obj, const char* key, const std::string& fallback = "") {
    if (!obj.contains(key)) return fallback;
    if (!obj.at(key).is_string()) {
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    }
    return obj.at(key).get<std::string>();
}

Address address_field(const json& obj, const char* key, bool required) {
    if (!obj.contains(key)) {
        if (required) throw std::runtime_error(std::string("missing '") + key + "'");
        return Address{};
    }
    std::string text = string_field(obj, key);
    auto addr = parse_address(text);
    if (!addr) throw std::runtime_error(std::string("invalid address for '") + key + "': " + text);
    return *addr;
}

FeedSettings parse_feed(const json& f) {
    FeedSettings feed;
    if (!f.contains("id")) throw std::runtime_error("feed is missing 'id'");
    feed.id = unsigned_field<uint32_t>(f, "id", 0);

    std::string kind = string_field(f, "kind");
    auto parsed = parse_feed_kind(kind);
    if (!parsed) throw std::runtime_error("feed " + std::to_string(feed.id) +
                                          ": unknown kind '" + kind + "'");

    feed.source.kind = *parsed;
    feed.source.endpoint = address_field(f, "endpoint", true);
    feed.source.weight = unsigned_field<uint32_t>(f, "weight", 0);
    feed.source.max_staleness = unsigned_field<uint64_t>(f, "max_staleness",
                                                         windows::DEFAULT_STALENESS);
    feed.source.active = bool_field(f, "active", true);
    feed.source.extra = string_field(f, "extra");
    feed.url = string_field(f, "url");
    return feed;
}

PoolSettings parse_pool(const json& p) {
    PoolSettings pool;
    pool.address = address_field(p, "address", true);
    pool.native_token = address_field(p, "native_token", true);
    pool.native_decimals = unsigned_field<uint8_t>(p, "native_decimals", 18);
    pool.asset_decimals = unsigned_field<uint8_t>(p, "asset_decimals", 18);
    pool.url = string_field(p, "url");
    return pool;
}

PeerSettings parse_peer(const json& p) {
    PeerSettings peer;
    peer.chain_id = unsigned_field<ChainId>(p, "chain_id", 0);
    peer.active = bool_field(p, "active", true);
    peer.oracle = address_field(p, "oracle", peer.active);
    return peer;
}

const json& section(const json& doc, const char* key) {
    static const json empty = json::object();
    if (!doc.contains(key)) return empty;
    if (!doc.at(key).is_object()) {
        throw std::runtime_error(std::string("'") + key + "' must be an object");
    }
    return doc.at(key);
}

const json& array_section(const json& doc, const char* key) {
    static const json empty = json::array();
    if (!doc.contains(key)) return empty;
    if (!doc.at(key).is_array()) {
        throw std::runtime_error(std::string("'") + key + "' must be an array");
    }
    return doc.at(key);
}

} // namespace

// =============================================================================
// Loading
// =============================================================================

OracleSettings OracleSettings::from_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

OracleSettings OracleSettings::from_string(const std::string& content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    return from_json(doc);
}

OracleSettings OracleSettings::from_json(const json& doc) {
    if (!doc.is_object()) throw std::runtime_error("config root must be an object");

    OracleSettings s;
    s.local_chain_id = unsigned_field<ChainId>(doc, "local_chain_id", 0);
    if (s.local_chain_id == 0) throw std::runtime_error("'local_chain_id' is required");

    if (doc.contains("mode")) {
        std::string name = string_field(doc, "mode");
        s.mode = parse_mode(name);
        if (!s.mode || *s.mode == OracleMode::UNINITIALIZED) {
            throw std::runtime_error("unknown mode '" + name + "'");
        }
    }
    s.min_valid_sources = unsigned_field<uint8_t>(doc, "min_valid_sources", 2);

    const json& log_cfg = section(doc, "log");
    s.log.level = string_field(log_cfg, "level", "info");
    s.log.file = string_field(log_cfg, "file");

    for (const auto& f : array_section(doc, "feeds")) {
        s.feeds.push_back(parse_feed(f));
    }

    const json& liq = section(doc, "liquidity");
    s.liquidity.twap_enabled = bool_field(liq, "twap_enabled", true);
    s.liquidity.twap_period = unsigned_field<uint64_t>(liq, "twap_period",
                                                       windows::DEFAULT_TWAP_PERIOD);
    for (const auto& p : array_section(liq, "pools")) {
        s.liquidity.pools.push_back(parse_pool(p));
    }

    const json& dev = section(doc, "deviation");
    s.deviation.max_bps = unsigned_field<uint32_t>(dev, "max_bps", 0);
    s.deviation.grace_period = unsigned_field<uint64_t>(dev, "grace_period", 0);

    const json& peers = section(doc, "peers");
    s.peers.read_channel_id = unsigned_field<uint32_t>(peers, "read_channel_id",
                                                       DEFAULT_READ_CHANNEL);
    s.peers.confirmations = unsigned_field<uint16_t>(peers, "confirmations",
                                                     DEFAULT_CONFIRMATIONS);
    s.peers.request_ttl = unsigned_field<uint64_t>(peers, "request_ttl",
                                                   windows::DEFAULT_REQUEST_TTL);
    s.peers.min_agreement = unsigned_field<uint8_t>(peers, "min_agreement", 1);
    s.peers.agreement_tolerance_bps = unsigned_field<uint32_t>(peers, "agreement_tolerance_bps", 0);
    for (const auto& p : array_section(peers, "endpoints")) {
        s.peers.endpoints.push_back(parse_peer(p));
    }

    return s;
}

// =============================================================================
// Applying
// =============================================================================

int32_t apply_settings(OmniOracle& oracle, const OracleSettings& settings,
                       const Collaborators& collaborators) {
    if (settings.local_chain_id != oracle.local_chain()) return errors::INVALID_CONFIGURATION;

    auto fail = [](int32_t code, const std::string& what) {
        log::get()->error("config: {} ({})", what, errors::to_string(code));
        return code;
    };

    if (settings.mode) {
        if (oracle.set_mode(*settings.mode) != errors::OK) {
            return fail(errors::INVALID_MODE_TRANSITION, "mode");
        }
    }

    int32_t status = oracle.set_min_valid_sources(settings.min_valid_sources);
    if (status != errors::OK) return fail(status, "min_valid_sources");

    for (const auto& feed : settings.feeds) {
        if (collaborators.bind_feed) collaborators.bind_feed(oracle.feeds(), feed);

        status = oracle.get_source(feed.id)
                     ? oracle.update_source(feed.id, feed.source)
                     : oracle.add_source(feed.id, feed.source);
        if (status != errors::OK) return fail(status, "feed " + std::to_string(feed.id));
    }

    status = oracle.configure_twap(settings.liquidity.twap_enabled, settings.liquidity.twap_period);
    if (status != errors::OK) return fail(status, "twap_period");

    if (collaborators.make_pool) {
        for (const auto& pool : settings.liquidity.pools) {
            PoolConfig cfg;
            cfg.pool = collaborators.make_pool(pool);
            cfg.native_token = pool.native_token;
            cfg.native_decimals = pool.native_decimals;
            cfg.asset_decimals = pool.asset_decimals;

            status = oracle.add_pool(cfg);
            if (status != errors::OK) return fail(status, "pool " + to_hex(pool.address));
        }
    }

    oracle.set_deviation_gate(settings.deviation.max_bps, settings.deviation.grace_period);

    if (collaborators.make_channel) {
        oracle.set_read_channel(settings.peers.read_channel_id,
                                collaborators.make_channel(settings.peers));
    }

    status = oracle.configure_reads(settings.peers.confirmations, settings.peers.request_ttl);
    if (status != errors::OK) return fail(status, "request_ttl");

    status = oracle.set_peer_agreement(settings.peers.min_agreement,
                                       settings.peers.agreement_tolerance_bps);
    if (status != errors::OK) return fail(status, "min_agreement");

    for (const auto& peer : settings.peers.endpoints) {
        status = oracle.register_peer(peer.chain_id, peer.oracle, peer.active);
        if (status != errors::OK) {
            return fail(status, "peer " + std::to_string(peer.chain_id));
        }
    }

    log::get()->info("config applied: {} feeds, {} pools, {} peers", settings.feeds.size(),
                     settings.liquidity.pools.size(), settings.peers.endpoints.size());
    return errors::OK;
}

} // namespace omni
