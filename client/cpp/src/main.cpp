// omni-oracle - one-shot operator tool for the omnioracle library
//
// Loads a JSON config, wires HTTP collaborators and runs a single command.

#include "omni/config.hpp"
#include "omni/http_feed.hpp"
#include "omni/log.hpp"
#include "omni/oracle.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Arguments
//------------------------------------------------------------------------------

struct Args {
    std::string config_path;
    std::string log_level;
    std::string command;
};

void print_usage(const char* prog) {
    std::cout << "omni-oracle - multi-source USD price oracle\n\n"
              << "Usage: " << prog << " --config <file> [options] <command>\n\n"
              << "Options:\n"
              << "  -c, --config <file>     JSON oracle configuration (required)\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error|off\n"
              << "  -h, --help              Show this help message\n\n"
              << "Commands:\n"
              << "  update     Run the producer pipeline once and print the result\n"
              << "  status     Print the oracle status after configuration\n"
              << "  validate   Check the configuration and report price validity\n"
              << "  sources    Aggregate once and print per-source readings\n";
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(2);
            }
            args.config_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level\n";
                std::exit(2);
            }
            args.log_level = argv[++i];
        } else if (arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(2);
        }
    }

    if (args.config_path.empty() || args.command.empty()) {
        print_usage(argv[0]);
        std::exit(2);
    }
    return args;
}

//------------------------------------------------------------------------------
// Output
//------------------------------------------------------------------------------

json status_json(const omni::OracleStatus& s) {
    return json{
        {"mode", omni::to_string(s.mode)},
        {"emergency_mode", s.emergency_mode},
        {"emergency_price", omni::x18::to_string(s.emergency_price_x18)},
        {"circuit_breaker_tripped", s.circuit_breaker_tripped},
        {"in_grace_period", s.in_grace_period},
        {"active_sources", s.active_sources},
        {"min_valid_sources", s.min_valid_sources},
        {"max_deviation_bps", s.max_deviation_bps},
        {"active_peers", s.active_peers},
        {"pending_requests", s.pending_requests},
        {"price_initialized", s.price_initialized},
        {"last_degraded", s.last_degraded},
    };
}

json update_json(const omni::UpdateReport& r) {
    json out{
        {"status", r.status},
        {"status_name", omni::errors::to_string(r.status)},
    };
    if (r.status == omni::errors::OK) {
        out["asset_price"] = omni::x18::to_string(r.asset_price_x18);
        out["native_price"] = omni::x18::to_string(r.native_price_x18);
        out["ratio"] = omni::x18::to_string(r.ratio_x18);
        out["timestamp"] = r.timestamp;
        out["degraded"] = r.degraded;
        out["tier"] = omni::to_string(r.tier);
    }
    return out;
}

json readings_json(const std::vector<omni::SourceReading>& readings) {
    json out = json::array();
    for (const auto& r : readings) {
        json item{
            {"id", r.source_id},
            {"kind", omni::to_string(r.kind)},
            {"weight", r.weight},
            {"valid", r.quote.valid},
        };
        if (r.quote.valid) {
            item["price"] = omni::x18::to_string(r.quote.price_x18);
        } else {
            item["error"] = omni::errors::to_string(r.quote.error);
        }
        out.push_back(item);
    }
    return out;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int run(const Args& args) {
    omni::OracleSettings settings = omni::OracleSettings::from_file(args.config_path);

    std::string level = args.log_level.empty() ? settings.log.level : args.log_level;
    omni::log::init(level, settings.log.file);

    omni::OmniOracle oracle(settings.local_chain_id);
    int32_t rc = omni::apply_settings(oracle, settings, omni::http_collaborators());
    if (rc != omni::errors::OK) {
        std::cerr << "Invalid configuration: " << omni::errors::to_string(rc) << "\n";
        return 1;
    }

    json out;
    int exit_code = 0;

    if (args.command == "update") {
        omni::UpdateReport report = oracle.update_price();
        out = update_json(report);
        if (report.status != omni::errors::OK) exit_code = 1;
    } else if (args.command == "status") {
        out = status_json(oracle.status());
    } else if (args.command == "validate") {
        omni::ValidationReport report = oracle.validate();
        out = json{
            {"config_valid", true},
            {"local_valid", report.local_valid},
            {"cross_chain_valid", report.cross_chain_valid},
            {"local_chain_id", settings.local_chain_id},
            {"feeds", settings.feeds.size()},
            {"pools", settings.liquidity.pools.size()},
            {"peers", settings.peers.endpoints.size()},
        };
    } else if (args.command == "sources") {
        omni::UpdateReport report = oracle.update_price();
        out = json{
            {"update", update_json(report)},
            {"readings", readings_json(oracle.last_readings())},
        };
    } else {
        std::cerr << "Unknown command: " << args.command << "\n";
        return 2;
    }

    std::cout << out.dump(2) << "\n";
    return exit_code;
}

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
