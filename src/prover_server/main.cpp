/**
 * zkshard node - Main Entry Point
 *
 * Subcommands:
 *   ./zkshard_node prove --rpc-url URL --private-key HEX --throughput T
 *                        --bid P --prover ADDR [--config FILE]
 *                        [--tcp HOST:PORT | --unix PATH]
 *   ./zkshard_node calibrate --usd-cost-per-hour X --utilization-rate U
 *                            --profit-margin M --prove-price P
 *                            [--config FILE] [--json]
 *   ./zkshard_node plan --cycles N [--config FILE]
 *
 * All tuning comes from the JSON config file (see EngineConfig).
 */

#include <iostream>
#include <map>
#include <string>
#include <cstring>
#include <csignal>
#include <stdexcept>

#include "server.hpp"
#include "prover.hpp"
#include "calibrator/calibrator.hpp"
#include "common/debug_control.hpp"
#include "device/device_info.hpp"
#include "engine/sharding_engine.hpp"
#include "parallel/thread_coordination.h"

using namespace zkshard;
using namespace zkshard::prover_server;

namespace {

// Global server pointer for signal handling
Server* g_server = nullptr;

void signal_handler(int) {
    if (g_server) {
        g_server->request_stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <prove|calibrate|plan> [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "prove:" << std::endl;
    std::cerr << "  --rpc-url URL        Network RPC endpoint" << std::endl;
    std::cerr << "  --private-key HEX    Signing key (never leaves the bidding client)" << std::endl;
    std::cerr << "  --throughput T       Offered throughput in cycles/s" << std::endl;
    std::cerr << "  --bid P              Bid amount in base units" << std::endl;
    std::cerr << "  --prover ADDR        Prover address" << std::endl;
    std::cerr << "  --tcp HOST:PORT      Listen on TCP socket (default 127.0.0.1:5555)" << std::endl;
    std::cerr << "  --unix PATH          Listen on Unix socket" << std::endl;
    std::cerr << std::endl;
    std::cerr << "calibrate:" << std::endl;
    std::cerr << "  --usd-cost-per-hour X --utilization-rate U --profit-margin M --prove-price P" << std::endl;
    std::cerr << "  --json               Print the report as JSON" << std::endl;
    std::cerr << std::endl;
    std::cerr << "plan:" << std::endl;
    std::cerr << "  --cycles N           Total cycles of the request" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Common:" << std::endl;
    std::cerr << "  --config FILE        Engine configuration (JSON)" << std::endl;
    std::cerr << "  --help               Show this help message" << std::endl;
}

struct Args {
    std::map<std::string, std::string> values;
    bool json = false;

    bool has(const std::string& key) const { return values.count(key) > 0; }

    const std::string& require(const std::string& key) const {
        auto it = values.find(key);
        if (it == values.end()) {
            throw ConfigError("missing required option " + key);
        }
        return it->second;
    }

    double require_double(const std::string& key) const {
        const std::string& raw = require(key);
        try {
            size_t used = 0;
            double v = std::stod(raw, &used);
            if (used != raw.size()) throw std::invalid_argument(raw);
            return v;
        } catch (const std::logic_error&) {
            throw ConfigError(key + " expects a number, got '" + raw + "'");
        }
    }

    uint64_t require_u64(const std::string& key) const {
        const std::string& raw = require(key);
        try {
            size_t used = 0;
            unsigned long long v = std::stoull(raw, &used);
            if (used != raw.size() || raw[0] == '-') throw std::invalid_argument(raw);
            return static_cast<uint64_t>(v);
        } catch (const std::logic_error&) {
            throw ConfigError(key + " expects an unsigned integer, got '" + raw + "'");
        }
    }
};

Args parse_args(int argc, char* argv[], int first) {
    Args args;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            args.json = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            args.values["--help"] = "";
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw ConfigError(arg + " requires a value");
        }
        args.values[arg] = argv[++i];
    }
    return args;
}

EngineConfig load_config(const Args& args) {
    EngineConfig config;
    if (args.has("--config")) {
        config = EngineConfig::load_file(args.require("--config"));
    } else {
        config.validate();
    }

    debug::set_debug_enabled(config.logging.debug);
    debug::set_profile_enabled(config.logging.profile);
    parallel::initialize_thread_coordination(config.parallel);
    std::cout << "[main] threads: " << parallel::get_current_thread_count() << std::endl;
    return config;
}

int run_plan(const Args& args) {
    EngineConfig config = load_config(args);
    uint64_t cycles = args.require_u64("--cycles");
    auto engine = ShardingEngine::from_config(config);
    std::cout << engine->plan(cycles);
    return 0;
}

int run_calibrate(const Args& args) {
    EngineConfig config = load_config(args);

    EconomicParams economics;
    economics.usd_cost_per_hour = args.require_double("--usd-cost-per-hour");
    economics.utilization_rate = args.require_double("--utilization-rate");
    economics.profit_margin = args.require_double("--profit-margin");
    economics.prove_price_per_unit = args.require_double("--prove-price");

    Calibrator calibrator(config.calibration, economics);
    auto metrics = calibrator.calibrate(config, discover_devices(config.devices),
                                        ProvingBackend::create(BackendType::CPU, config.parallel.num_threads));
    if (!metrics) {
        return 1;
    }

    CalibrationReport report = CalibrationReport::from_metrics(*metrics);
    if (args.json) {
        std::cout << report.to_json().dump(2) << std::endl;
    } else {
        std::cout << report.to_table();
    }
    return 0;
}

int run_prove(const Args& args) {
    BiddingParams bidding;
    bidding.rpc_url = args.require("--rpc-url");
    bidding.private_key = args.require("--private-key");
    bidding.throughput = args.require_double("--throughput");
    bidding.bid = args.require("--bid");
    bidding.prover_address = args.require("--prover");
    bidding.validate();

    if (args.has("--tcp") && args.has("--unix")) {
        throw ConfigError("--tcp and --unix are mutually exclusive");
    }

    EngineConfig config = load_config(args);
    auto engine = ShardingEngine::from_config(config);
    NodeProver prover(*engine, bidding);

    Server server;
    server.set_request_handler([&prover](const NodeRequest& request) {
        return prover.handle(request);
    });

    bool ok = false;
    if (args.has("--unix")) {
        ok = server.listen_unix(args.require("--unix"));
    } else {
        std::string address = args.has("--tcp") ? args.require("--tcp") : "127.0.0.1:5555";
        size_t colon = address.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("--tcp expects HOST:PORT, got '" + address + "'");
        }
        std::string host = address.substr(0, colon);
        int port = 0;
        try {
            port = std::stoi(address.substr(colon + 1));
        } catch (const std::logic_error&) {
            throw ConfigError("--tcp has an invalid port: '" + address + "'");
        }
        if (port <= 0 || port > 65535) {
            throw ConfigError("--tcp port out of range: " + std::to_string(port));
        }
        ok = server.listen_tcp(host, static_cast<uint16_t>(port));
    }

    if (!ok) {
        std::cerr << "[main] Failed to start server" << std::endl;
        return 1;
    }

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[main] Serving " << bidding.prover_address << ". Press Ctrl+C to stop." << std::endl;

    // Run server (blocks until stopped)
    server.run();
    server.stop();
    g_server = nullptr;

    std::cout << "[main] Server stopped." << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        Args args = parse_args(argc, argv, 2);
        if (args.has("--help")) {
            print_usage(argv[0]);
            return 0;
        }
        if (command == "prove") {
            return run_prove(args);
        }
        if (command == "calibrate") {
            return run_calibrate(args);
        }
        if (command == "plan") {
            return run_plan(args);
        }
        std::cerr << "[main] Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const EngineError& e) {
        std::cerr << "[main] Error (" << to_string(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[main] Error: " << e.what() << std::endl;
        return 1;
    }
}
