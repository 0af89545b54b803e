// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>         Data directory (default: ~/.codl3)\n"
      << "  --rpcbind=<addr>         RPC bind address (default: 127.0.0.1)\n"
      << "  --rpcport=<port>         RPC port (default: 9944 mainnet, 19944 "
         "testnet, 29944 regtest)\n"
      << "  --regtest                Use regression test chain (easy mining)\n"
      << "  --testnet                Use test network\n"
      << "\n"
      << "Upstream:\n"
      << "  --anchorrpc=<url>        Anchor chain daemon RPC (default: "
         "http://localhost:18180)\n"
      << "  --l1rpc=<url>            L1 RPC (default: http://localhost:8545)\n"
      << "  --timeout=<ms>           Upstream request timeout (default: 5000)\n"
      << "\n"
      << "Block production:\n"
      << "  --miningaddress=<addr>   Producer address of mined blocks\n"
      << "  --nomining               Do not produce blocks\n"
      << "  --nomergemining          Do not poll the anchor chain\n"
      << "  --settlement=<mode>      fraud-proof or zk-proof (default: fraud-proof)\n"
      << "  --blocktime=<s>          Mining interval in seconds\n"
      << "\n"
      << "Consensus overrides:\n"
      << "  --minstake=<n>           Minimum validator stake\n"
      << "  --maxvalidators=<n>      Maximum active validators\n"
      << "  --slashpercent=<n>       Slashing penalty percent (0-100)\n"
      << "  --challengeperiod=<s>    Fraud-proof challenge window in seconds\n"
      << "  --l1confirmations=<n>    Required L1 confirmations for bridge "
         "transfers\n"
      << "\n"
      << "Task intervals (seconds):\n"
      << "  --syncinterval=<s>       Block-sync task (default: 30)\n"
      << "  --bridgeinterval=<s>     Bridge-monitor task (default: 30)\n"
      << "  --mergemininginterval=<s> Merge-mining task (default: 10)\n"
      << "  --l1feeinterval=<s>      L1-fee-monitor task (default: 60)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, mining, staking, bridge, "
         "network, rpc, app, all\n"
      << "                       Can be comma-separated: --debug=mining,bridge\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Value of "--name=value" as an unsigned integer
uint64_t parse_uint(const std::string &arg, size_t prefix_len) {
  uint64_t value = 0;
  if (!codl3::util::ParseUInt64(arg.substr(prefix_len), value)) {
    throw std::invalid_argument("invalid number in " + arg);
  }
  return value;
}

uint32_t parse_uint32(const std::string &arg, size_t prefix_len) {
  uint32_t value = 0;
  if (!codl3::util::ParseUInt32(arg.substr(prefix_len), value)) {
    throw std::invalid_argument("invalid or out-of-range number in " + arg);
  }
  return value;
}

int64_t parse_int64(const std::string &arg, size_t prefix_len) {
  int64_t value = 0;
  if (!codl3::util::ParseNonNegativeInt64(arg.substr(prefix_len), value)) {
    throw std::invalid_argument("invalid or out-of-range number in " + arg);
  }
  return value;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    codl3::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << codl3::GetFullVersionString() << std::endl;
        std::cout << codl3::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--rpcbind=") == 0) {
        config.rpc_bind = arg.substr(10);
      } else if (arg.find("--rpcport=") == 0) {
        uint64_t port = parse_uint(arg, 10);
        if (port == 0 || port > 65535) {
          throw std::invalid_argument("invalid port in " + arg);
        }
        config.rpc_port = static_cast<uint16_t>(port);
      } else if (arg == "--regtest") {
        config.chain_type = codl3::chain::ChainType::REGTEST;
      } else if (arg == "--testnet") {
        config.chain_type = codl3::chain::ChainType::TESTNET;
      } else if (arg.find("--anchorrpc=") == 0) {
        config.anchor_rpc_url = arg.substr(12);
      } else if (arg.find("--l1rpc=") == 0) {
        config.l1_rpc_url = arg.substr(8);
      } else if (arg.find("--timeout=") == 0) {
        config.network_timeout =
            std::chrono::milliseconds(parse_int64(arg, 10));
      } else if (arg.find("--miningaddress=") == 0) {
        config.mining_address = arg.substr(16);
      } else if (arg == "--nomining") {
        config.mining_enabled = false;
      } else if (arg == "--nomergemining") {
        config.merge_mining_enabled = false;
      } else if (arg.find("--settlement=") == 0) {
        codl3::settlement::SettlementMode mode;
        if (!codl3::settlement::ParseSettlementMode(arg.substr(13), mode)) {
          throw std::invalid_argument("unknown settlement mode in " + arg);
        }
        config.settlement_mode = mode;
      } else if (arg.find("--blocktime=") == 0) {
        config.block_time = parse_int64(arg, 12);
      } else if (arg.find("--minstake=") == 0) {
        config.min_stake = parse_uint(arg, 11);
      } else if (arg.find("--maxvalidators=") == 0) {
        config.max_validators = parse_uint32(arg, 16);
      } else if (arg.find("--slashpercent=") == 0) {
        config.slashing_percent = parse_uint32(arg, 15);
      } else if (arg.find("--challengeperiod=") == 0) {
        config.challenge_period = parse_int64(arg, 18);
      } else if (arg.find("--l1confirmations=") == 0) {
        config.l1_confirmations = parse_uint(arg, 18);
      } else if (arg.find("--syncinterval=") == 0) {
        config.block_sync_interval =
            std::chrono::seconds(parse_int64(arg, 15));
      } else if (arg.find("--bridgeinterval=") == 0) {
        config.bridge_monitor_interval =
            std::chrono::seconds(parse_int64(arg, 17));
      } else if (arg.find("--mergemininginterval=") == 0) {
        config.merge_mining_interval =
            std::chrono::seconds(parse_int64(arg, 22));
      } else if (arg.find("--l1feeinterval=") == 0) {
        config.l1_fee_monitor_interval =
            std::chrono::seconds(parse_int64(arg, 16));
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=mining,bridge
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    codl3::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        codl3::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        codl3::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        codl3::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Create and initialize application
    codl3::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      app.stop();
      codl3::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      app.stop();
      codl3::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    app.wait_for_shutdown();

    codl3::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    codl3::util::LogManager::Shutdown();
    return 1;
  }
}
