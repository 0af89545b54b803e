// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_APPLICATION_HPP
#define CODL3_APPLICATION_HPP

#include "chain/chainparams.hpp"
#include "settlement/proof_system.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace codl3 {

// Forward declarations
namespace validation {
class ChainstateManager;
}
namespace mining {
class CPUMiner;
}
namespace merge_mining {
class AnchorChainClient;
class MergeMiningCoordinator;
} // namespace merge_mining
namespace network {
class L1Client;
class StaticPeerView;
} // namespace network
namespace node {
class Scheduler;
}
namespace rpc {
class RPCServer;
}

namespace app {

/**
 * Resolved node configuration
 *
 * Unset overrides fall back to the selected chain's ChainParams.
 */
struct AppConfig {
  std::filesystem::path datadir = util::get_default_datadir();
  chain::ChainType chain_type = chain::ChainType::MAIN;

  // RPC listener (port 0 = chain default)
  std::string rpc_bind = "127.0.0.1";
  uint16_t rpc_port = 0;

  // Upstream daemons
  std::string anchor_rpc_url = "http://localhost:18180";
  std::string l1_rpc_url = "http://localhost:8545";
  std::chrono::milliseconds network_timeout{5000};

  // Block production
  bool mining_enabled = true;
  bool merge_mining_enabled = true;
  std::string mining_address = "0x0000000000000000000000000000000000000000";
  std::optional<settlement::SettlementMode> settlement_mode;

  // Task intervals (mining interval defaults to the target block time)
  std::chrono::seconds block_sync_interval{30};
  std::optional<std::chrono::seconds> mining_interval;
  std::chrono::seconds bridge_monitor_interval{30};
  std::chrono::seconds merge_mining_interval{10};
  std::chrono::seconds l1_fee_monitor_interval{60};

  // Consensus overrides
  std::optional<uint64_t> min_stake;
  std::optional<uint32_t> max_validators;
  std::optional<uint32_t> slashing_percent;
  std::optional<int64_t> block_time;
  std::optional<int64_t> challenge_period;
  std::optional<uint64_t> l1_confirmations;

  bool verbose = false;
};

/**
 * Application - Main application coordinator
 * Owns all node components and manages their lifecycle
 */
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Trigger graceful shutdown (safe from any thread)
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  // Component access
  validation::ChainstateManager &chainstate_manager() {
    return *chainstate_manager_;
  }
  node::Scheduler &scheduler() { return *scheduler_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }
  const AppConfig &config() const { return config_; }

  // Signal handling
  static Application *instance();

private:
  bool init_datadir();
  bool init_chain();
  bool init_clients();
  bool init_scheduler();
  bool init_rpc();

  void setup_signal_handlers();
  static void signal_handler(int signal);
  void shutdown();

  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::unique_ptr<util::DataDirLock> datadir_lock_;

  // Components (destroyed in reverse order)
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<settlement::ProofSystem> proof_system_;
  std::unique_ptr<validation::ChainstateManager> chainstate_manager_;
  std::unique_ptr<mining::CPUMiner> miner_;
  std::unique_ptr<merge_mining::AnchorChainClient> anchor_client_;
  std::unique_ptr<merge_mining::MergeMiningCoordinator> coordinator_;
  std::unique_ptr<network::L1Client> l1_client_;
  std::unique_ptr<network::StaticPeerView> peer_view_;
  std::unique_ptr<node::Scheduler> scheduler_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  static Application *instance_;
};

} // namespace app
} // namespace codl3

#endif // CODL3_APPLICATION_HPP
