// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "application.hpp"
#include "merge_mining/anchor_client.hpp"
#include "merge_mining/coordinator.hpp"
#include "mining/miner.hpp"
#include "network/l1_client.hpp"
#include "network/peer_view.hpp"
#include "node/scheduler.hpp"
#include "node/tasks.hpp"
#include "rpc/rpc_server.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "validation/chainstate_manager.hpp"
#include "version.hpp"
#include <iostream> // Keep for startup banner before logger output
#include <thread>

namespace codl3 {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Determine chain type name for banner
  std::string chain_name;
  switch (config_.chain_type) {
  case chain::ChainType::MAIN:
    chain_name = "MAINNET";
    break;
  case chain::ChainType::TESTNET:
    chain_name = "TESTNET";
    break;
  case chain::ChainType::REGTEST:
    chain_name = "REGTEST";
    break;
  }

  std::cout << GetStartupBanner(chain_name) << std::flush;

  LOG_APP_INFO("Initializing C0DL3 node...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_APP_ERROR("Failed to initialize chainstate");
    return false;
  }

  LOG_APP_INFO("Initializing miner...");
  miner_ =
      std::make_unique<mining::CPUMiner>(*chain_params_, *chainstate_manager_);
  miner_->SetMiningAddress(config_.mining_address);

  if (!init_clients()) {
    LOG_APP_ERROR("Failed to initialize upstream clients");
    return false;
  }

  if (!init_scheduler()) {
    LOG_APP_ERROR("Failed to initialize scheduler");
    return false;
  }

  if (!init_rpc()) {
    LOG_APP_ERROR("Failed to initialize RPC server");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting C0DL3 node...");

  setup_signal_handlers();

  const uint16_t port = config_.rpc_port != 0
                            ? config_.rpc_port
                            : chain_params_->GetDefaultRPCPort();
  if (!rpc_server_->Start(config_.rpc_bind, port)) {
    LOG_APP_ERROR("Failed to start RPC server");
    return false;
  }

  if (!scheduler_->Start()) {
    LOG_APP_ERROR("Failed to start scheduler");
    rpc_server_->Stop();
    return false;
  }

  running_ = true;

  LOG_APP_INFO("C0DL3 node started successfully");
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  LOG_APP_INFO("RPC: http://{}:{}", config_.rpc_bind, rpc_server_->GetPort());
  LOG_APP_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    // Initialized but never started: only the datadir lock is held
    if (datadir_lock_) {
      datadir_lock_->Release();
    }
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down C0DL3 node...");

  running_ = false;

  // Stop RPC server first (stop accepting new requests)
  if (rpc_server_) {
    LOG_APP_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  // Abort an in-flight proof-of-work search so the mining task returns
  if (miner_) {
    miner_->Stop();
  }

  if (scheduler_) {
    LOG_APP_INFO("Stopping scheduler...");
    scheduler_->Stop();
  }

  if (datadir_lock_) {
    LOG_APP_INFO("Releasing data directory lock...");
    datadir_lock_->Release();
  }

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}",
                  config_.datadir.string());
    return false;
  }

  datadir_lock_ = std::make_unique<util::DataDirLock>(config_.datadir);
  const std::string chain = chain::ChainTypeToString(config_.chain_type);

  switch (datadir_lock_->Acquire(chain)) {
  case util::LockResult::Success:
    return true;
  case util::LockResult::ErrorWrite:
    LOG_APP_ERROR("Cannot write to data directory {}: {}",
                  config_.datadir.string(), datadir_lock_->GetReason());
    return false;
  case util::LockResult::ErrorLock:
    if (const auto &holder = datadir_lock_->GetHolder()) {
      LOG_APP_ERROR("Data directory {} is in use by codl3d (pid {}, chain "
                    "{}). Stop it or pick another --datadir.",
                    config_.datadir.string(), holder->pid, holder->chain);
    } else {
      LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                    "codl3d is probably already running.",
                    config_.datadir.string());
    }
    return false;
  }
  return false;
}

bool Application::init_chain() {
  LOG_APP_INFO("Initializing chainstate...");

  chain_params_ = chain::ChainParams::Create(config_.chain_type);
  LOG_APP_INFO("Using {} chain", chain_params_->GetChainTypeString());

  validation::ChainstateOptions options =
      validation::ChainstateOptions::FromParams(*chain_params_);
  if (config_.settlement_mode) {
    options.settlement_mode = *config_.settlement_mode;
  }
  if (config_.min_stake) {
    options.min_stake = *config_.min_stake;
  }
  if (config_.max_validators) {
    options.max_validators = *config_.max_validators;
  }
  if (config_.slashing_percent) {
    if (*config_.slashing_percent > 100) {
      LOG_APP_ERROR("Slashing percent must be at most 100");
      return false;
    }
    options.slashing_percent = *config_.slashing_percent;
  }
  if (config_.challenge_period) {
    options.challenge_period = *config_.challenge_period;
  }
  if (config_.l1_confirmations) {
    options.l1_confirmations = *config_.l1_confirmations;
  }

  proof_system_ = std::make_unique<settlement::HashCommitmentProofSystem>();
  chainstate_manager_ = std::make_unique<validation::ChainstateManager>(
      *chain_params_, options, *proof_system_);

  LOG_APP_INFO("Chainstate initialized at height {} (min stake {}, "
               "max validators {}, challenge period {}s, {} L1 confirmations)",
               chainstate_manager_->GetHeight(), options.min_stake,
               options.max_validators, options.challenge_period,
               options.l1_confirmations);
  return true;
}

bool Application::init_clients() {
  try {
    anchor_client_ = std::make_unique<merge_mining::JsonRpcAnchorClient>(
        config_.anchor_rpc_url, config_.network_timeout);
    l1_client_ = std::make_unique<network::JsonRpcL1Client>(
        config_.l1_rpc_url, config_.network_timeout);
  } catch (const std::invalid_argument &e) {
    LOG_APP_ERROR("{}", e.what());
    return false;
  }

  coordinator_ = std::make_unique<merge_mining::MergeMiningCoordinator>(
      *anchor_client_, *chainstate_manager_,
      chain_params_->GetConsensus().nAnchorBlockReward);

  // No P2P transport is attached; the view reports no peers
  peer_view_ = std::make_unique<network::StaticPeerView>();

  LOG_APP_INFO("Anchor chain RPC: {}", config_.anchor_rpc_url);
  LOG_APP_INFO("L1 RPC: {}", config_.l1_rpc_url);
  return true;
}

bool Application::init_scheduler() {
  using std::chrono::milliseconds;

  scheduler_ = std::make_unique<node::Scheduler>();

  const std::chrono::seconds mining_interval =
      config_.mining_interval.value_or(std::chrono::seconds(
          config_.block_time.value_or(
              chain_params_->GetConsensus().nTargetBlockTime)));

  bool ok = scheduler_->AddTask(
      node::TASK_BLOCK_SYNC, milliseconds(config_.block_sync_interval),
      [this]() { node::BlockSyncTick(*chainstate_manager_, *peer_view_); });

  if (config_.mining_enabled) {
    ok = ok && scheduler_->AddTask(node::TASK_MINING,
                                   milliseconds(mining_interval),
                                   [this]() { node::MiningTick(*miner_); });
  }

  ok = ok && scheduler_->AddTask(
                 node::TASK_BRIDGE_MONITOR,
                 milliseconds(config_.bridge_monitor_interval), [this]() {
                   node::BridgeMonitorTick(*chainstate_manager_, *l1_client_);
                 });

  if (config_.merge_mining_enabled) {
    ok = ok && scheduler_->AddTask(
                   node::TASK_MERGE_MINING,
                   milliseconds(config_.merge_mining_interval),
                   [this]() { node::MergeMiningTick(*coordinator_); });
  }

  ok = ok && scheduler_->AddTask(
                 node::TASK_L1_FEE_MONITOR,
                 milliseconds(config_.l1_fee_monitor_interval), [this]() {
                   node::L1FeeMonitorTick(*chainstate_manager_, *l1_client_);
                 });

  return ok;
}

bool Application::init_rpc() {
  LOG_APP_INFO("Initializing RPC server...");

  rpc_server_ = std::make_unique<rpc::RPCServer>(
      *chainstate_manager_, miner_.get(), *chain_params_);

  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace codl3
