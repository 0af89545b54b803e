// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "node/tasks.hpp"
#include "merge_mining/coordinator.hpp"
#include "mining/miner.hpp"
#include "network/l1_client.hpp"
#include "network/peer_view.hpp"
#include "util/logging.hpp"
#include "validation/chainstate_manager.hpp"

namespace codl3 {
namespace node {

void BlockSyncTick(validation::ChainstateManager &chainstate,
                   const network::PeerView &peers) {
  chainstate.SetPeerCount(peers.PeerCount());

  const uint64_t remote = peers.BestKnownHeight();
  if (chainstate.AdvanceBestKnownHeight(remote)) {
    LOG_NET_INFO("Best known height now {} (local tip {})", remote,
                 chainstate.GetHeight());
  }
}

void MiningTick(mining::CPUMiner &miner) { miner.MineOnce(); }

size_t BridgeMonitorTick(validation::ChainstateManager &chainstate,
                         network::L1Client &l1) {
  const uint64_t l1_height = l1.GetBlockNumber();
  const size_t promoted = chainstate.AdvanceL1Confirmations(l1_height);
  if (promoted > 0) {
    LOG_BRIDGE_INFO("L1 head {}: {} bridge transaction(s) confirmed",
                    l1_height, promoted);
  }
  return promoted;
}

void MergeMiningTick(merge_mining::MergeMiningCoordinator &coordinator) {
  coordinator.RunOnce();
}

void L1FeeMonitorTick(validation::ChainstateManager &chainstate,
                      network::L1Client &l1) {
  const uint64_t l1_height = l1.GetBlockNumber();
  const uint64_t gas_price = l1.GetGasPrice();
  chainstate.RecordL1Observation(l1_height, gas_price);
  LOG_NET_DEBUG("L1 head {} gas price {}", l1_height, gas_price);
}

} // namespace node
} // namespace codl3
