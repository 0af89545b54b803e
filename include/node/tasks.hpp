// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_NODE_TASKS_HPP
#define CODL3_NODE_TASKS_HPP

#include <cstddef>
#include <cstdint>

namespace codl3 {

// Forward declarations
namespace validation {
class ChainstateManager;
}
namespace mining {
class CPUMiner;
}
namespace merge_mining {
class MergeMiningCoordinator;
}
namespace network {
class L1Client;
class PeerView;
} // namespace network

namespace node {

// Scheduler task names
inline constexpr const char *TASK_BLOCK_SYNC = "block-sync";
inline constexpr const char *TASK_MINING = "mining";
inline constexpr const char *TASK_BRIDGE_MONITOR = "bridge-monitor";
inline constexpr const char *TASK_MERGE_MINING = "merge-mining";
inline constexpr const char *TASK_L1_FEE_MONITOR = "l1-fee-monitor";

// One tick of each periodic task. Network failures propagate as
// network::TransientNetworkError for the Scheduler to log.

// Raise best-known height from the peer view; the tip only moves through
// connected blocks
void BlockSyncTick(validation::ChainstateManager &chainstate,
                   const network::PeerView &peers);

void MiningTick(mining::CPUMiner &miner);

// Promote bridge transfers buried under enough L1 blocks
size_t BridgeMonitorTick(validation::ChainstateManager &chainstate,
                         network::L1Client &l1);

void MergeMiningTick(merge_mining::MergeMiningCoordinator &coordinator);

// Record the L1 head and gas price (telemetry only)
void L1FeeMonitorTick(validation::ChainstateManager &chainstate,
                      network::L1Client &l1);

} // namespace node
} // namespace codl3

#endif // CODL3_NODE_TASKS_HPP
