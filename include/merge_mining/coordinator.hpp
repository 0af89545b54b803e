// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_MERGE_MINING_COORDINATOR_HPP
#define CODL3_MERGE_MINING_COORDINATOR_HPP

#include "merge_mining/anchor_client.hpp"
#include "merge_mining/aux_proof.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace codl3 {

namespace validation {
class ChainstateManager;
}

namespace merge_mining {

// Per-round state: IDLE -> POLLING -> {FOUND | NOT_FOUND} -> IDLE
enum class CoordinatorState { IDLE, POLLING, FOUND, NOT_FOUND };

std::string CoordinatorStateToString(CoordinatorState state);

/**
 * MergeMiningCoordinator - links native blocks to anchor-chain blocks
 *
 * Each round asks the anchor daemon for its tip. A tip above the last
 * recorded anchor height becomes an AnchorBlockRecord whose aux proof
 * commits the native blocks mined since the previous anchor block; the
 * record is stored and the anchor reward credited. Re-observing a height
 * is a no-op.
 *
 * Native block production does not wait on this; the two reward streams
 * are independent.
 */
class MergeMiningCoordinator {
public:
  MergeMiningCoordinator(AnchorChainClient &client,
                         validation::ChainstateManager &chainstate,
                         uint64_t anchor_reward);

  /**
   * Query the anchor tip and build a record if it is new
   *
   * Does not modify chainstate.
   * @throws network::TransientNetworkError from the client
   */
  std::optional<AnchorBlockRecord> PollAnchorChain();

  /**
   * One full round: poll, then record and credit on FOUND
   *
   * @return true if a new anchor block was recorded
   * @throws network::TransientNetworkError; state returns to IDLE and
   *         nothing is recorded
   */
  bool RunOnce();

  CoordinatorState GetState() const { return state_.load(); }
  // Outcome of the last completed round (IDLE before the first)
  CoordinatorState GetLastOutcome() const { return last_outcome_.load(); }

private:
  AnchorChainClient &client_;
  validation::ChainstateManager &chainstate_;
  const uint64_t anchor_reward_;

  std::atomic<CoordinatorState> state_{CoordinatorState::IDLE};
  std::atomic<CoordinatorState> last_outcome_{CoordinatorState::IDLE};
};

} // namespace merge_mining
} // namespace codl3

#endif // CODL3_MERGE_MINING_COORDINATOR_HPP
