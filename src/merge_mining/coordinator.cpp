// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "merge_mining/coordinator.hpp"
#include "network/http_jsonrpc_client.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "validation/chainstate_manager.hpp"

namespace codl3 {
namespace merge_mining {

std::string CoordinatorStateToString(CoordinatorState state) {
  switch (state) {
  case CoordinatorState::IDLE:
    return "idle";
  case CoordinatorState::POLLING:
    return "polling";
  case CoordinatorState::FOUND:
    return "found";
  case CoordinatorState::NOT_FOUND:
    return "not-found";
  }
  return "unknown";
}

MergeMiningCoordinator::MergeMiningCoordinator(
    AnchorChainClient &client, validation::ChainstateManager &chainstate,
    uint64_t anchor_reward)
    : client_(client), chainstate_(chainstate), anchor_reward_(anchor_reward) {}

std::optional<AnchorBlockRecord> MergeMiningCoordinator::PollAnchorChain() {
  const AnchorTip tip = client_.GetTip();
  const uint64_t recorded = chainstate_.GetAnchorHeight();

  if (tip.height <= recorded) {
    LOG_MINING_TRACE("Anchor tip {} not above recorded height {}", tip.height,
                     recorded);
    return std::nullopt;
  }

  AnchorBlockRecord record;
  record.height = tip.height;
  record.hash = tip.hash;
  record.timestamp = tip.timestamp;
  record.aux_pow = BuildAuxProof(chainstate_.GetAuxCandidateHashes(), tip.hash);
  return record;
}

bool MergeMiningCoordinator::RunOnce() {
  state_.store(CoordinatorState::POLLING);

  std::optional<AnchorBlockRecord> record;
  try {
    record = PollAnchorChain();
  } catch (const network::TransientNetworkError &) {
    state_.store(CoordinatorState::IDLE);
    throw;
  }

  bool recorded = false;
  if (record) {
    state_.store(CoordinatorState::FOUND);
    recorded = chainstate_.RecordAnchorBlock(*record, anchor_reward_);
    if (recorded) {
      LOG_MINING_INFO("Merge-mined anchor block {} ({}), reward {}",
                      record->height, util::HexStr(record->hash).substr(0, 16),
                      anchor_reward_);
    }
  } else {
    state_.store(CoordinatorState::NOT_FOUND);
  }

  last_outcome_.store(state_.load());
  state_.store(CoordinatorState::IDLE);
  return recorded;
}

} // namespace merge_mining
} // namespace codl3
