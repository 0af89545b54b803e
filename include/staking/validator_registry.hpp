// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_STAKING_VALIDATOR_REGISTRY_HPP
#define CODL3_STAKING_VALIDATOR_REGISTRY_HPP

#include "primitives/transaction.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace codl3 {
namespace staking {

enum class StakeResult {
  OK,
  BELOW_MINIMUM,      // Stake amount under the minimum
  SET_FULL,           // Active set already has max_validators members
  NOT_FOUND,          // Unknown validator address
  INSUFFICIENT_STAKE, // Unstake amount exceeds current stake
};

// "BelowMinimum", "SetFull", ... (error kind reported to RPC callers)
std::string StakeResultToString(StakeResult result);

struct Validator {
  Address address;
  uint64_t stake{0};
  bool active{false};
  uint64_t last_active_height{0};
  uint64_t total_rewards{0};
  uint64_t blocks_produced{0};
  uint64_t total_slashed{0};
};

// ValidatorRegistry - Stake ledger over a bounded validator set
//
// Invariants, holding after every public call:
//   total_staked == sum of validator.stake
//   active_count == number of validators with active == true
//   validator.active == (validator.stake >= min_stake)
//
// Every stake change goes through SetStake(), which recomputes `active`
// from the new stake and adjusts both totals in one step. Validators are
// never removed; a fully unstaked validator stays with stake 0.
//
// THREAD SAFETY: NO internal mutex - caller MUST hold
// ChainstateManager::state_mutex_.
class ValidatorRegistry {
public:
  ValidatorRegistry(uint64_t min_stake, uint32_t max_validators);

  /**
   * Add `amount` to the validator's stake, creating it on first stake
   *
   * Fails with BELOW_MINIMUM if amount < min_stake, and with SET_FULL if
   * the validator is not already active and the active set is full.
   */
  StakeResult Stake(const Address &address, uint64_t amount);

  /**
   * Remove `amount` from the validator's stake
   *
   * Fails with NOT_FOUND for an unknown address and INSUFFICIENT_STAKE if
   * amount exceeds the current stake.
   */
  StakeResult Unstake(const Address &address, uint64_t amount);

  /**
   * Deduct floor(stake * penalty_percent / 100), saturating at zero
   *
   * Percentages above 100 are treated as 100.
   * @param slashed Optional output for the deducted amount
   */
  StakeResult Slash(const Address &address, uint32_t penalty_percent,
                    uint64_t *slashed = nullptr);

  /**
   * Credit total / active_count to every active validator
   *
   * The remainder is not credited. No-op with no active validators.
   * @return Amount actually credited (per_validator * active_count)
   */
  uint64_t DistributeRewards(uint64_t total);

  // Bump blocks_produced/last_active_height; no-op for unknown producers.
  // Returns true if the producer is a registered validator.
  bool RecordBlockProduced(const Address &producer, uint64_t height);

  const Validator *Get(const Address &address) const;
  std::vector<Validator> GetAll() const;

  uint64_t GetTotalStaked() const { return total_staked_; }
  uint32_t GetActiveCount() const { return active_count_; }
  uint64_t GetMinStake() const { return min_stake_; }
  uint32_t GetMaxValidators() const { return max_validators_; }

private:
  void SetStake(Validator &validator, uint64_t new_stake);

  uint64_t min_stake_;
  uint32_t max_validators_;

  std::map<Address, Validator> validators_;
  uint64_t total_staked_{0};
  uint32_t active_count_{0};
};

} // namespace staking
} // namespace codl3

#endif // CODL3_STAKING_VALIDATOR_REGISTRY_HPP
