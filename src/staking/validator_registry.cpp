// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "staking/validator_registry.hpp"
#include "util/logging.hpp"
#include "util/saturating.hpp"
#include <algorithm>

namespace codl3 {
namespace staking {

using util::SaturatingAdd;
using util::SaturatingSub;

std::string StakeResultToString(StakeResult result) {
  switch (result) {
  case StakeResult::OK:
    return "Ok";
  case StakeResult::BELOW_MINIMUM:
    return "BelowMinimum";
  case StakeResult::SET_FULL:
    return "SetFull";
  case StakeResult::NOT_FOUND:
    return "NotFound";
  case StakeResult::INSUFFICIENT_STAKE:
    return "InsufficientStake";
  }
  return "Unknown";
}

ValidatorRegistry::ValidatorRegistry(uint64_t min_stake,
                                     uint32_t max_validators)
    : min_stake_(min_stake), max_validators_(max_validators) {}

void ValidatorRegistry::SetStake(Validator &validator, uint64_t new_stake) {
  const bool was_active = validator.active;

  if (new_stake >= validator.stake) {
    total_staked_ = SaturatingAdd(total_staked_, new_stake - validator.stake);
  } else {
    total_staked_ = SaturatingSub(total_staked_, validator.stake - new_stake);
  }
  validator.stake = new_stake;
  validator.active = validator.stake >= min_stake_;

  if (validator.active && !was_active) {
    active_count_++;
  } else if (!validator.active && was_active) {
    active_count_--;
  }
}

StakeResult ValidatorRegistry::Stake(const Address &address, uint64_t amount) {
  if (amount < min_stake_) {
    LOG_STAKE_DEBUG("Stake rejected for {}: {} below minimum {}", address,
                    amount, min_stake_);
    return StakeResult::BELOW_MINIMUM;
  }

  auto it = validators_.find(address);
  const bool already_active = it != validators_.end() && it->second.active;
  if (!already_active && active_count_ >= max_validators_) {
    LOG_STAKE_DEBUG("Stake rejected for {}: active set full ({}/{})", address,
                    active_count_, max_validators_);
    return StakeResult::SET_FULL;
  }

  if (it == validators_.end()) {
    Validator validator;
    validator.address = address;
    it = validators_.emplace(address, validator).first;
  }

  SetStake(it->second, SaturatingAdd(it->second.stake, amount));

  LOG_STAKE_INFO("Validator {} staked {} (stake {}, active {}/{})", address,
                 amount, it->second.stake, active_count_, max_validators_);
  return StakeResult::OK;
}

StakeResult ValidatorRegistry::Unstake(const Address &address,
                                       uint64_t amount) {
  auto it = validators_.find(address);
  if (it == validators_.end()) {
    return StakeResult::NOT_FOUND;
  }

  Validator &validator = it->second;
  if (amount > validator.stake) {
    return StakeResult::INSUFFICIENT_STAKE;
  }

  SetStake(validator, validator.stake - amount);

  LOG_STAKE_INFO("Validator {} unstaked {} (stake {}, active={})", address,
                 amount, validator.stake, validator.active);
  return StakeResult::OK;
}

StakeResult ValidatorRegistry::Slash(const Address &address,
                                     uint32_t penalty_percent,
                                     uint64_t *slashed) {
  auto it = validators_.find(address);
  if (it == validators_.end()) {
    return StakeResult::NOT_FOUND;
  }

  Validator &validator = it->second;
  const uint64_t percent = std::min<uint32_t>(penalty_percent, 100);

  // floor(stake * percent / 100) without overflowing the product
  const uint64_t penalty =
      (validator.stake / 100) * percent + (validator.stake % 100) * percent / 100;

  SetStake(validator, SaturatingSub(validator.stake, penalty));
  validator.total_slashed = SaturatingAdd(validator.total_slashed, penalty);

  if (slashed) {
    *slashed = penalty;
  }

  LOG_STAKE_WARN("Validator {} slashed {}% ({} units, remaining {}, active={})",
                 address, percent, penalty, validator.stake, validator.active);
  return StakeResult::OK;
}

uint64_t ValidatorRegistry::DistributeRewards(uint64_t total) {
  if (active_count_ == 0) {
    return 0;
  }

  const uint64_t per_validator = total / active_count_;
  if (per_validator == 0) {
    return 0;
  }

  for (auto &[address, validator] : validators_) {
    if (validator.active) {
      validator.total_rewards =
          SaturatingAdd(validator.total_rewards, per_validator);
    }
  }

  LOG_STAKE_DEBUG("Distributed {} to each of {} active validators",
                  per_validator, active_count_);
  return per_validator * active_count_;
}

bool ValidatorRegistry::RecordBlockProduced(const Address &producer,
                                            uint64_t height) {
  auto it = validators_.find(producer);
  if (it == validators_.end()) {
    return false;
  }
  it->second.blocks_produced++;
  it->second.last_active_height = height;
  return true;
}

const Validator *ValidatorRegistry::Get(const Address &address) const {
  auto it = validators_.find(address);
  return it == validators_.end() ? nullptr : &it->second;
}

std::vector<Validator> ValidatorRegistry::GetAll() const {
  std::vector<Validator> result;
  result.reserve(validators_.size());
  for (const auto &[address, validator] : validators_) {
    result.push_back(validator);
  }
  return result;
}

} // namespace staking
} // namespace codl3
