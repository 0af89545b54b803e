// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_CHAIN_CHAINPARAMS_HPP
#define CODL3_CHAIN_CHAINPARAMS_HPP

#include "primitives/block.hpp"
#include "settlement/proof_system.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace codl3 {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,    // Production network
  TESTNET, // Public test network
  REGTEST  // Regression test (local testing)
};

// "main", "test" or "regtest"
std::string ChainTypeToString(ChainType type);

/**
 * Consensus and economic parameters
 */
struct ConsensusParams {
  // Proof of work
  uint64_t nDifficulty{2};           // Leading zero bytes per block hash
  uint64_t nMaxNonce{10'000'000};    // Nonces tried per mining round
  int64_t nTargetBlockTime{30};      // Seconds between blocks
  uint64_t nBlockGasLimit{30'000'000};

  // Merge mining: reward credited per newly observed anchor block
  // (base 10000 + fees 2000 + validator share 1000)
  uint64_t nAnchorBlockReward{13'000};

  // Validator set
  uint64_t nMinStake{80'000'000'000};
  uint32_t nMaxValidators{21};
  uint32_t nSlashingPercent{50};

  // Share of block gas fees set aside for active validators
  uint32_t nValidatorFeeSharePercent{10};

  // Settlement
  int64_t nChallengePeriod{7 * 24 * 60 * 60}; // 1 week
  uint64_t nL1Confirmations{12};

  Hash256 hashGenesisBlock{};
};

/**
 * ChainParams - Chain-specific parameters
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  uint16_t GetDefaultRPCPort() const { return nDefaultRPCPort; }
  const Block &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;
  settlement::SettlementMode GetDefaultSettlementMode() const {
    return settlementMode;
  }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> Create(ChainType type);

protected:
  ConsensusParams consensus;
  uint16_t nDefaultRPCPort{};
  ChainType chainType{ChainType::MAIN};
  settlement::SettlementMode settlementMode{
      settlement::SettlementMode::FRAUD_PROOF};
  Block genesis;
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * TestNet parameters
 */
class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

// Genesis: height 0, no parent, no transactions, difficulty 0
Block CreateGenesisBlock(uint64_t nTime, uint64_t nGasLimit);

} // namespace chain
} // namespace codl3

#endif // CODL3_CHAIN_CHAINPARAMS_HPP
