// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "consensus/merkle.hpp"

namespace codl3 {
namespace chain {

Block CreateGenesisBlock(uint64_t nTime, uint64_t nGasLimit) {
  Block genesis;
  genesis.header.height = 0;
  genesis.header.parent_hash = ZERO_HASH;
  genesis.header.timestamp = nTime;
  genesis.header.merkle_root = consensus::ComputeMerkleRoot(genesis.transactions);
  genesis.header.producer = "genesis";
  genesis.header.gas_used = 0;
  genesis.header.gas_limit = nGasLimit;
  genesis.header.nonce = 0;
  genesis.header.difficulty = 0;
  genesis.header.anchor_height = 0;
  return genesis;
}

std::string ChainTypeToString(ChainType type) {
  switch (type) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::string ChainParams::GetChainTypeString() const {
  return ChainTypeToString(chainType);
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType type) {
  switch (type) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::TESTNET:
    return CreateTestNet();
  case ChainType::REGTEST:
    return CreateRegTest();
  }
  return CreateMainNet();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.nDifficulty = 2;
  consensus.nMaxNonce = 10'000'000;
  consensus.nTargetBlockTime = 30;
  consensus.nBlockGasLimit = 30'000'000;
  consensus.nAnchorBlockReward = 13'000;
  consensus.nMinStake = 80'000'000'000; // 80B HEAT
  consensus.nMaxValidators = 21;
  consensus.nSlashingPercent = 50;
  consensus.nValidatorFeeSharePercent = 10;
  consensus.nChallengePeriod = 7 * 24 * 60 * 60;
  consensus.nL1Confirmations = 12;

  nDefaultRPCPort = 9944;
  settlementMode = settlement::SettlementMode::FRAUD_PROOF;

  genesis = CreateGenesisBlock(1735689600, // Jan 1, 2025
                               consensus.nBlockGasLimit);
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  // Same economics as mainnet, one zero byte per block
  consensus.nDifficulty = 1;
  consensus.nMaxNonce = 10'000'000;
  consensus.nTargetBlockTime = 30;
  consensus.nBlockGasLimit = 30'000'000;
  consensus.nAnchorBlockReward = 13'000;
  consensus.nMinStake = 80'000'000'000;
  consensus.nMaxValidators = 21;
  consensus.nSlashingPercent = 50;
  consensus.nValidatorFeeSharePercent = 10;
  consensus.nChallengePeriod = 7 * 24 * 60 * 60;
  consensus.nL1Confirmations = 12;

  nDefaultRPCPort = 19944;
  settlementMode = settlement::SettlementMode::FRAUD_PROOF;

  genesis = CreateGenesisBlock(1735689601, consensus.nBlockGasLimit);
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  consensus.nDifficulty = 1;
  consensus.nMaxNonce = 10'000'000;
  consensus.nTargetBlockTime = 1;
  consensus.nBlockGasLimit = 30'000'000;
  consensus.nAnchorBlockReward = 13'000;
  consensus.nMinStake = 1'000;
  consensus.nMaxValidators = 4;
  consensus.nSlashingPercent = 50;
  consensus.nValidatorFeeSharePercent = 10;
  consensus.nChallengePeriod = 60 * 60; // 1 hour
  consensus.nL1Confirmations = 2;

  nDefaultRPCPort = 29944;
  settlementMode = settlement::SettlementMode::FRAUD_PROOF;

  genesis = CreateGenesisBlock(1296688602, consensus.nBlockGasLimit);
  consensus.hashGenesisBlock = genesis.GetHash();
}

} // namespace chain
} // namespace codl3
