// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "settlement/proof_system.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace codl3 {
namespace settlement {

namespace {

// Domain separator so a commitment is never mistaken for a block hash
const std::string PROOF_DOMAIN = "codl3/settlement-proof/v1";

std::vector<uint8_t> CommitmentPreimage(const std::vector<std::string> &inputs) {
  std::vector<uint8_t> buf(PROOF_DOMAIN.begin(), PROOF_DOMAIN.end());
  endian::AppendLE32(buf, static_cast<uint32_t>(inputs.size()));
  for (const auto &input : inputs) {
    endian::AppendLE32(buf, static_cast<uint32_t>(input.size()));
    buf.insert(buf.end(), input.begin(), input.end());
  }
  return buf;
}

} // namespace

std::string SettlementModeToString(SettlementMode mode) {
  switch (mode) {
  case SettlementMode::FRAUD_PROOF:
    return "fraud-proof";
  case SettlementMode::ZK_PROOF:
    return "zk-proof";
  }
  return "unknown";
}

bool ParseSettlementMode(const std::string &str, SettlementMode &out) {
  if (str == "fraud-proof" || str == "fraud") {
    out = SettlementMode::FRAUD_PROOF;
    return true;
  }
  if (str == "zk-proof" || str == "zk") {
    out = SettlementMode::ZK_PROOF;
    return true;
  }
  return false;
}

ProofBlob HashCommitmentProofSystem::Generate(
    const std::vector<std::string> &inputs) const {
  Hash256 commitment = crypto::Sha256(CommitmentPreimage(inputs));

  ProofBlob blob;
  blob.system = Name();
  blob.data.assign(commitment.begin(), commitment.end());
  blob.inputs = inputs;
  return blob;
}

bool HashCommitmentProofSystem::Verify(const ProofBlob &blob) const {
  if (blob.system != Name() || blob.data.size() != 32) {
    return false;
  }

  Hash256 expected = crypto::Sha256(CommitmentPreimage(blob.inputs));
  return std::equal(expected.begin(), expected.end(), blob.data.begin());
}

} // namespace settlement
} // namespace codl3
