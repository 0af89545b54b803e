// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_SETTLEMENT_PROOF_SYSTEM_HPP
#define CODL3_SETTLEMENT_PROOF_SYSTEM_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace codl3 {
namespace settlement {

/**
 * Settlement mode of the rollup
 *
 * Only decides which artifact accompanies a produced block:
 * - FRAUD_PROOF: no artifact; blocks can be disputed inside the challenge
 *   window through the bridge ledger
 * - ZK_PROOF: every block carries a validity proof from the ProofSystem
 */
enum class SettlementMode { FRAUD_PROOF, ZK_PROOF };

std::string SettlementModeToString(SettlementMode mode);
bool ParseSettlementMode(const std::string &str, SettlementMode &out);

// Opaque proof produced and checked by a ProofSystem
struct ProofBlob {
  std::string system;            // Name of the producing system
  std::vector<uint8_t> data;     // Proof bytes
  std::vector<std::string> inputs; // Public inputs the proof commits to

  bool operator==(const ProofBlob &other) const = default;
};

/**
 * Injected proof capability
 *
 * The node never interprets proof bytes itself, so a real prover can
 * replace the bundled commitment scheme without touching block production
 * or validation.
 */
class ProofSystem {
public:
  virtual ~ProofSystem() = default;

  virtual ProofBlob Generate(const std::vector<std::string> &inputs) const = 0;
  virtual bool Verify(const ProofBlob &blob) const = 0;
  virtual std::string Name() const = 0;
};

/**
 * SHA-256 commitment over the public inputs
 *
 * Binds a proof to its inputs so tampering is detected. Provides no
 * soundness beyond that.
 */
class HashCommitmentProofSystem : public ProofSystem {
public:
  ProofBlob Generate(const std::vector<std::string> &inputs) const override;
  bool Verify(const ProofBlob &blob) const override;
  std::string Name() const override { return "sha256-commitment"; }
};

} // namespace settlement
} // namespace codl3

#endif // CODL3_SETTLEMENT_PROOF_SYSTEM_HPP
