// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "primitives/block.hpp"
#include "util/endian.hpp"
#include "util/saturating.hpp"

namespace codl3 {

std::vector<uint8_t> BlockHeader::Serialize() const {
  std::vector<uint8_t> data;
  data.reserve(8 * 8 + 32 * 2 + 4 + producer.size());

  endian::AppendLE64(data, height);
  data.insert(data.end(), parent_hash.begin(), parent_hash.end());
  endian::AppendLE64(data, timestamp);
  data.insert(data.end(), merkle_root.begin(), merkle_root.end());
  endian::AppendLE32(data, static_cast<uint32_t>(producer.size()));
  data.insert(data.end(), producer.begin(), producer.end());
  endian::AppendLE64(data, gas_used);
  endian::AppendLE64(data, gas_limit);
  endian::AppendLE64(data, nonce);
  endian::AppendLE64(data, difficulty);
  endian::AppendLE64(data, anchor_height);

  return data;
}

size_t BlockHeader::NonceOffset() const {
  // height + parent + timestamp + merkle + producer prefix/bytes +
  // gas_used + gas_limit
  return 8 + 32 + 8 + 32 + 4 + producer.size() + 8 + 8;
}

Hash256 BlockHeader::GetHash() const { return crypto::Sha256(Serialize()); }

uint64_t Block::TotalFees() const {
  uint64_t total = 0;
  for (const auto &tx : transactions) {
    total = util::SaturatingAdd(total, tx.Fee());
  }
  return total;
}

} // namespace codl3
