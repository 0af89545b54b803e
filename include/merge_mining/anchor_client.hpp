// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_MERGE_MINING_ANCHOR_CLIENT_HPP
#define CODL3_MERGE_MINING_ANCHOR_CLIENT_HPP

#include "crypto/sha256.hpp"
#include "network/http_jsonrpc_client.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace codl3 {
namespace merge_mining {

struct AnchorTip {
  uint64_t height{0};
  Hash256 hash{};
  uint64_t timestamp{0};
};

/**
 * Query interface of the anchor-chain daemon
 *
 * GetTip() throws network::TransientNetworkError on failure.
 */
class AnchorChainClient {
public:
  virtual ~AnchorChainClient() = default;

  virtual AnchorTip GetTip() = 0;
};

// Daemon JSON-RPC: getblockcount, then getblock [height]
class JsonRpcAnchorClient : public AnchorChainClient {
public:
  JsonRpcAnchorClient(const std::string &url,
                      std::chrono::milliseconds timeout);

  AnchorTip GetTip() override;

private:
  network::HttpJsonRpcClient rpc_;
};

} // namespace merge_mining
} // namespace codl3

#endif // CODL3_MERGE_MINING_ANCHOR_CLIENT_HPP
