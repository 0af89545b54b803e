// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_NETWORK_L1_CLIENT_HPP
#define CODL3_NETWORK_L1_CLIENT_HPP

#include "network/http_jsonrpc_client.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace codl3 {
namespace network {

/**
 * View of the layer-1 chain hosting the bridge contract
 *
 * Implementations throw TransientNetworkError on any query failure.
 */
class L1Client {
public:
  virtual ~L1Client() = default;

  virtual uint64_t GetBlockNumber() = 0;
  virtual uint64_t GetGasPrice() = 0;
};

// Ethereum JSON-RPC (eth_blockNumber / eth_gasPrice)
class JsonRpcL1Client : public L1Client {
public:
  JsonRpcL1Client(const std::string &url, std::chrono::milliseconds timeout);

  uint64_t GetBlockNumber() override;
  uint64_t GetGasPrice() override;

private:
  // Hex quantity ("0x1b4") from `method`
  uint64_t CallQuantity(const std::string &method);

  HttpJsonRpcClient rpc_;
};

} // namespace network
} // namespace codl3

#endif // CODL3_NETWORK_L1_CLIENT_HPP
