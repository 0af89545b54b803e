// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "network/l1_client.hpp"
#include "util/strencodings.hpp"

namespace codl3 {
namespace network {

JsonRpcL1Client::JsonRpcL1Client(const std::string &url,
                                 std::chrono::milliseconds timeout)
    : rpc_(url, timeout) {}

uint64_t JsonRpcL1Client::CallQuantity(const std::string &method) {
  nlohmann::json result = rpc_.Call(method);

  uint64_t value = 0;
  if (result.is_string() && util::ParseUInt64(result.get<std::string>(), value)) {
    return value;
  }
  if (result.is_number_unsigned()) {
    return result.get<uint64_t>();
  }

  throw TransientNetworkError(method + ": unexpected result " + result.dump());
}

uint64_t JsonRpcL1Client::GetBlockNumber() {
  return CallQuantity("eth_blockNumber");
}

uint64_t JsonRpcL1Client::GetGasPrice() { return CallQuantity("eth_gasPrice"); }

} // namespace network
} // namespace codl3
