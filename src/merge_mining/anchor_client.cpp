// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "merge_mining/anchor_client.hpp"
#include "util/strencodings.hpp"

namespace codl3 {
namespace merge_mining {

JsonRpcAnchorClient::JsonRpcAnchorClient(const std::string &url,
                                         std::chrono::milliseconds timeout)
    : rpc_(url, timeout) {}

AnchorTip JsonRpcAnchorClient::GetTip() {
  // Plain number, or {"count": N, "status": "OK"} from CryptoNote daemons
  nlohmann::json count = rpc_.Call("getblockcount");
  if (count.is_object() && count.contains("count")) {
    count = count["count"];
  }
  if (!count.is_number_unsigned()) {
    throw network::TransientNetworkError("getblockcount: unexpected result " +
                                         count.dump());
  }

  AnchorTip tip;
  tip.height = count.get<uint64_t>();

  nlohmann::json block = rpc_.Call("getblock", nlohmann::json::array({tip.height}));
  if (block.is_object() && block.contains("block_header")) {
    block = block["block_header"];
  }
  if (!block.is_object() || !block.contains("hash") ||
      !block["hash"].is_string() ||
      !util::ParseHash256(block["hash"].get<std::string>(), tip.hash)) {
    throw network::TransientNetworkError("getblock: missing or malformed hash");
  }

  for (const char *key : {"time", "timestamp"}) {
    if (block.contains(key) && block[key].is_number_unsigned()) {
      tip.timestamp = block[key].get<uint64_t>();
      break;
    }
  }

  return tip;
}

} // namespace merge_mining
} // namespace codl3
