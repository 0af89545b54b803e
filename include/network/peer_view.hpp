// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_NETWORK_PEER_VIEW_HPP
#define CODL3_NETWORK_PEER_VIEW_HPP

#include <atomic>
#include <cstdint>

namespace codl3 {
namespace network {

// What the P2P layer knows about the rest of the network
class PeerView {
public:
  virtual ~PeerView() = default;

  virtual uint64_t BestKnownHeight() const = 0;
  virtual uint32_t PeerCount() const = 0;
};

// Fixed view used when no P2P transport is attached
class StaticPeerView : public PeerView {
public:
  explicit StaticPeerView(uint64_t best_known_height = 0,
                          uint32_t peer_count = 0)
      : best_known_height_(best_known_height), peer_count_(peer_count) {}

  uint64_t BestKnownHeight() const override { return best_known_height_.load(); }
  uint32_t PeerCount() const override { return peer_count_.load(); }

  void Set(uint64_t best_known_height, uint32_t peer_count) {
    best_known_height_.store(best_known_height);
    peer_count_.store(peer_count);
  }

private:
  std::atomic<uint64_t> best_known_height_;
  std::atomic<uint32_t> peer_count_;
};

} // namespace network
} // namespace codl3

#endif // CODL3_NETWORK_PEER_VIEW_HPP
