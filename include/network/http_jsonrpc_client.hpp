// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_NETWORK_HTTP_JSONRPC_CLIENT_HPP
#define CODL3_NETWORK_HTTP_JSONRPC_CLIENT_HPP

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace codl3 {
namespace network {

/**
 * Failure talking to an upstream daemon (anchor chain or L1)
 *
 * Covers resolve/connect errors, timeouts, non-2xx replies, malformed JSON
 * and JSON-RPC error objects. Background tasks log it and retry on the
 * next tick; it never implies a state change.
 */
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct HttpEndpoint {
  std::string host;
  uint16_t port{80};
  std::string target{"/"};
};

// "http://host[:port][/path]"; false for other schemes or a bad port
bool ParseHttpUrl(const std::string &url, HttpEndpoint &out);

/**
 * Minimal JSON-RPC 2.0 over HTTP/1.0 POST
 *
 * Each call opens a fresh connection on a private io_context and runs it
 * for at most `timeout`; an unfinished exchange is cancelled and reported
 * as TransientNetworkError. Safe to call from several threads.
 */
class HttpJsonRpcClient {
public:
  // Throws std::invalid_argument if `url` is not a plain http URL
  HttpJsonRpcClient(const std::string &url, std::chrono::milliseconds timeout);

  // Returns the "result" member; throws TransientNetworkError
  nlohmann::json Call(const std::string &method,
                      const nlohmann::json &params = nlohmann::json::array());

  const std::string &GetUrl() const { return url_; }
  std::chrono::milliseconds GetTimeout() const { return timeout_; }

private:
  // Raw response body of a 2xx reply
  std::string Post(const std::string &body);

  std::string url_;
  HttpEndpoint endpoint_;
  std::chrono::milliseconds timeout_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace network
} // namespace codl3

#endif // CODL3_NETWORK_HTTP_JSONRPC_CLIENT_HPP
