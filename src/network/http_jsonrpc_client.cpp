// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "network/http_jsonrpc_client.hpp"
#include "util/logging.hpp"
#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74) without including it
#include <boost/asio.hpp>
#include <sstream>

namespace codl3 {
namespace network {

bool ParseHttpUrl(const std::string &url, HttpEndpoint &out) {
  static const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return false;
  }

  std::string rest = url.substr(scheme.size());
  std::string authority = rest;
  std::string target = "/";
  const size_t slash = rest.find('/');
  if (slash != std::string::npos) {
    authority = rest.substr(0, slash);
    target = rest.substr(slash);
  }

  HttpEndpoint endpoint;
  endpoint.target = target;
  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    endpoint.host = authority.substr(0, colon);
    const std::string port_str = authority.substr(colon + 1);
    if (port_str.empty() || port_str.size() > 5 ||
        port_str.find_first_not_of("0123456789") != std::string::npos) {
      return false;
    }
    const unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
      return false;
    }
    endpoint.port = static_cast<uint16_t>(port);
  } else {
    endpoint.host = authority;
  }

  if (endpoint.host.empty()) {
    return false;
  }

  out = endpoint;
  return true;
}

HttpJsonRpcClient::HttpJsonRpcClient(const std::string &url,
                                     std::chrono::milliseconds timeout)
    : url_(url), timeout_(timeout) {
  if (!ParseHttpUrl(url, endpoint_)) {
    throw std::invalid_argument("unsupported RPC URL: " + url);
  }
}

nlohmann::json HttpJsonRpcClient::Call(const std::string &method,
                                       const nlohmann::json &params) {
  nlohmann::json request = {{"jsonrpc", "2.0"},
                            {"method", method},
                            {"params", params},
                            {"id", next_id_.fetch_add(1)}};

  const std::string body = Post(request.dump());

  nlohmann::json reply = nlohmann::json::parse(body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    throw TransientNetworkError(method + ": malformed JSON from " + url_);
  }

  if (reply.contains("error") && !reply["error"].is_null()) {
    throw TransientNetworkError(method + ": " + reply["error"].dump());
  }

  if (!reply.contains("result")) {
    throw TransientNetworkError(method + ": reply without result from " +
                                url_);
  }

  return reply["result"];
}

std::string HttpJsonRpcClient::Post(const std::string &body) {
  using tcp = boost::asio::ip::tcp;

  std::ostringstream request_stream;
  request_stream << "POST " << endpoint_.target << " HTTP/1.0\r\n"
                 << "Host: " << endpoint_.host << ":" << endpoint_.port
                 << "\r\n"
                 << "Content-Type: application/json\r\n"
                 << "Content-Length: " << body.size() << "\r\n"
                 << "Connection: close\r\n\r\n"
                 << body;
  const std::string request = request_stream.str();

  boost::asio::io_context io_context;
  tcp::resolver resolver(io_context);
  tcp::socket socket(io_context);
  boost::asio::streambuf response_buf;

  boost::system::error_code error;
  bool done = false;

  auto finish = [&](const boost::system::error_code &ec) {
    error = ec;
    done = true;
  };

  resolver.async_resolve(
      endpoint_.host, std::to_string(endpoint_.port),
      [&](const boost::system::error_code &ec,
          tcp::resolver::results_type results) {
        if (ec) {
          return finish(ec);
        }
        boost::asio::async_connect(
            socket, results,
            [&](const boost::system::error_code &ec, const tcp::endpoint &) {
              if (ec) {
                return finish(ec);
              }
              boost::asio::async_write(
                  socket, boost::asio::buffer(request),
                  [&](const boost::system::error_code &ec, size_t) {
                    if (ec) {
                      return finish(ec);
                    }
                    // HTTP/1.0 with Connection: close, so EOF ends the reply
                    boost::asio::async_read(
                        socket, response_buf,
                        [&](const boost::system::error_code &ec, size_t) {
                          finish(ec == boost::asio::error::eof
                                     ? boost::system::error_code()
                                     : ec);
                        });
                  });
            });
      });

  io_context.run_for(timeout_);

  if (!done) {
    // Cancel outstanding operations and let their handlers drain
    boost::system::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io_context.restart();
    io_context.run();
    throw TransientNetworkError("timeout after " +
                                std::to_string(timeout_.count()) +
                                "ms talking to " + url_);
  }

  if (error) {
    throw TransientNetworkError(url_ + ": " + error.message());
  }

  const std::string response(
      boost::asio::buffers_begin(response_buf.data()),
      boost::asio::buffers_end(response_buf.data()));

  // Status line: "HTTP/1.x <code> <reason>"
  const size_t line_end = response.find("\r\n");
  const size_t header_end = response.find("\r\n\r\n");
  if (line_end == std::string::npos || header_end == std::string::npos) {
    throw TransientNetworkError(url_ + ": truncated HTTP response");
  }

  std::istringstream status_line(response.substr(0, line_end));
  std::string http_version;
  int status_code = 0;
  status_line >> http_version >> status_code;
  if (http_version.compare(0, 5, "HTTP/") != 0 || status_code == 0) {
    throw TransientNetworkError(url_ + ": bad HTTP status line");
  }
  if (status_code < 200 || status_code >= 300) {
    throw TransientNetworkError(url_ + ": HTTP status " +
                                std::to_string(status_code));
  }

  LOG_NET_TRACE("{} replied {} ({} bytes)", url_, status_code,
                response.size() - header_end - 4);
  return response.substr(header_end + 4);
}

} // namespace network
} // namespace codl3
