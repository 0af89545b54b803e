// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_RPC_HTTP_SERVER_HPP
#define CODL3_RPC_HTTP_SERVER_HPP

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74) without including it
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace codl3 {
namespace rpc {

struct HttpRequest {
    std::string method;  // "GET", "POST", ...
    std::string path;    // Query string stripped
    std::string body;
};

struct HttpResponse {
    int status{200};
    std::string body;    // JSON text

    // Full HTTP/1.1 message with Connection: close
    std::string Serialize() const;
};

std::string HttpStatusReason(int status);

/**
 * Minimal HTTP/1.1 listener on boost::asio
 *
 * One request per connection. Requests are read up to the header
 * terminator plus Content-Length bytes (capped at MAX_BODY_SIZE) and
 * passed to the handler on the IO thread. A connection that has not
 * delivered a full request within the read timeout is closed.
 */
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;
    static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;

    static constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{10000};

    explicit HttpServer(Handler handler,
                        std::chrono::milliseconds read_timeout = DEFAULT_READ_TIMEOUT);
    ~HttpServer();

    bool Start(const std::string& bind_address, uint16_t port);
    void Stop();
    bool IsRunning() const { return running_; }

    // Actual bound port (useful when started with port 0)
    uint16_t GetPort() const { return bound_port_; }

private:
    void StartAccept();

    Handler handler_;
    std::chrono::milliseconds read_timeout_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_{0};
};

// Split "GET /path?x HTTP/1.1" request head; false if malformed
bool ParseRequestHead(const std::string& head, HttpRequest& request,
                      size_t& content_length);

} // namespace rpc
} // namespace codl3

#endif // CODL3_RPC_HTTP_SERVER_HPP
