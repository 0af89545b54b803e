// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "rpc/http_server.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace codl3 {
namespace rpc {

std::string HttpStatusReason(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  }
  return "Unknown";
}

std::string HttpResponse::Serialize() const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << HttpStatusReason(status) << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
  return out.str();
}

bool ParseRequestHead(const std::string &head, HttpRequest &request,
                      size_t &content_length) {
  std::istringstream stream(head);
  std::string line;
  if (!std::getline(stream, line)) {
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream request_line(line);
  std::string target, version;
  if (!(request_line >> request.method >> target >> version) ||
      version.compare(0, 5, "HTTP/") != 0 || target.empty() ||
      target[0] != '/') {
    return false;
  }
  request.path = target.substr(0, target.find('?'));

  content_length = 0;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name == "content-length") {
      std::string value = line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(' '));
      if (value.empty() ||
          value.find_first_not_of("0123456789") != std::string::npos ||
          value.size() > 9) {
        return false;
      }
      content_length = std::stoul(value);
    }
  }
  return true;
}

namespace {

// One connection, one request
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(boost::asio::ip::tcp::socket socket,
              const HttpServer::Handler &handler,
              std::chrono::milliseconds read_timeout)
      : socket_(std::move(socket)), deadline_(socket_.get_executor()),
        handler_(handler),
        buffer_(HttpServer::MAX_HEADER_SIZE + HttpServer::MAX_BODY_SIZE),
        read_timeout_(read_timeout) {}

  void Start() {
    auto self = shared_from_this();

    // Closing the socket aborts whichever read is pending
    deadline_.expires_after(read_timeout_);
    deadline_.async_wait([this, self](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      LOG_RPC_DEBUG("closing connection: no request within {} ms",
                    read_timeout_.count());
      boost::system::error_code ignored;
      socket_.close(ignored);
    });

    boost::asio::async_read_until(
        socket_, buffer_, "\r\n\r\n",
        [this, self](const boost::system::error_code &ec,
                     size_t header_bytes) {
          if (ec) {
            LOG_RPC_TRACE("read error: {}", ec.message());
            return;
          }
          OnHead(header_bytes);
        });
  }

private:
  void OnHead(size_t header_bytes) {
    if (header_bytes > HttpServer::MAX_HEADER_SIZE) {
      return Reply(HttpResponse{413, R"({"error":"PayloadTooLarge"})"});
    }

    const std::string head(
        boost::asio::buffers_begin(buffer_.data()),
        boost::asio::buffers_begin(buffer_.data()) + header_bytes);
    buffer_.consume(header_bytes);

    size_t content_length = 0;
    if (!ParseRequestHead(head, request_, content_length)) {
      return Reply(HttpResponse{400, R"({"error":"BadRequest"})"});
    }
    if (content_length > HttpServer::MAX_BODY_SIZE) {
      return Reply(HttpResponse{413, R"({"error":"PayloadTooLarge"})"});
    }

    if (buffer_.size() >= content_length) {
      return OnBody(content_length);
    }

    auto self = shared_from_this();
    boost::asio::async_read(
        socket_, buffer_,
        boost::asio::transfer_exactly(content_length - buffer_.size()),
        [this, self, content_length](const boost::system::error_code &ec,
                                     size_t) {
          if (ec) {
            LOG_RPC_TRACE("body read error: {}", ec.message());
            return;
          }
          OnBody(content_length);
        });
  }

  void OnBody(size_t content_length) {
    request_.body.assign(
        boost::asio::buffers_begin(buffer_.data()),
        boost::asio::buffers_begin(buffer_.data()) + content_length);
    buffer_.consume(content_length);

    LOG_RPC_DEBUG("{} {}", request_.method, request_.path);
    Reply(handler_(request_));
  }

  void Reply(const HttpResponse &response) {
    response_ = response.Serialize();
    auto self = shared_from_this();
    boost::asio::async_write(
        socket_, boost::asio::buffer(response_),
        [this, self](const boost::system::error_code &, size_t) {
          deadline_.cancel();
          boost::system::error_code ignored;
          socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                           ignored);
          socket_.close(ignored);
        });
  }

  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer deadline_;
  const HttpServer::Handler &handler_;
  boost::asio::streambuf buffer_;
  std::chrono::milliseconds read_timeout_;
  HttpRequest request_;
  std::string response_;
};

} // namespace

HttpServer::HttpServer(Handler handler, std::chrono::milliseconds read_timeout)
    : handler_(std::move(handler)), read_timeout_(read_timeout) {}

HttpServer::~HttpServer() { Stop(); }

bool HttpServer::Start(const std::string &bind_address, uint16_t port) {
  if (running_) {
    return true;
  }

  try {
    using tcp = boost::asio::ip::tcp;
    const tcp::endpoint endpoint(boost::asio::ip::make_address(bind_address),
                                 port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception &e) {
    LOG_RPC_ERROR("failed to listen on {}:{}: {}", bind_address, port,
                  e.what());
    acceptor_.reset();
    return false;
  }

  running_ = true;
  StartAccept();
  io_context_.restart();
  io_thread_ = std::thread([this]() { io_context_.run(); });

  LOG_RPC_INFO("RPC server listening on {}:{}", bind_address, bound_port_);
  return true;
}

void HttpServer::StartAccept() {
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        LOG_RPC_TRACE("accept error: {}", ec.message());
        StartAccept();
      }
      return;
    }
    std::make_shared<HttpSession>(std::move(socket), handler_, read_timeout_)
        ->Start();
    StartAccept();
  });
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  boost::system::error_code ignored;
  acceptor_->close(ignored);
  acceptor_.reset();

  LOG_RPC_INFO("RPC server stopped");
}

} // namespace rpc
} // namespace codl3
