// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for the HTTP listener and the JSON-RPC client

#include "network/http_jsonrpc_client.hpp"
#include "rpc/http_server.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <thread>

using namespace codl3;
using namespace std::chrono_literals;
using json = nlohmann::json;

TEST_CASE("Request head parsing", "[http]") {
    rpc::HttpRequest request;
    size_t content_length = 99;

    SECTION("GET without body") {
        REQUIRE(rpc::ParseRequestHead("GET /blocks/3?verbose=1 HTTP/1.1\r\nHost: x\r\n\r\n",
                                      request, content_length));
        REQUIRE(request.method == "GET");
        REQUIRE(request.path == "/blocks/3");
        REQUIRE(content_length == 0);
    }

    SECTION("Header names are case-insensitive") {
        REQUIRE(rpc::ParseRequestHead(
            "POST /transactions HTTP/1.0\r\nCONTENT-LENGTH: 17\r\n\r\n", request,
            content_length));
        REQUIRE(request.method == "POST");
        REQUIRE(content_length == 17);
    }

    SECTION("Malformed heads") {
        REQUIRE_FALSE(rpc::ParseRequestHead("GARBAGE\r\n\r\n", request, content_length));
        REQUIRE_FALSE(rpc::ParseRequestHead("GET blocks HTTP/1.1\r\n\r\n", request,
                                            content_length));
        REQUIRE_FALSE(rpc::ParseRequestHead("GET / HTTP/1.1\r\nno-colon\r\n\r\n", request,
                                            content_length));
        REQUIRE_FALSE(rpc::ParseRequestHead(
            "POST / HTTP/1.1\r\nContent-Length: -5\r\n\r\n", request, content_length));
    }
}

TEST_CASE("Response serialization", "[http]") {
    rpc::HttpResponse response{404, R"({"error":"NotFound"})"};
    std::string wire = response.Serialize();

    REQUIRE(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    REQUIRE(wire.find("Content-Length: 20\r\n") != std::string::npos);
    REQUIRE(wire.find("Connection: close\r\n") != std::string::npos);
    REQUIRE(wire.substr(wire.size() - 20) == R"({"error":"NotFound"})");
}

TEST_CASE("RPC URL parsing", "[http]") {
    network::HttpEndpoint endpoint;

    SECTION("Host and port") {
        REQUIRE(network::ParseHttpUrl("http://localhost:18180", endpoint));
        REQUIRE(endpoint.host == "localhost");
        REQUIRE(endpoint.port == 18180);
        REQUIRE(endpoint.target == "/");
    }

    SECTION("Default port and path") {
        REQUIRE(network::ParseHttpUrl("http://node.example/json_rpc", endpoint));
        REQUIRE(endpoint.host == "node.example");
        REQUIRE(endpoint.port == 80);
        REQUIRE(endpoint.target == "/json_rpc");
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(network::ParseHttpUrl("https://localhost:8545", endpoint));
        REQUIRE_FALSE(network::ParseHttpUrl("http://:8545", endpoint));
        REQUIRE_FALSE(network::ParseHttpUrl("http://localhost:0", endpoint));
        REQUIRE_FALSE(network::ParseHttpUrl("http://localhost:70000", endpoint));
        REQUIRE_FALSE(network::ParseHttpUrl("http://localhost:port", endpoint));
    }

    REQUIRE_THROWS_AS(network::HttpJsonRpcClient("ftp://x", 100ms), std::invalid_argument);
}

TEST_CASE("JSON-RPC client against a local listener", "[http][network]") {
    rpc::HttpServer server([](const rpc::HttpRequest& req) {
        json request = json::parse(req.body);
        const std::string method = request["method"].get<std::string>();

        if (method == "echo") {
            return rpc::HttpResponse{200, json{{"jsonrpc", "2.0"},
                                               {"result", request["params"]},
                                               {"id", request["id"]}}.dump()};
        }
        if (method == "fail") {
            return rpc::HttpResponse{200, json{{"jsonrpc", "2.0"},
                                               {"error", {{"code", -32601}}},
                                               {"id", request["id"]}}.dump()};
        }
        if (method == "slow") {
            std::this_thread::sleep_for(300ms);
            return rpc::HttpResponse{200, R"({"result":0})"};
        }
        if (method == "garbage") {
            return rpc::HttpResponse{200, "not json"};
        }
        return rpc::HttpResponse{500, "{}"};
    });
    REQUIRE(server.Start("127.0.0.1", 0));
    REQUIRE(server.GetPort() != 0);

    const std::string url = "http://127.0.0.1:" + std::to_string(server.GetPort());
    network::HttpJsonRpcClient client(url, 2000ms);

    SECTION("Result member is returned") {
        json result = client.Call("echo", json::array({1, "two"}));
        REQUIRE(result == json::array({1, "two"}));
    }

    SECTION("Error object is a transient failure") {
        REQUIRE_THROWS_AS(client.Call("fail"), network::TransientNetworkError);
    }

    SECTION("Non-2xx status is a transient failure") {
        REQUIRE_THROWS_AS(client.Call("unknown"), network::TransientNetworkError);
    }

    SECTION("Malformed body is a transient failure") {
        REQUIRE_THROWS_AS(client.Call("garbage"), network::TransientNetworkError);
    }

    SECTION("Slow upstream times out") {
        network::HttpJsonRpcClient impatient(url, 50ms);
        REQUIRE_THROWS_AS(impatient.Call("slow"), network::TransientNetworkError);
    }

    server.Stop();
    REQUIRE_FALSE(server.IsRunning());
}

TEST_CASE("JSON-RPC client without a listener", "[http][network]") {
    uint16_t port = 0;
    {
        rpc::HttpServer listener([](const rpc::HttpRequest&) { return rpc::HttpResponse{}; });
        REQUIRE(listener.Start("127.0.0.1", 0));
        port = listener.GetPort();
        listener.Stop();
    }

    network::HttpJsonRpcClient client("http://127.0.0.1:" + std::to_string(port), 1000ms);
    REQUIRE_THROWS_AS(client.Call("getblockcount"), network::TransientNetworkError);
}

TEST_CASE("Idle connections are closed after the read timeout", "[http]") {
    rpc::HttpServer server(
        [](const rpc::HttpRequest&) { return rpc::HttpResponse{200, R"({"result":1})"}; }, 200ms);
    REQUIRE(server.Start("127.0.0.1", 0));

    boost::asio::io_context io;
    boost::asio::ip::tcp::socket idle(io);
    idle.connect({boost::asio::ip::make_address("127.0.0.1"), server.GetPort()});

    // Send nothing and wait for the server to hang up
    std::array<char, 16> buf{};
    boost::system::error_code read_error;
    bool closed = false;
    const auto start = std::chrono::steady_clock::now();
    idle.async_read_some(boost::asio::buffer(buf),
                         [&](const boost::system::error_code& ec, size_t) {
                             read_error = ec;
                             closed = true;
                         });
    io.run_for(5s);

    REQUIRE(closed);
    REQUIRE(read_error == boost::asio::error::eof);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);

    // The listener keeps serving new connections
    network::HttpJsonRpcClient client(
        "http://127.0.0.1:" + std::to_string(server.GetPort()), 2000ms);
    REQUIRE(client.Call("anything") == 1);

    server.Stop();
}
