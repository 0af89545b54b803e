// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_RPC_RPC_SERVER_HPP
#define CODL3_RPC_RPC_SERVER_HPP

#include "rpc/http_server.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace codl3 {

// Forward declarations
namespace chain { class ChainParams; }
namespace mining { class CPUMiner; }
namespace validation { class ChainstateManager; }

namespace rpc {

/**
 * HTTP+JSON RPC server
 *
 * Routes are "METHOD /path/{param}" patterns; HandleRequest() does the
 * routing and can be called directly without a listener. Errors are
 * returned as {"error": <kind>, "message": <detail>} with the status
 * mapped from the error kind.
 */
class RPCServer {
public:
    using PathParams = std::vector<std::string>;
    using RouteHandler = std::function<HttpResponse(const HttpRequest&, const PathParams&)>;

    /**
     * Constructor
     * @param chainstate_manager Reference to chainstate manager
     * @param miner CPU miner for hash statistics (optional)
     * @param params Chain parameters
     */
    RPCServer(validation::ChainstateManager& chainstate_manager,
              mining::CPUMiner* miner,
              const chain::ChainParams& params);
    ~RPCServer();

    /**
     * Start listening (binds `bind_address:port`)
     */
    bool Start(const std::string& bind_address, uint16_t port);

    /**
     * Stop listening
     */
    void Stop();

    bool IsRunning() const { return http_ && http_->IsRunning(); }
    uint16_t GetPort() const { return http_ ? http_->GetPort() : 0; }

    /**
     * Route and execute one request
     *
     * 404 when no route matches the path, 405 when the path matches but
     * the method does not.
     */
    HttpResponse HandleRequest(const HttpRequest& request);
    HttpResponse HandleRequest(const std::string& method, const std::string& path,
                               const std::string& body = "");

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;  // "{}" captures one segment
        RouteHandler handler;
    };

    void RegisterHandlers();
    void AddRoute(const std::string& method, const std::string& pattern,
                  RouteHandler handler);

    // Node
    HttpResponse HandleHealth(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetStatus(const HttpRequest& req, const PathParams& params);

    // Chain
    HttpResponse HandleGetBlocks(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetBlock(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetTransactions(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleSubmitTransaction(const HttpRequest& req, const PathParams& params);

    // Validators
    HttpResponse HandleGetValidators(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetValidator(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleStake(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleUnstake(const HttpRequest& req, const PathParams& params);

    // Bridge
    HttpResponse HandleGetBridgeTransactions(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetBridgeTransaction(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleDeposit(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleWithdraw(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleCompleteBridgeTransaction(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleFailBridgeTransaction(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleSubmitFraudProof(const HttpRequest& req, const PathParams& params);

    // Mining
    HttpResponse HandleGetRewards(const HttpRequest& req, const PathParams& params);
    HttpResponse HandleGetMiningStats(const HttpRequest& req, const PathParams& params);

private:
    validation::ChainstateManager& chainstate_manager_;
    mining::CPUMiner* miner_;  // Optional, can be nullptr
    const chain::ChainParams& params_;

    std::vector<Route> routes_;
    std::unique_ptr<HttpServer> http_;
};

} // namespace rpc
} // namespace codl3

#endif // CODL3_RPC_RPC_SERVER_HPP
