// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "rpc/rpc_server.hpp"
#include "chain/chainparams.hpp"
#include "mining/miner.hpp"
#include "network/http_jsonrpc_client.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace codl3 {
namespace rpc {

namespace {

// Latest blocks returned by GET /blocks
constexpr size_t MAX_RECENT_BLOCKS = 100;

// Request-level failure, turned into an error response by HandleRequest()
class RequestError : public std::runtime_error {
public:
  RequestError(int status, const std::string &kind, const std::string &message)
      : std::runtime_error(message), status(status), kind(kind) {}

  int status;
  std::string kind;
};

HttpResponse JsonResponse(int status, const nlohmann::json &j) {
  return HttpResponse{status, j.dump()};
}

HttpResponse ErrorResponse(int status, const std::string &kind,
                           const std::string &message = "") {
  nlohmann::json j = {{"error", kind}};
  if (!message.empty()) {
    j["message"] = message;
  }
  return JsonResponse(status, j);
}

int StakeResultStatus(staking::StakeResult result) {
  switch (result) {
  case staking::StakeResult::OK:
    return 200;
  case staking::StakeResult::NOT_FOUND:
    return 404;
  case staking::StakeResult::BELOW_MINIMUM:
  case staking::StakeResult::SET_FULL:
  case staking::StakeResult::INSUFFICIENT_STAKE:
    return 400;
  }
  return 400;
}

int BridgeResultStatus(bridge::BridgeResult result) {
  switch (result) {
  case bridge::BridgeResult::OK:
    return 200;
  case bridge::BridgeResult::NOT_FOUND:
  case bridge::BridgeResult::UNKNOWN_BLOCK:
    return 404;
  case bridge::BridgeResult::INVALID_TRANSITION:
  case bridge::BridgeResult::CHALLENGE_EXPIRED:
    return 409;
  }
  return 400;
}

nlohmann::json ParseBody(const HttpRequest &req) {
  nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw RequestError{400, "BadRequest", "body must be a JSON object"};
  }
  return body;
}

uint64_t RequireUInt(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body[key].is_number_unsigned()) {
    throw RequestError{400, "BadRequest",
                       "'" + key + "' must be a non-negative integer"};
  }
  return body[key].get<uint64_t>();
}

uint64_t OptionalUInt(const nlohmann::json &body, const std::string &key,
                      uint64_t fallback) {
  if (!body.contains(key)) {
    return fallback;
  }
  return RequireUInt(body, key);
}

std::string RequireString(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body[key].is_string() ||
      body[key].get<std::string>().empty()) {
    throw RequestError{400, "BadRequest",
                       "'" + key + "' must be a non-empty string"};
  }
  return body[key].get<std::string>();
}

std::vector<uint8_t> OptionalHex(const nlohmann::json &body,
                                 const std::string &key) {
  std::vector<uint8_t> out;
  if (!body.contains(key)) {
    return out;
  }
  if (!body[key].is_string() || !util::ParseHex(body[key].get<std::string>(), out)) {
    throw RequestError{400, "BadRequest", "'" + key + "' must be hex"};
  }
  return out;
}

uint64_t ParseHeightParam(const std::string &str) {
  uint64_t height = 0;
  if (!util::ParseUInt64(str, height)) {
    throw RequestError{400, "BadRequest", "invalid height: " + str};
  }
  return height;
}

nlohmann::json TransactionToJson(const Transaction &tx) {
  nlohmann::json j;
  j["hash"] = util::HexStr(tx.hash);
  j["from"] = tx.from;
  j["to"] = tx.to;
  j["value"] = tx.value;
  j["gas_price"] = tx.gas_price;
  j["gas_limit"] = tx.gas_limit;
  j["nonce"] = tx.nonce;
  j["payload"] = util::HexStr(tx.payload);
  j["signature"] = util::HexStr(tx.signature);
  j["status"] = TxStatusToString(tx.status);
  return j;
}

nlohmann::json BlockToJson(const Block &block) {
  const BlockHeader &h = block.header;

  nlohmann::json j;
  j["hash"] = util::HexStr(block.GetHash());
  j["height"] = h.height;
  j["parent_hash"] = util::HexStr(h.parent_hash);
  j["timestamp"] = h.timestamp;
  j["time_str"] = util::FormatTime(static_cast<int64_t>(h.timestamp));
  j["merkle_root"] = util::HexStr(h.merkle_root);
  j["producer"] = h.producer;
  j["gas_used"] = h.gas_used;
  j["gas_limit"] = h.gas_limit;
  j["nonce"] = h.nonce;
  j["difficulty"] = h.difficulty;
  j["anchor_height"] = h.anchor_height;

  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : block.transactions) {
    txs.push_back(TransactionToJson(tx));
  }
  j["transactions"] = txs;

  if (block.settlement_proof) {
    j["settlement_proof"] = {
        {"system", block.settlement_proof->system},
        {"data", util::HexStr(block.settlement_proof->data)},
        {"inputs", block.settlement_proof->inputs}};
  } else {
    j["settlement_proof"] = nullptr;
  }
  return j;
}

nlohmann::json ValidatorToJson(const staking::Validator &v) {
  nlohmann::json j;
  j["address"] = v.address;
  j["stake"] = v.stake;
  j["active"] = v.active;
  j["last_active_height"] = v.last_active_height;
  j["total_rewards"] = v.total_rewards;
  j["blocks_produced"] = v.blocks_produced;
  j["total_slashed"] = v.total_slashed;
  return j;
}

nlohmann::json BridgeTransactionToJson(const bridge::BridgeTransaction &tx) {
  nlohmann::json j;
  j["tx_id"] = tx.tx_id;
  j["direction"] = bridge::BridgeDirectionToString(tx.direction);
  j["sender"] = tx.sender;
  j["recipient"] = tx.recipient;
  j["amount"] = tx.amount;
  j["status"] = bridge::BridgeStatusToString(tx.status);
  if (tx.status == bridge::BridgeStatus::FAILED) {
    j["failure_reason"] = tx.failure_reason;
  }
  j["created_at"] = tx.created_at;
  j["l1_height"] = tx.l1_height;
  return j;
}

nlohmann::json RewardsToJson(const chain::MiningRewardAccumulator &rewards) {
  nlohmann::json j;
  j["anchor_rewards"] = rewards.anchor_rewards;
  j["native_gas_fees"] = rewards.native_gas_fees;
  j["validator_fee_share"] = rewards.validator_fee_share;
  j["total"] = rewards.total;
  return j;
}

std::vector<std::string> SplitPath(const std::string &path) {
  std::vector<std::string> segments;
  std::string segment;
  std::istringstream stream(path);
  while (std::getline(stream, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

} // namespace

RPCServer::RPCServer(validation::ChainstateManager &chainstate_manager,
                     mining::CPUMiner *miner, const chain::ChainParams &params)
    : chainstate_manager_(chainstate_manager), miner_(miner), params_(params) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::AddRoute(const std::string &method, const std::string &pattern,
                         RouteHandler handler) {
  routes_.push_back(Route{method, SplitPath(pattern), std::move(handler)});
}

void RPCServer::RegisterHandlers() {
  // Node
  AddRoute("GET", "/health",
           [this](const auto &r, const auto &p) { return HandleHealth(r, p); });
  AddRoute("GET", "/status", [this](const auto &r, const auto &p) {
    return HandleGetStatus(r, p);
  });

  // Chain
  AddRoute("GET", "/blocks", [this](const auto &r, const auto &p) {
    return HandleGetBlocks(r, p);
  });
  AddRoute("GET", "/blocks/{}", [this](const auto &r, const auto &p) {
    return HandleGetBlock(r, p);
  });
  AddRoute("GET", "/transactions", [this](const auto &r, const auto &p) {
    return HandleGetTransactions(r, p);
  });
  AddRoute("POST", "/transactions", [this](const auto &r, const auto &p) {
    return HandleSubmitTransaction(r, p);
  });

  // Validators
  AddRoute("GET", "/validators", [this](const auto &r, const auto &p) {
    return HandleGetValidators(r, p);
  });
  AddRoute("GET", "/validators/{}", [this](const auto &r, const auto &p) {
    return HandleGetValidator(r, p);
  });
  AddRoute("POST", "/validators/{}/stake",
           [this](const auto &r, const auto &p) { return HandleStake(r, p); });
  AddRoute("POST", "/validators/{}/unstake", [this](const auto &r,
                                                    const auto &p) {
    return HandleUnstake(r, p);
  });

  // Bridge
  AddRoute("GET", "/bridge/transactions", [this](const auto &r, const auto &p) {
    return HandleGetBridgeTransactions(r, p);
  });
  AddRoute("GET", "/bridge/transactions/{}",
           [this](const auto &r, const auto &p) {
             return HandleGetBridgeTransaction(r, p);
           });
  AddRoute("POST", "/bridge/deposit", [this](const auto &r, const auto &p) {
    return HandleDeposit(r, p);
  });
  AddRoute("POST", "/bridge/withdraw", [this](const auto &r, const auto &p) {
    return HandleWithdraw(r, p);
  });
  AddRoute("POST", "/bridge/transactions/{}/complete",
           [this](const auto &r, const auto &p) {
             return HandleCompleteBridgeTransaction(r, p);
           });
  AddRoute("POST", "/bridge/transactions/{}/fail",
           [this](const auto &r, const auto &p) {
             return HandleFailBridgeTransaction(r, p);
           });
  AddRoute("POST", "/fraud-proofs", [this](const auto &r, const auto &p) {
    return HandleSubmitFraudProof(r, p);
  });

  // Mining
  AddRoute("GET", "/mining/rewards", [this](const auto &r, const auto &p) {
    return HandleGetRewards(r, p);
  });
  AddRoute("GET", "/mining/stats", [this](const auto &r, const auto &p) {
    return HandleGetMiningStats(r, p);
  });
}

bool RPCServer::Start(const std::string &bind_address, uint16_t port) {
  if (IsRunning()) {
    return true;
  }

  http_ = std::make_unique<HttpServer>(
      [this](const HttpRequest &req) { return HandleRequest(req); });
  if (!http_->Start(bind_address, port)) {
    http_.reset();
    return false;
  }
  return true;
}

void RPCServer::Stop() {
  if (http_) {
    http_->Stop();
    http_.reset();
  }
}

HttpResponse RPCServer::HandleRequest(const std::string &method,
                                      const std::string &path,
                                      const std::string &body) {
  return HandleRequest(HttpRequest{method, path, body});
}

HttpResponse RPCServer::HandleRequest(const HttpRequest &request) {
  const std::vector<std::string> segments = SplitPath(request.path);

  bool path_matched = false;
  for (const auto &route : routes_) {
    if (route.segments.size() != segments.size()) {
      continue;
    }

    PathParams params;
    bool match = true;
    for (size_t i = 0; i < segments.size(); ++i) {
      if (route.segments[i] == "{}") {
        params.push_back(segments[i]);
      } else if (route.segments[i] != segments[i]) {
        match = false;
        break;
      }
    }
    if (!match) {
      continue;
    }

    path_matched = true;
    if (route.method != request.method) {
      continue;
    }

    try {
      return route.handler(request, params);
    } catch (const RequestError &e) {
      return ErrorResponse(e.status, e.kind, e.what());
    } catch (const network::TransientNetworkError &e) {
      LOG_RPC_WARN("{} {}: upstream failure: {}", request.method,
                   request.path, e.what());
      return ErrorResponse(503, "TransientNetworkError", e.what());
    } catch (const nlohmann::json::exception &e) {
      return ErrorResponse(400, "BadRequest", e.what());
    }
  }

  if (path_matched) {
    return ErrorResponse(405, "MethodNotAllowed",
                         request.method + " " + request.path);
  }
  return ErrorResponse(404, "NotFound", request.path);
}

// ============================================================================
// Node
// ============================================================================

HttpResponse RPCServer::HandleHealth(const HttpRequest &, const PathParams &) {
  nlohmann::json j = {{"status", "ok"},
                      {"height", chainstate_manager_.GetHeight()}};
  return JsonResponse(200, j);
}

HttpResponse RPCServer::HandleGetStatus(const HttpRequest &,
                                        const PathParams &) {
  const validation::NodeStatus status = chainstate_manager_.GetStatus();
  const validation::ChainstateOptions &options =
      chainstate_manager_.GetOptions();

  nlohmann::json j;
  j["chain"] = params_.GetChainTypeString();
  j["settlement_mode"] =
      settlement::SettlementModeToString(options.settlement_mode);
  j["height"] = status.height;
  j["tip_hash"] = util::HexStr(status.tip_hash);
  j["best_known_height"] = status.best_known_height;
  j["peer_count"] = status.peer_count;
  j["pending_transactions"] = status.pending_tx_count;
  j["anchor_height"] = status.anchor_height;
  j["l1_confirmed_height"] = status.l1_confirmed_height;
  j["difficulty"] = options.difficulty;
  j["total_staked"] = status.total_staked;
  j["active_validators"] = status.active_validators;
  j["mining"] = {
      {"native_blocks_mined", status.stats.native_blocks_mined},
      {"anchor_blocks_observed", status.stats.anchor_blocks_observed},
      {"total_rewards", status.rewards.total},
      {"is_mining", miner_ ? miner_->IsMining() : false}};
  return JsonResponse(200, j);
}

// ============================================================================
// Chain
// ============================================================================

HttpResponse RPCServer::HandleGetBlocks(const HttpRequest &,
                                        const PathParams &) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &block :
       chainstate_manager_.GetRecentBlocks(MAX_RECENT_BLOCKS)) {
    arr.push_back(BlockToJson(block));
  }
  return JsonResponse(200, arr);
}

HttpResponse RPCServer::HandleGetBlock(const HttpRequest &,
                                       const PathParams &params) {
  const uint64_t height = ParseHeightParam(params[0]);
  auto block = chainstate_manager_.GetBlock(height);
  if (!block) {
    return ErrorResponse(404, "NotFound",
                         "no block at height " + std::to_string(height));
  }
  return JsonResponse(200, BlockToJson(*block));
}

HttpResponse RPCServer::HandleGetTransactions(const HttpRequest &,
                                              const PathParams &) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &tx : chainstate_manager_.GetPendingTransactions()) {
    arr.push_back(TransactionToJson(tx));
  }
  return JsonResponse(200, arr);
}

HttpResponse RPCServer::HandleSubmitTransaction(const HttpRequest &req,
                                                const PathParams &) {
  const nlohmann::json body = ParseBody(req);

  Transaction tx;
  tx.from = RequireString(body, "from");
  tx.to = body.value("to", std::string());
  tx.value = OptionalUInt(body, "value", 0);
  tx.gas_price = OptionalUInt(body, "gas_price", 0);
  tx.gas_limit = OptionalUInt(body, "gas_limit", BASE_TX_GAS);
  tx.nonce = OptionalUInt(body, "nonce", 0);
  tx.payload = OptionalHex(body, "payload");
  tx.signature = OptionalHex(body, "signature");

  // Clients may omit the hash; a supplied one must match
  if (body.contains("hash")) {
    if (!body["hash"].is_string() ||
        !util::ParseHash256(body["hash"].get<std::string>(), tx.hash)) {
      return ErrorResponse(400, "BadRequest", "'hash' must be 32 bytes hex");
    }
  } else {
    tx.hash = tx.ComputeHash();
  }

  validation::ValidationState state;
  if (!chainstate_manager_.SubmitTransaction(tx, state)) {
    return ErrorResponse(400, state.GetRejectReason(),
                         state.GetDebugMessage());
  }

  nlohmann::json j = {{"hash", util::HexStr(tx.hash)},
                      {"status", TxStatusToString(tx.status)}};
  return JsonResponse(202, j);
}

// ============================================================================
// Validators
// ============================================================================

HttpResponse RPCServer::HandleGetValidators(const HttpRequest &,
                                            const PathParams &) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &v : chainstate_manager_.GetValidators()) {
    arr.push_back(ValidatorToJson(v));
  }
  return JsonResponse(200, arr);
}

HttpResponse RPCServer::HandleGetValidator(const HttpRequest &,
                                           const PathParams &params) {
  auto validator = chainstate_manager_.GetValidator(params[0]);
  if (!validator) {
    return ErrorResponse(404, "NotFound", "unknown validator " + params[0]);
  }
  return JsonResponse(200, ValidatorToJson(*validator));
}

HttpResponse RPCServer::HandleStake(const HttpRequest &req,
                                    const PathParams &params) {
  const uint64_t amount = RequireUInt(ParseBody(req), "amount");

  staking::StakeResult result = chainstate_manager_.Stake(params[0], amount);
  if (result != staking::StakeResult::OK) {
    return ErrorResponse(StakeResultStatus(result),
                         staking::StakeResultToString(result));
  }
  return JsonResponse(200, ValidatorToJson(*chainstate_manager_.GetValidator(params[0])));
}

HttpResponse RPCServer::HandleUnstake(const HttpRequest &req,
                                      const PathParams &params) {
  const uint64_t amount = RequireUInt(ParseBody(req), "amount");

  staking::StakeResult result = chainstate_manager_.Unstake(params[0], amount);
  if (result != staking::StakeResult::OK) {
    return ErrorResponse(StakeResultStatus(result),
                         staking::StakeResultToString(result));
  }
  return JsonResponse(200, ValidatorToJson(*chainstate_manager_.GetValidator(params[0])));
}

// ============================================================================
// Bridge
// ============================================================================

HttpResponse RPCServer::HandleGetBridgeTransactions(const HttpRequest &,
                                                    const PathParams &) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &tx : chainstate_manager_.GetOpenBridgeTransactions()) {
    arr.push_back(BridgeTransactionToJson(tx));
  }
  return JsonResponse(200, arr);
}

HttpResponse RPCServer::HandleGetBridgeTransaction(const HttpRequest &,
                                                   const PathParams &params) {
  auto tx = chainstate_manager_.GetBridgeTransaction(params[0]);
  if (!tx) {
    return ErrorResponse(404, "NotFound", "unknown bridge transaction");
  }
  return JsonResponse(200, BridgeTransactionToJson(*tx));
}

HttpResponse RPCServer::HandleDeposit(const HttpRequest &req,
                                      const PathParams &) {
  const nlohmann::json body = ParseBody(req);
  const std::string tx_id = chainstate_manager_.RecordDeposit(
      RequireString(body, "sender"), RequireString(body, "recipient"),
      RequireUInt(body, "amount"));
  return JsonResponse(201, BridgeTransactionToJson(
                               *chainstate_manager_.GetBridgeTransaction(tx_id)));
}

HttpResponse RPCServer::HandleWithdraw(const HttpRequest &req,
                                       const PathParams &) {
  const nlohmann::json body = ParseBody(req);
  const std::string tx_id = chainstate_manager_.RecordWithdrawal(
      RequireString(body, "sender"), RequireString(body, "recipient"),
      RequireUInt(body, "amount"));
  return JsonResponse(201, BridgeTransactionToJson(
                               *chainstate_manager_.GetBridgeTransaction(tx_id)));
}

HttpResponse RPCServer::HandleCompleteBridgeTransaction(
    const HttpRequest &, const PathParams &params) {
  bridge::BridgeResult result =
      chainstate_manager_.CompleteBridgeTransaction(params[0]);
  if (result != bridge::BridgeResult::OK) {
    return ErrorResponse(BridgeResultStatus(result),
                         bridge::BridgeResultToString(result));
  }
  return JsonResponse(200, BridgeTransactionToJson(
                               *chainstate_manager_.GetBridgeTransaction(params[0])));
}

HttpResponse RPCServer::HandleFailBridgeTransaction(const HttpRequest &req,
                                                    const PathParams &params) {
  const std::string reason = RequireString(ParseBody(req), "reason");
  bridge::BridgeResult result =
      chainstate_manager_.FailBridgeTransaction(params[0], reason);
  if (result != bridge::BridgeResult::OK) {
    return ErrorResponse(BridgeResultStatus(result),
                         bridge::BridgeResultToString(result));
  }
  return JsonResponse(200, BridgeTransactionToJson(
                               *chainstate_manager_.GetBridgeTransaction(params[0])));
}

HttpResponse RPCServer::HandleSubmitFraudProof(const HttpRequest &req,
                                               const PathParams &) {
  const nlohmann::json body = ParseBody(req);
  const uint64_t height = RequireUInt(body, "block_height");
  const std::string challenger = RequireString(body, "challenger");
  const std::vector<uint8_t> proof = OptionalHex(body, "proof_data");

  bridge::BridgeResult result =
      chainstate_manager_.SubmitFraudProof(height, challenger, proof);
  if (result != bridge::BridgeResult::OK) {
    return ErrorResponse(BridgeResultStatus(result),
                         bridge::BridgeResultToString(result));
  }

  LOG_RPC_INFO("Fraud proof against block {} from {}", height, challenger);
  nlohmann::json j = {
      {"block_height", height},
      {"fraud_proofs_submitted",
       chainstate_manager_.GetStatus().fraud_proofs_submitted}};
  return JsonResponse(201, j);
}

// ============================================================================
// Mining
// ============================================================================

HttpResponse RPCServer::HandleGetRewards(const HttpRequest &,
                                         const PathParams &) {
  const validation::NodeStatus status = chainstate_manager_.GetStatus();
  nlohmann::json j = RewardsToJson(status.rewards);
  j["undistributed_fee_share"] = status.undistributed_fee_share;
  return JsonResponse(200, j);
}

HttpResponse RPCServer::HandleGetMiningStats(const HttpRequest &,
                                             const PathParams &) {
  const validation::NodeStatus status = chainstate_manager_.GetStatus();
  const chain::MiningStats &stats = status.stats;

  const int64_t now = util::GetTime();
  const int64_t uptime =
      now > stats.started_at ? now - stats.started_at : 0;
  const double merge_mining_ratio =
      stats.anchor_blocks_observed == 0
          ? 0.0
          : static_cast<double>(stats.native_blocks_mined) /
                static_cast<double>(stats.anchor_blocks_observed);

  nlohmann::json j;
  j["native_blocks_mined"] = stats.native_blocks_mined;
  j["anchor_blocks_observed"] = stats.anchor_blocks_observed;
  j["total_rewards"] = status.rewards.total;
  j["uptime_seconds"] = uptime;
  j["hash_count"] = miner_ ? miner_->GetTotalHashes() : 0;
  j["hash_rate"] = miner_ ? miner_->GetHashrate() : 0.0;
  j["blocks_found"] = miner_ ? miner_->GetBlocksFound() : 0;
  j["fraud_proofs_submitted"] = status.fraud_proofs_submitted;
  j["l1_gas_price"] = stats.l1_gas_price;
  j["l1_head_height"] = stats.l1_head_height;
  j["merge_mining_ratio"] = merge_mining_ratio;
  j["mining_address"] = miner_ ? miner_->GetMiningAddress() : std::string();
  return JsonResponse(200, j);
}

} // namespace rpc
} // namespace codl3
