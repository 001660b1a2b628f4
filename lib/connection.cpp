#include "soltx/connection.hpp"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "soltx/error.hpp"

namespace soltx {
namespace rpc {

json jsonRequest(const std::string &method, const json &params) {
  json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}};
  if (params != nullptr) req["params"] = params;
  return req;
}

///
/// Blockhash
void from_json(const json &j, Blockhash &blockhash) {
  blockhash.hash = Hash::fromBase58(j.at("blockhash").get<std::string>());
  blockhash.lastValidBlockHeight =
      j.at("lastValidBlockHeight").get<uint64_t>();
}

///
/// SendTransactionConfig
void to_json(json &j, const SendTransactionConfig &config) {
  j["encoding"] = config.encoding;

  if (config.skipPreflight.has_value()) {
    j["skipPreflight"] = config.skipPreflight.value();
  }
  if (config.preflightCommitment.has_value()) {
    j["preflightCommitment"] = config.preflightCommitment.value();
  }
  if (config.maxRetries.has_value()) {
    j["maxRetries"] = config.maxRetries.value();
  }
  if (config.minContextSlot.has_value()) {
    j["minContextSlot"] = config.minContextSlot.value();
  }
}

///
/// SimulateTransactionConfig
void to_json(json &j, const SimulateTransactionConfig &config) {
  j["encoding"] = BASE64;

  if (config.sigVerify.has_value()) {
    j["sigVerify"] = config.sigVerify.value();
  }
  if (config.commitment.has_value()) {
    j["commitment"] = config.commitment.value();
  }
  if (config.replaceRecentBlockhash.has_value()) {
    j["replaceRecentBlockhash"] = config.replaceRecentBlockhash.value();
  }
}

///
/// SimulatedTransactionResponse
void from_json(const json &j, SimulatedTransactionResponse &res) {
  if (j.contains("err") && !j["err"].is_null()) {
    res.err = j["err"].dump();
  }
  if (j.contains("logs") && !j["logs"].is_null()) {
    res.logs = j["logs"].get<std::vector<std::string>>();
  }
  if (j.contains("unitsConsumed") && !j["unitsConsumed"].is_null()) {
    res.unitsConsumed = j["unitsConsumed"].get<uint64_t>();
  }
}

///
/// Connection
Connection::Connection(const std::string &rpcUrl,
                       const std::string &commitment)
    : rpcUrl_(rpcUrl), commitment_(commitment) {
  initSodium();
}

json Connection::sendJsonRpcRequest(const json &body) const {
  spdlog::debug("rpc request to {}: {}", rpcUrl_, body["method"].dump());
  cpr::Response res =
      cpr::Post(cpr::Url{rpcUrl_}, cpr::Body{body.dump()},
                cpr::Header{{"Content-Type", "application/json"}});

  if (res.status_code != 200)
    throw std::runtime_error("unexpected status_code " +
                             std::to_string(res.status_code));

  const auto resJson = json::parse(res.text);

  if (resJson.contains("error")) {
    throw std::runtime_error(resJson["error"].dump());
  }

  return resJson["result"];
}

Blockhash Connection::getLatestBlockhash() const {
  return getLatestBlockhash(commitment_);
}

Blockhash Connection::getLatestBlockhash(const std::string &commitment) const {
  const json params = {{{"commitment", commitment}}};
  const json reqJson = jsonRequest("getLatestBlockhash", params);
  const json res = sendJsonRpcRequest(reqJson);
  const Blockhash blockhash = res.at("value");
  spdlog::debug("latest blockhash {} valid until height {}",
                blockhash.hash.toBase58(), blockhash.lastValidBlockHeight);
  return blockhash;
}

uint64_t Connection::getBlockHeight() const {
  const json params = {{{"commitment", commitment_}}};
  const json reqJson = jsonRequest("getBlockHeight", params);
  return sendJsonRpcRequest(reqJson);
}

std::string Connection::sendTransaction(
    const BuiltTransaction &tx, const SendTransactionConfig &config) const {
  if (!tx.isSigned())
    throw TransactionError(TransactionErrc::NotEnoughSigners,
                           "refusing to send a transaction that is not fully "
                           "signed");
  const auto signature = sendRawTransaction(tx.serialize(), config);
  spdlog::info("sent transaction {}", signature);
  return signature;
}

std::string Connection::sendRawTransaction(
    const std::vector<uint8_t> &tx, const SendTransactionConfig &config) const {
  return sendEncodedTransaction(b64encode(tx), config);
}

std::string Connection::sendEncodedTransaction(
    const std::string &transaction, const SendTransactionConfig &config) const {
  const json params = {transaction, config};
  const json reqJson = jsonRequest("sendTransaction", params);
  return sendJsonRpcRequest(reqJson);
}

SimulatedTransactionResponse Connection::simulateTransaction(
    const BuiltTransaction &tx,
    const SimulateTransactionConfig &config) const {
  const json params = {b64encode(tx.serialize()), config};
  const auto reqJson = jsonRequest("simulateTransaction", params);
  return sendJsonRpcRequest(reqJson)["value"];
}

}  // namespace rpc
}  // namespace soltx
