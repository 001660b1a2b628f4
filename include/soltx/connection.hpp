#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "soltx/transaction.hpp"
#include "soltx/types.hpp"

namespace soltx {
namespace rpc {
using json = nlohmann::json;

const std::string MAINNET_BETA = "https://api.mainnet-beta.solana.com";
const std::string DEVNET = "https://api.devnet.solana.com";
const std::string TESTNET = "https://api.testnet.solana.com";
const std::string BASE64 = "base64";

/**
 * A recent blockhash and the last block height at which a transaction
 * referencing it is accepted
 */
struct Blockhash {
  Hash hash;
  uint64_t lastValidBlockHeight;
};

void from_json(const json &j, Blockhash &blockhash);

/**
 * Configuration object for sendTransaction
 */
struct SendTransactionConfig {
  /**
   * if true, skip the preflight transaction checks (default: false)
   */
  std::optional<bool> skipPreflight = std::nullopt;
  /**
   * Commitment level to use for preflight (default: "finalized").
   */
  std::optional<std::string> preflightCommitment = std::nullopt;
  /**
   * Encoding used for the transaction data (default: "base64")
   */
  std::string encoding = BASE64;
  /**
   * Maximum number of times for the RPC node to retry sending the transaction
   * to the leader
   */
  std::optional<uint8_t> maxRetries = std::nullopt;
  /**
   * set the minimum slot at which to perform preflight transaction checks.
   */
  std::optional<uint64_t> minContextSlot = std::nullopt;
};

void to_json(json &j, const SendTransactionConfig &config);

/**
 * Configuration object for simulateTransaction
 */
struct SimulateTransactionConfig {
  /**
   * if true the transaction signatures will be verified (default: false,
   * conflicts with replaceRecentBlockhash)
   */
  std::optional<bool> sigVerify = std::nullopt;
  /**
   * Commitment level to simulate the transaction at (default: "finalized").
   */
  std::optional<std::string> commitment = std::nullopt;
  /**
   * if true the transaction recent blockhash will be replaced with the most
   * recent blockhash. (default: false, conflicts with sigVerify)
   */
  std::optional<bool> replaceRecentBlockhash = std::nullopt;
};

void to_json(json &j, const SimulateTransactionConfig &config);

struct SimulatedTransactionResponse {
  /** the error as json text, if the transaction failed */
  std::optional<std::string> err = std::nullopt;
  std::optional<std::vector<std::string>> logs = std::nullopt;
  std::optional<uint64_t> unitsConsumed = std::nullopt;
};

void from_json(const json &j, SimulatedTransactionResponse &res);

/**
 * JSON-RPC 2.0 request body
 */
json jsonRequest(const std::string &method, const json &params = nullptr);

/**
 * Source of the recent blockhash a transaction is anchored to
 */
class BlockhashProvider {
 public:
  virtual ~BlockhashProvider() = default;

  virtual Blockhash getLatestBlockhash() const = 0;
};

/**
 * Accepts a signed, serialized and base64 encoded transaction and returns
 * its base58 signature
 */
class TransactionSender {
 public:
  virtual ~TransactionSender() = default;

  virtual std::string sendEncodedTransaction(
      const std::string &transaction,
      const SendTransactionConfig &config) const = 0;
};

///
/// RPC HTTP Endpoints
class Connection : public BlockhashProvider, public TransactionSender {
 public:
  /**
   * Initialize the rpc url and commitment level to use.
   * Initialize sodium
   */
  explicit Connection(const std::string &rpcUrl = MAINNET_BETA,
                      const std::string &commitment = "finalized");

  /**
   * send rpc request
   * @return result from response
   */
  json sendJsonRpcRequest(const json &body) const;

  /**
   * Fetch the latest blockhash at the connection's commitment
   */
  Blockhash getLatestBlockhash() const override;

  Blockhash getLatestBlockhash(const std::string &commitment) const;

  /**
   * Returns the current block height of the node
   */
  uint64_t getBlockHeight() const;

  /**
   * Send a fully signed transaction
   * @return transaction signature
   */
  std::string sendTransaction(
      const BuiltTransaction &tx,
      const SendTransactionConfig &config = SendTransactionConfig()) const;

  /**
   * Send a transaction that has already been signed and serialized into the
   * wire format
   */
  std::string sendRawTransaction(
      const std::vector<uint8_t> &tx,
      const SendTransactionConfig &config = SendTransactionConfig()) const;

  /**
   * Send a transaction that has already been signed, serialized into the
   * wire format, and encoded as a base64 string
   */
  std::string sendEncodedTransaction(
      const std::string &transaction,
      const SendTransactionConfig &config) const override;

  /**
   * Simulate sending a transaction
   */
  SimulatedTransactionResponse simulateTransaction(
      const BuiltTransaction &tx, const SimulateTransactionConfig &config =
                                      SimulateTransactionConfig()) const;

  const std::string &rpcUrl() const { return rpcUrl_; }

  const std::string &commitment() const { return commitment_; }

 private:
  const std::string rpcUrl_;
  const std::string commitment_;
};

}  // namespace rpc
}  // namespace soltx
