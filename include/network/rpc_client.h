#pragma once

#include "common/types.h"
#include "network/http_client.h"
#include "round/account_data.h"
#include "round/snapshot_builder.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace oreminer {
namespace network {

using namespace oreminer::common;

/**
 * Signature returned by sendTransaction
 */
struct SendReceipt {
  std::string signature;
};

/**
 * Solana JSON-RPC client.
 *
 * Serves as the account source for the snapshot builder and as the transport
 * for signed transfers. Every call is a single blocking POST; timeouts come
 * from the underlying HttpClient and surface as ordinary errors.
 */
class SolanaRpcClient : public round::IAccountSource {
public:
  explicit SolanaRpcClient(std::string rpc_url, int timeout_seconds = 30);

  Result<std::vector<round::AccountDataField>>
  fetch_program_accounts(const std::string &program_id) override;

  /// Latest blockhash, decoded from base58 (32 bytes)
  Result<Bytes> get_latest_blockhash();

  /// Submit a serialized, signed transaction (preflight enabled)
  Result<SendReceipt> send_transaction(const Bytes &transaction);

private:
  std::string rpc_url_;
  HttpClient http_;

  HttpResponse call(const std::string &method, const std::string &params);
};

/**
 * Solana RPC response parsing utilities
 */
namespace rpc_utils {

/// Transport error text for a failed POST, with the JSON-RPC error if present
std::string describe_http_failure(const HttpResponse &response);

/**
 * Map one `account.data` JSON value onto the data field shapes:
 * `["<b64>", "base64"]` is a Base64Pair, `{"data": [...]}` a KeyedWrapper,
 * everything else Unrecognized.
 */
round::AccountDataField account_data_from_json(const nlohmann::json &data);

Result<std::vector<round::AccountDataField>>
parse_program_accounts_response(const std::string &body);

Result<Bytes> parse_latest_blockhash_response(const std::string &body);

Result<SendReceipt> parse_send_transaction_response(const std::string &body);

/// Error message of a JSON-RPC error object, empty when there is none
std::string extract_error_message(const nlohmann::json &response);

} // namespace rpc_utils

} // namespace network
} // namespace oreminer
