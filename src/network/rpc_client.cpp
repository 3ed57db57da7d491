#include "network/rpc_client.h"
#include "common/encoding.h"
#include "common/logging.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace oreminer {
namespace network {

SolanaRpcClient::SolanaRpcClient(std::string rpc_url, int timeout_seconds)
    : rpc_url_(std::move(rpc_url)) {
  http_.set_timeout(timeout_seconds);
}

HttpResponse SolanaRpcClient::call(const std::string &method,
                                   const std::string &params) {
  LOG_DEBUG("rpc", "-> ", method, " ", rpc_url_);
  auto response = http_.solana_rpc_call(rpc_url_, method, params);
  LOG_DEBUG("rpc", "<- ", method, " status=", response.status_code,
            " bytes=", response.body.size());
  return response;
}

Result<std::vector<round::AccountDataField>>
SolanaRpcClient::fetch_program_accounts(const std::string &program_id) {
  json params = json::array({program_id, {{"encoding", "base64"}}});
  auto response = call("getProgramAccounts", params.dump());
  if (!response.success) {
    return Result<std::vector<round::AccountDataField>>(
        rpc_utils::describe_http_failure(response));
  }
  return rpc_utils::parse_program_accounts_response(response.body);
}

Result<Bytes> SolanaRpcClient::get_latest_blockhash() {
  json params = json::array({{{"commitment", "finalized"}}});
  auto response = call("getLatestBlockhash", params.dump());
  if (!response.success) {
    return Result<Bytes>(rpc_utils::describe_http_failure(response));
  }
  return rpc_utils::parse_latest_blockhash_response(response.body);
}

Result<SendReceipt> SolanaRpcClient::send_transaction(const Bytes &transaction) {
  json params = json::array(
      {base64_encode(transaction),
       {{"encoding", "base64"}, {"skipPreflight", false}}});
  auto response = call("sendTransaction", params.dump());
  if (!response.success) {
    return Result<SendReceipt>(rpc_utils::describe_http_failure(response));
  }
  return rpc_utils::parse_send_transaction_response(response.body);
}

namespace rpc_utils {

namespace {

// Parses the body and unwraps `result`, turning RPC errors into Result errors
Result<json> parse_result(const std::string &body) {
  json response;
  try {
    response = json::parse(body);
  } catch (const json::exception &e) {
    return Result<json>("Malformed RPC response: " + std::string(e.what()));
  }

  std::string rpc_error = extract_error_message(response);
  if (!rpc_error.empty()) {
    return Result<json>("RPC error: " + rpc_error);
  }

  if (!response.is_object() || !response.contains("result")) {
    return Result<json>("RPC response has no result");
  }
  return Result<json>(response["result"]);
}

} // namespace

std::string describe_http_failure(const HttpResponse &response) {
  std::string message = "RPC call failed: " + response.error_message;
  if (response.body.empty())
    return message;

  try {
    std::string rpc_error = extract_error_message(json::parse(response.body));
    if (!rpc_error.empty())
      message += " (" + rpc_error + ")";
  } catch (const json::exception &) {
    // Body of an HTTP error page, not JSON
  }
  return message;
}

round::AccountDataField account_data_from_json(const json &data) {
  if (data.is_array()) {
    if (!data.empty() && data[0].is_string()) {
      round::Base64Pair pair;
      pair.encoded = data[0].get<std::string>();
      if (data.size() > 1 && data[1].is_string()) {
        pair.encoding = data[1].get<std::string>();
      }
      return pair;
    }
    return round::Unrecognized{"array without a base64 string"};
  }

  if (data.is_object() && data.contains("data")) {
    round::KeyedWrapper wrapper;
    const auto &inner = data["data"];
    if (inner.is_array() && !inner.empty() && inner[0].is_string()) {
      round::Base64Pair pair;
      pair.encoded = inner[0].get<std::string>();
      if (inner.size() > 1 && inner[1].is_string()) {
        pair.encoding = inner[1].get<std::string>();
      }
      wrapper.data = pair;
    }
    return wrapper;
  }

  return round::Unrecognized{data.type_name()};
}

Result<std::vector<round::AccountDataField>>
parse_program_accounts_response(const std::string &body) {
  using FieldsResult = Result<std::vector<round::AccountDataField>>;

  auto parsed = parse_result(body);
  if (parsed.is_err()) {
    return FieldsResult(parsed.error());
  }

  json result = std::move(parsed).value();
  if (result.is_null()) {
    return FieldsResult("RPC returned no data");
  }
  // withContext responses nest the list under "value"
  if (result.is_object() && result.contains("value")) {
    result = result["value"];
  }
  if (!result.is_array()) {
    return FieldsResult("getProgramAccounts result is not a list");
  }

  std::vector<round::AccountDataField> fields;
  fields.reserve(result.size());
  for (const auto &entry : result) {
    if (entry.is_object() && entry.contains("account") &&
        entry["account"].is_object() && entry["account"].contains("data")) {
      fields.push_back(account_data_from_json(entry["account"]["data"]));
    } else {
      fields.push_back(round::Unrecognized{"account entry without data"});
    }
  }
  return FieldsResult(std::move(fields));
}

Result<Bytes> parse_latest_blockhash_response(const std::string &body) {
  auto parsed = parse_result(body);
  if (parsed.is_err()) {
    return Result<Bytes>(parsed.error());
  }

  const json &result = parsed.value();
  if (!result.is_object() || !result.contains("value") ||
      !result["value"].is_object() || !result["value"].contains("blockhash") ||
      !result["value"]["blockhash"].is_string()) {
    return Result<Bytes>("getLatestBlockhash response has no blockhash");
  }

  auto decoded =
      base58_decode(result["value"]["blockhash"].get<std::string>());
  if (decoded.is_err()) {
    return Result<Bytes>("Invalid blockhash: " + decoded.error());
  }
  if (decoded.value().size() != 32) {
    return Result<Bytes>("Blockhash is not 32 bytes");
  }
  return decoded;
}

Result<SendReceipt> parse_send_transaction_response(const std::string &body) {
  auto parsed = parse_result(body);
  if (parsed.is_err()) {
    return Result<SendReceipt>(parsed.error());
  }

  const json &result = parsed.value();
  if (!result.is_string()) {
    return Result<SendReceipt>("sendTransaction result is not a signature");
  }
  return Result<SendReceipt>(SendReceipt{result.get<std::string>()});
}

std::string extract_error_message(const json &response) {
  if (!response.is_object() || !response.contains("error") ||
      response["error"].is_null()) {
    return "";
  }

  const auto &error = response["error"];
  if (error.is_object() && error.contains("message") &&
      error["message"].is_string()) {
    std::string message = error["message"].get<std::string>();
    if (error.contains("code") && error["code"].is_number_integer()) {
      message += " (code " + std::to_string(error["code"].get<int64_t>()) + ")";
    }
    return message;
  }
  return error.dump();
}

} // namespace rpc_utils

} // namespace network
} // namespace oreminer
