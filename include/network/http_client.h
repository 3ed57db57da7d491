#pragma once

#include "common/types.h"
#include <map>
#include <string>

namespace oreminer {
namespace network {

/**
 * HTTP Response structure
 */
struct HttpResponse {
  int status_code = 0;
  std::string body;
  bool success = false;
  std::string error_message;
};

/**
 * Minimal libcurl client for JSON-RPC calls
 */
class HttpClient {
public:
  HttpClient();
  ~HttpClient();

  HttpResponse post(const std::string &url, const std::string &data,
                    const std::map<std::string, std::string> &headers = {});

  /// POST a JSON-RPC 2.0 request; `params` must be a JSON array literal
  HttpResponse solana_rpc_call(const std::string &rpc_url,
                               const std::string &method,
                               const std::string &params = "[]");

  void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
  int timeout_seconds_;
  std::string user_agent_;

  HttpResponse execute_request(const std::string &url, const std::string &data,
                               const std::map<std::string, std::string> &headers);
};

} // namespace network
} // namespace oreminer
