#include "network/http_client.h"
#include <curl/curl.h>
#include <mutex>
#include <sstream>

namespace oreminer {
namespace network {

constexpr long DEFAULT_REQUEST_TIMEOUT = 30L;
constexpr long CONNECT_TIMEOUT = 10L;

// Thread-safe CURL initialization
static std::once_flag curl_init_flag;
static void init_curl_once() { curl_global_init(CURL_GLOBAL_DEFAULT); }

// Callback function for CURL to write response data
static size_t curl_write_callback(void *contents, size_t size, size_t nmemb,
                                  void *userp) {
  std::string *buffer = static_cast<std::string *>(userp);
  size_t total_size = size * nmemb;
  buffer->append(static_cast<char *>(contents), total_size);
  return total_size;
}

HttpClient::HttpClient() : timeout_seconds_(30), user_agent_("ore-miner/1.0") {
  std::call_once(curl_init_flag, init_curl_once);
}

// curl_global_cleanup() is left to process exit; other clients may still be
// alive.
HttpClient::~HttpClient() = default;

HttpResponse
HttpClient::post(const std::string &url, const std::string &data,
                 const std::map<std::string, std::string> &headers) {
  return execute_request(url, data, headers);
}

HttpResponse HttpClient::solana_rpc_call(const std::string &rpc_url,
                                         const std::string &method,
                                         const std::string &params) {
  std::ostringstream json_body;
  json_body << "{" << "\"jsonrpc\":\"2.0\"," << "\"id\":1," << "\"method\":\""
            << method << "\"," << "\"params\":" << params << "}";

  std::map<std::string, std::string> headers = {
      {"Content-Type", "application/json"}, {"Accept", "application/json"}};

  return post(rpc_url, json_body.str(), headers);
}

HttpResponse
HttpClient::execute_request(const std::string &url, const std::string &data,
                            const std::map<std::string, std::string> &headers) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (!curl) {
    response.error_message = "Failed to initialize CURL";
    return response;
  }

  std::string response_body;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   timeout_seconds_ > 0 ? static_cast<long>(timeout_seconds_)
                                        : DEFAULT_REQUEST_TIMEOUT);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(data.length()));

  struct curl_slist *header_list = nullptr;
  for (const auto &header : headers) {
    std::string header_line = header.first + ": " + header.second;
    header_list = curl_slist_append(header_list, header_line.c_str());
  }
  if (header_list) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  CURLcode res = curl_easy_perform(curl);

  if (res != CURLE_OK) {
    response.error_message =
        std::string("CURL error: ") + curl_easy_strerror(res);
    if (header_list)
      curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  response.status_code = static_cast<int>(http_code);
  response.body = response_body;
  response.success = (http_code >= 200 && http_code < 300);

  if (!response.success) {
    response.error_message = "HTTP error: " + std::to_string(http_code);
  }

  if (header_list)
    curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  return response;
}

} // namespace network
} // namespace oreminer
