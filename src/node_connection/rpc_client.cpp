#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "utils/json_rpc.hpp"
#include "utils/hex.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets a custom header; anything else is sent as Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int default_timeout_ms)
  : http_(http), endpoint_(endpoint_url), default_timeout_ms_(default_timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Call(const std::string& method, const json& params, int timeout_ms) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, next_id_.fetch_add(1));
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms < 0 ? default_timeout_ms_ : timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    LOG_ERROR(method + " failed with HTTP status " + std::to_string(resp.status));
    throw std::runtime_error(method + ": HTTP status " + std::to_string(resp.status));
  }
  return JsonRpcUtil::ExtractResult(resp.body);
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block, int timeout_ms) {
  json params = json::array({ json{{"to", to}, {"data", data}}, block.value_or("latest") });
  return Call("eth_call", params, timeout_ms);
}

unsigned long long RpcClient::EthBlockNumber(int timeout_ms) {
  auto hex = Strip0x(Call("eth_blockNumber", json::array(), timeout_ms));
  if (hex.empty() || !IsHexString(hex)) throw std::runtime_error("eth_blockNumber: unexpected result " + hex);
  return std::stoull(hex, nullptr, 16);
}
