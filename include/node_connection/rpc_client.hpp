#pragma once
#include <atomic>
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int default_timeout_ms = 30000);

  // Sends a JSON-RPC request and returns the unwrapped "result" (raw JSON unless it is a string).
  std::string Call(const std::string& method, const nlohmann::json& params, int timeout_ms = -1);

  // eth_call against `block` (default "latest"); returns the 0x hex result.
  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt, int timeout_ms = -1);
  unsigned long long EthBlockNumber(int timeout_ms = -1);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int default_timeout_ms_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::atomic<unsigned long long> next_id_{1};
};
