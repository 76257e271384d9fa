#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // Serializes a JSON-RPC 2.0 request.
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, unsigned long long id = 1);
  // Returns the "result" field as string (raw JSON for non-strings), throws on error
  std::string ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
