#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <vector>

// Key/value configuration from a .env file. Process environment variables win over file values.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  // Test and embedding hook: replaces a single key in the cache.
  static void Set(const std::string& key, const std::string& value);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetU64Or(const std::string& key, unsigned long long default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma separated list, entries trimmed, empty entries dropped.
  static std::vector<std::string> GetListOr(const std::string& key, const std::vector<std::string>& default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
