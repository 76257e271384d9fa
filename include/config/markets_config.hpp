#pragma once
#include <string>
#include <optional>
#include <vector>
#include "discovery/market_discovery.hpp"

struct MarketsConfig {
  std::string rpc_url;
  std::optional<std::string> auth_header;
  int rpc_timeout_ms = 30000;
  std::string query_contract;
  std::vector<std::string> factories;
  std::string pair_db_path = "pairs.sqlite";
  unsigned long long block_poll_ms = 1000;
  DiscoveryConfig discovery;
};

// Builds the configuration from ConfigManager keys, falling back to mainnet defaults.
// Throws std::runtime_error on missing RPC_URL or malformed addresses/amounts.
MarketsConfig LoadMarketsConfig();
