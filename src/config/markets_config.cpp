#include "config/markets_config.hpp"
#include "common/config_manager.hpp"
#include "constants/mainnet.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

static std::string RequireAddress(const std::string& key, const std::string& value) {
  if (!IsAddress(value)) throw std::runtime_error("Config " + key + " is not an address: " + value);
  return NormalizeAddress(value);
}

MarketsConfig LoadMarketsConfig() {
  MarketsConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER"); a && !a->empty()) cfg.auth_header = *a;
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 30000);
  cfg.query_contract = RequireAddress("UNISWAP_QUERY_ADDRESS",
      ConfigManager::Get("UNISWAP_QUERY_ADDRESS").value_or(MainnetConstants::UNISWAP_QUERY));
  for (const auto& f : ConfigManager::GetListOr("FACTORY_ADDRESSES", MainnetConstants::DefaultFactories())) {
    cfg.factories.push_back(RequireAddress("FACTORY_ADDRESSES", f));
  }
  cfg.pair_db_path = ConfigManager::Get("PAIR_DB_PATH").value_or("pairs.sqlite");
  cfg.block_poll_ms = ConfigManager::GetU64Or("BLOCK_POLL_MS", 1000);

  DiscoveryConfig& d = cfg.discovery;
  d.pivot_token = RequireAddress("PIVOT_TOKEN", ConfigManager::Get("PIVOT_TOKEN").value_or(MainnetConstants::WETH));
  d.batch_size = ConfigManager::GetU64Or("DISCOVERY_BATCH_SIZE", 1000);
  if (d.batch_size == 0) throw std::runtime_error("Config DISCOVERY_BATCH_SIZE must be positive");
  d.batch_count_limit = ConfigManager::GetU64Or("DISCOVERY_BATCH_COUNT_LIMIT", 100);
  if (auto floor = ConfigManager::Get("LIQUIDITY_FLOOR_WEI")) {
    try {
      d.liquidity_floor = ParseAmount(*floor);
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(std::string("Config LIQUIDITY_FLOOR_WEI: ") + e.what());
    }
  }
  for (const auto& t : ConfigManager::GetListOr("TOKEN_DENYLIST", MainnetConstants::DefaultTokenDenylist())) {
    d.denylist.insert(RequireAddress("TOKEN_DENYLIST", t));
  }
  unsigned hw = std::thread::hardware_concurrency();
  int concurrency = ConfigManager::GetIntOr("MAX_CONCURRENCY", hw ? static_cast<int>(std::min(hw, 4u)) : 4);
  d.max_concurrency = concurrency > 0 ? static_cast<size_t>(concurrency) : 1;
  d.protocol = ConfigManager::Get("MARKET_PROTOCOL").value_or("");
  return cfg;
}
