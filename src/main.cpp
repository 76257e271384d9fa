#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/markets_config.hpp"
#include "net/http_client.hpp"
#include "net/block_watcher.hpp"
#include "node_connection/rpc_client.hpp"
#include "lookup/uniswap_query.hpp"
#include "storage/sqlite_pair_store.hpp"
#include "encoding/swap_encoder.hpp"
#include "discovery/market_discovery.hpp"
#include "sync/reserve_sync.hpp"
#include "telemetry/structured_logger.hpp"
#include <csignal>
#include <chrono>
#include <iostream>
#include <thread>

namespace {
  volatile std::sig_atomic_t g_stop_requested = 0;

  void HandleSignal(int) { g_stop_requested = 1; }
}

int main(int argc, char** argv) {
  const std::string env_path = argc > 1 ? argv[1] : ".env";
  try {
    ConfigManager::Initialize(env_path);
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("pairgraph.log"),
                       ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info")),
                       ConfigManager::GetBoolOr("LOG_STDERR", true));
    StructuredLogger::Instance().Initialize(ConfigManager::Get("METRICS_FILE").value_or("metrics.jsonl"));

    MarketsConfig cfg = LoadMarketsConfig();
    LOG_INFO("=== pairgraph starting ===");
    LOG_INFO("RPC endpoint: " + cfg.rpc_url);
    LOG_INFO("Pivot token: " + cfg.discovery.pivot_token);
    LOG_INFO("Factories: " + std::to_string(cfg.factories.size()) + ", batch size " +
             std::to_string(cfg.discovery.batch_size) + ", batch limit " + std::to_string(cfg.discovery.batch_count_limit));
    LOG_INFO("Liquidity floor (wei): " + AmountToString(cfg.discovery.liquidity_floor));

    std::unique_ptr<HttpClient> http = CreateCurlHttpClient();
    RpcClient rpc(*http, cfg.rpc_url, cfg.auth_header, cfg.rpc_timeout_ms);
    UniswapQueryClient query(rpc, cfg.query_contract);
    SqlitePairStore store(cfg.pair_db_path);
    auto encoder = std::make_shared<UniswapV2SwapEncoder>();

    MarketDiscovery discovery(query, store, query, encoder, cfg.discovery);
    GroupedMarkets grouped = discovery.DiscoverAllMarkets(cfg.factories);
    for (const auto& failure : grouped.failed_factories) {
      LOG_WARNING("Factory excluded from graph: " + failure.factory + " (" + failure.error + ")");
    }
    if (!grouped.failed_factories.empty() && grouped.failed_factories.size() == cfg.factories.size()) {
      LOG_CRITICAL("Every factory failed discovery");
      Logger::Shutdown();
      StructuredLogger::Instance().Shutdown();
      return 1;
    }
    if (grouped.sync_error) {
      LOG_WARNING("Tracking " + std::to_string(grouped.all_market_pairs.size()) +
                  " unsynced markets; reserves will load on the next block");
    }

    ReserveSynchronizer sync(query);
    const std::vector<MarketPtr>& tracked = grouped.all_market_pairs;
    BlockWatcher watcher(rpc, [&](unsigned long long bn){
      try {
        size_t changed = sync.SyncReserves(tracked);
        LOG_INFO("Block " + std::to_string(bn) + ": reserves changed on " + std::to_string(changed) + "/" +
                 std::to_string(tracked.size()) + " markets");
      } catch (const MarketError& e) {
        LOG_WARNING("Block " + std::to_string(bn) + ": reserve sync skipped: " + e.what());
      }
    }, std::chrono::milliseconds(cfg.block_poll_ms));
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    watcher.Start();
    while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    watcher.Stop();

    LOG_INFO("=== pairgraph stopped ===");
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return 0;
  } catch (const std::exception& e) {
    if (!Logger::WritesToStderr()) std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    LOG_CRITICAL(std::string("Startup failed: ") + e.what());
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return 1;
  }
}
