#include "discovery/market_discovery.hpp"
#include "lookup/pair_lookup.hpp"
#include "storage/pair_store.hpp"
#include "markets/uniswap_v2_pair.hpp"
#include "sync/reserve_sync.hpp"
#include "scheduler/thread_pool.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

MarketDiscovery::MarketDiscovery(PairLookup& lookup,
                                 PairStore& store,
                                 ReserveQuery& reserves,
                                 std::shared_ptr<const SwapEncoder> encoder,
                                 DiscoveryConfig config)
  : lookup_(lookup), store_(store), reserves_(reserves), encoder_(std::move(encoder)), config_(std::move(config)) {
  if (config_.batch_size == 0) throw std::invalid_argument("discovery batch size must be positive");
  if (!encoder_) throw std::invalid_argument("discovery requires a swap encoder");
  config_.pivot_token = NormalizeAddress(config_.pivot_token);
  std::unordered_set<std::string> normalized;
  for (const auto& t : config_.denylist) normalized.insert(NormalizeAddress(t));
  config_.denylist = std::move(normalized);
}

MarketDiscovery::FactoryScan MarketDiscovery::ScanFactory(const std::string& factory) {
  FactoryScan scan;
  std::unordered_set<std::string> seen;
  size_t raw_count = 0, not_pivot = 0, denied = 0, existing = 0, pages = 0;

  for (unsigned long long batch = 0; batch < config_.batch_count_limit; ++batch) {
    const unsigned long long start = batch * config_.batch_size;
    std::vector<RawPair> pairs;
    try {
      pairs = lookup_.GetPairsByIndexRange(factory, start, start + config_.batch_size);
    } catch (const std::exception& e) {
      throw MarketError(MarketErrorKind::LookupUnavailable,
                        "factory " + factory + " page at " + std::to_string(start) + ": " + e.what());
    }
    ++pages;
    raw_count += pairs.size();

    for (const auto& pair : pairs) {
      const std::string token_a = NormalizeAddress(pair.token_a);
      const std::string token_b = NormalizeAddress(pair.token_b);
      const std::string market_address = NormalizeAddress(pair.pair_address);

      std::string token;
      if (token_a == config_.pivot_token && token_b != config_.pivot_token) {
        token = token_b;
      } else if (token_b == config_.pivot_token && token_a != config_.pivot_token) {
        token = token_a;
      } else {
        ++not_pivot;
        continue;
      }

      if (config_.denylist.count(token)) {
        ++denied;
        continue;
      }
      if (seen.count(market_address) || store_.Exists(market_address)) {
        LOG_DEBUG("Pair already exists: " + market_address);
        ++existing;
        continue;
      }
      seen.insert(market_address);
      scan.records.push_back({market_address, token_a, token_b, factory});
      scan.markets.push_back(std::make_shared<UniswapV2Pair>(
          market_address, TokenPair{token_a, token_b}, config_.protocol, encoder_));
    }

    if (pairs.size() < config_.batch_size) break;
  }

  LOG_INFO("Factory " + factory + ": " + std::to_string(scan.markets.size()) + " new pivot pairs from " +
           std::to_string(raw_count) + " listed (" + std::to_string(pages) + " pages)");
  StructuredLogger::Instance().LogEvent("factory_discovered", {
    {"factory", factory}, {"pages", pages}, {"raw_pairs", raw_count}, {"accepted", scan.markets.size()},
    {"skipped_not_pivot", not_pivot}, {"skipped_denylist", denied}, {"skipped_existing", existing}
  });
  return scan;
}

void MarketDiscovery::Persist(const std::vector<PairRecord>& records) {
  for (const auto& record : records) store_.Save(record);
}

std::vector<MarketPtr> MarketDiscovery::DiscoverMarkets(const std::string& factory) {
  FactoryScan scan = ScanFactory(factory);
  Persist(scan.records);
  return std::move(scan.markets);
}

GroupedMarkets MarketDiscovery::DiscoverAllMarkets(const std::vector<std::string>& factories) {
  LOG_INFO("Discovering markets across " + std::to_string(factories.size()) + " factories");
  GroupedMarkets result;

  std::vector<std::pair<std::string, std::future<FactoryScan>>> tasks;
  std::vector<FactoryScan> scans;
  {
    ThreadPool pool(std::max<size_t>(1, std::min(config_.max_concurrency, factories.size())));
    LOG_DEBUG("Scanning " + std::to_string(factories.size()) + " factories on " + std::to_string(pool.Size()) + " workers");
    tasks.reserve(factories.size());
    for (const auto& factory : factories) {
      const std::string f = NormalizeAddress(factory);
      tasks.emplace_back(f, pool.Submit([this, f]{ return ScanFactory(f); }));
    }
    for (auto& task : tasks) {
      try {
        scans.push_back(task.second.get());
      } catch (const std::exception& e) {
        LOG_ERROR("Discovery failed for factory " + task.first + ": " + e.what());
        StructuredLogger::Instance().LogEvent("factory_failed", {{"factory", task.first}, {"error", e.what()}});
        result.failed_factories.push_back({task.first, e.what()});
      }
    }
  }

  // First factory listing a pool wins.
  std::vector<MarketPtr> all_pairs;
  std::vector<PairRecord> records;
  std::unordered_set<std::string> seen;
  for (auto& scan : scans) {
    for (size_t i = 0; i < scan.markets.size(); ++i) {
      if (!seen.insert(scan.markets[i]->MarketAddress()).second) continue;
      all_pairs.push_back(std::move(scan.markets[i]));
      records.push_back(std::move(scan.records[i]));
    }
  }

  MarketGraphBuilder builder(config_.pivot_token);
  MarketGraph grouped = builder.GroupByNonPivot(all_pairs);
  result.all_market_pairs = MarketGraphBuilder::CrossMarketCandidates(grouped);

  ReserveSynchronizer sync(reserves_);
  try {
    sync.SyncReserves(result.all_market_pairs);
  } catch (const MarketError& e) {
    LOG_ERROR(std::string("Bootstrap reserve sync failed, no pairs recorded: ") + e.what());
    StructuredLogger::Instance().LogEvent("graph_sync_failed", {
      {"candidates", result.all_market_pairs.size()}, {"error", e.what()}
    });
    result.sync_error = e.what();
    return result;
  }

  result.markets_by_token = builder.FilterByLiquidity(result.all_market_pairs, config_.liquidity_floor);
  Persist(records);

  size_t liquid = 0;
  for (const auto& bucket : result.markets_by_token) liquid += bucket.second.size();
  LOG_INFO("Found " + std::to_string(liquid) + " pairs across " + std::to_string(result.markets_by_token.size()) +
           " tokens with sufficient liquidity to arb");
  StructuredLogger::Instance().LogEvent("graph_built", {
    {"discovered", all_pairs.size()}, {"candidates", result.all_market_pairs.size()},
    {"liquid_markets", liquid}, {"tokens", result.markets_by_token.size()},
    {"failed_factories", result.failed_factories.size()}
  });
  return result;
}
