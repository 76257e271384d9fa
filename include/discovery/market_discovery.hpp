#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "graph/market_graph.hpp"
#include "storage/pair_store.hpp"

class PairLookup;
class ReserveQuery;
class SwapEncoder;

struct DiscoveryConfig {
  std::string pivot_token;
  unsigned long long batch_size = 1000;
  // Upper bound on pages per factory; keeps startup bounded on dev nodes.
  unsigned long long batch_count_limit = 100;
  Amount liquidity_floor = Amount(5) * Amount(1000000000000000000ULL);
  std::unordered_set<std::string> denylist;
  size_t max_concurrency = 4;
  std::string protocol;
};

struct FactoryFailure {
  std::string factory;
  std::string error;
};

struct GroupedMarkets {
  // Liquid markets grouped by their non-pivot token.
  MarketGraph markets_by_token;
  // Every market of a token with two or more pools, synced or not; re-sync these on new blocks.
  std::vector<MarketPtr> all_market_pairs;
  std::vector<FactoryFailure> failed_factories;
  // Set when the bootstrap reserve refresh failed. markets_by_token is then empty,
  // all_market_pairs still lists the candidates and no pair record was saved.
  std::optional<std::string> sync_error;
};

class MarketDiscovery {
public:
  MarketDiscovery(PairLookup& lookup,
                  PairStore& store,
                  ReserveQuery& reserves,
                  std::shared_ptr<const SwapEncoder> encoder,
                  DiscoveryConfig config);

  // Walks one factory's registry page by page and returns the new pivot pairs.
  // Records are saved once the walk completes.
  // Throws MarketError(LookupUnavailable) if any page cannot be read; nothing is saved then.
  std::vector<MarketPtr> DiscoverMarkets(const std::string& factory);

  // Discovers every factory in parallel, then groups, syncs and filters.
  // A failing factory is reported in failed_factories and contributes no markets.
  // A failed reserve refresh is reported in sync_error. Records are saved only
  // after the graph is built.
  GroupedMarkets DiscoverAllMarkets(const std::vector<std::string>& factories);

private:
  struct FactoryScan {
    std::vector<MarketPtr> markets;
    // records[i] describes markets[i]
    std::vector<PairRecord> records;
  };

  FactoryScan ScanFactory(const std::string& factory);
  void Persist(const std::vector<PairRecord>& records);

  PairLookup& lookup_;
  PairStore& store_;
  ReserveQuery& reserves_;
  std::shared_ptr<const SwapEncoder> encoder_;
  DiscoveryConfig config_;
};
