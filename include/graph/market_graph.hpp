#pragma once
#include <map>
#include <string>
#include <vector>
#include "markets/market.hpp"

// Non-pivot token -> markets trading it against the pivot, in discovery order.
using MarketGraph = std::map<std::string, std::vector<MarketPtr>>;

class MarketGraphBuilder {
public:
  explicit MarketGraphBuilder(std::string pivot_token);

  // The token of `market` that is not the pivot. Throws MalformedMarket if both or neither are.
  const std::string& NonPivotToken(const Market& market) const;

  MarketGraph GroupByNonPivot(const std::vector<MarketPtr>& markets) const;

  // Flattens the buckets that hold at least two markets. A token reachable
  // through one pool offers no cross-pool trade, so its market is not synced.
  static std::vector<MarketPtr> CrossMarketCandidates(const MarketGraph& grouped);

  // Keeps markets whose pivot reserve is strictly above `floor` and regroups them.
  MarketGraph FilterByLiquidity(const std::vector<MarketPtr>& markets, const Amount& floor) const;

private:
  std::string pivot_token_;
};
