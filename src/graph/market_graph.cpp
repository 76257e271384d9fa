#include "graph/market_graph.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <utility>

MarketGraphBuilder::MarketGraphBuilder(std::string pivot_token) : pivot_token_(std::move(pivot_token)) {}

const std::string& MarketGraphBuilder::NonPivotToken(const Market& market) const {
  const auto& tokens = market.Tokens();
  const bool first = tokens[0] == pivot_token_;
  const bool second = tokens[1] == pivot_token_;
  if (first == second) {
    throw MarketError(MarketErrorKind::MalformedMarket,
                      "market " + market.MarketAddress() + " must hold the pivot token exactly once");
  }
  return first ? tokens[1] : tokens[0];
}

MarketGraph MarketGraphBuilder::GroupByNonPivot(const std::vector<MarketPtr>& markets) const {
  MarketGraph grouped;
  for (const auto& market : markets) {
    grouped[NonPivotToken(*market)].push_back(market);
  }
  return grouped;
}

std::vector<MarketPtr> MarketGraphBuilder::CrossMarketCandidates(const MarketGraph& grouped) {
  std::vector<MarketPtr> out;
  for (const auto& bucket : grouped) {
    if (bucket.second.size() < 2) continue;
    out.insert(out.end(), bucket.second.begin(), bucket.second.end());
  }
  return out;
}

MarketGraph MarketGraphBuilder::FilterByLiquidity(const std::vector<MarketPtr>& markets, const Amount& floor) const {
  std::vector<MarketPtr> liquid;
  liquid.reserve(markets.size());
  for (const auto& market : markets) {
    if (market->GetBalance(pivot_token_) > floor) liquid.push_back(market);
  }
  LOG_DEBUG("Liquidity filter kept " + std::to_string(liquid.size()) + "/" + std::to_string(markets.size()) + " markets");
  return GroupByNonPivot(liquid);
}
