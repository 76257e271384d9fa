#include "sync/reserve_sync.hpp"
#include "lookup/pair_lookup.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

size_t ReserveSynchronizer::SyncReserves(const std::vector<MarketPtr>& markets) {
  if (markets.empty()) return 0;
  std::vector<std::string> addresses;
  addresses.reserve(markets.size());
  for (const auto& m : markets) addresses.push_back(m->MarketAddress());

  LOG_INFO("Updating markets, count: " + std::to_string(addresses.size()));
  std::vector<OrderedBalances> reserves;
  try {
    reserves = query_.GetReservesByPairs(addresses);
  } catch (const std::exception& e) {
    LOG_ERROR(std::string("getReservesByPairs failed: ") + e.what());
    throw MarketError(MarketErrorKind::SyncUnavailable, e.what());
  }
  if (reserves.size() != markets.size()) {
    throw MarketError(MarketErrorKind::SyncUnavailable,
                      "reserve response has " + std::to_string(reserves.size()) + " rows for " +
                      std::to_string(markets.size()) + " markets");
  }
  for (const auto& r : reserves) {
    if (r[0] < 0 || r[1] < 0) throw MarketError(MarketErrorKind::SyncUnavailable, "negative reserve in response");
  }

  size_t changed = 0;
  for (size_t i = 0; i < markets.size(); ++i) {
    if (markets[i]->SetReserves(reserves[i])) ++changed;
  }
  StructuredLogger::Instance().LogEvent("reserves_synced", {{"requested", markets.size()}, {"changed", changed}});
  return changed;
}
