#pragma once
#include <vector>
#include "markets/market.hpp"

class ReserveQuery;

// Refreshes reserves of many markets with one batched query.
class ReserveSynchronizer {
public:
  explicit ReserveSynchronizer(ReserveQuery& query) : query_(query) {}

  // All-or-nothing: on MarketError(SyncUnavailable) no market was touched.
  // Returns the number of markets whose reserves changed.
  size_t SyncReserves(const std::vector<MarketPtr>& markets);

private:
  ReserveQuery& query_;
};
