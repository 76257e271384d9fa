#pragma once
#include <string>
#include <vector>
#include "markets/market.hpp"

// One registry entry as listed by a factory: (token0, token1, pair).
struct RawPair {
  std::string token_a;
  std::string token_b;
  std::string pair_address;
};

// Paginated view of a factory's allPairs registry.
class PairLookup {
public:
  virtual ~PairLookup() = default;
  // Pairs with index in [start, stop); fewer than stop-start entries means the registry ended.
  virtual std::vector<RawPair> GetPairsByIndexRange(const std::string& factory,
                                                    unsigned long long start,
                                                    unsigned long long stop) = 0;
};

// Batched reserve reads. The response is ordered like the request.
class ReserveQuery {
public:
  virtual ~ReserveQuery() = default;
  virtual std::vector<OrderedBalances> GetReservesByPairs(const std::vector<std::string>& pair_addresses) = 0;
};
