#pragma once
#include <string>
#include <vector>

struct PairRecord {
  std::string market_address;
  std::string token0;
  std::string token1;
  std::string factory_address;
};

// Remembers which pairs were already discovered so discovery is idempotent across restarts.
// Implementations must be safe to call from concurrent discovery tasks.
class PairStore {
public:
  virtual ~PairStore() = default;
  virtual bool Exists(const std::string& market_address) = 0;
  virtual void Save(const PairRecord& record) = 0;
};
