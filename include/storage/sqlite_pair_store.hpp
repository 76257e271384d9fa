#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "storage/pair_store.hpp"

struct sqlite3;
struct sqlite3_stmt;

// PairStore backed by a SQLite table `pairs` keyed by market_address.
// Use ":memory:" for a throwaway database.
class SqlitePairStore : public PairStore {
public:
  explicit SqlitePairStore(const std::string& path);
  ~SqlitePairStore() override;
  SqlitePairStore(const SqlitePairStore&) = delete;
  SqlitePairStore& operator=(const SqlitePairStore&) = delete;

  bool Exists(const std::string& market_address) override;
  // Saving an address that is already stored is a no-op.
  void Save(const PairRecord& record) override;

  std::vector<PairRecord> LoadAll();
  std::vector<PairRecord> LoadByFactory(const std::string& factory_address);
  size_t Count();

private:
  void Exec(const char* sql);
  [[noreturn]] void Fail(const std::string& what);
  std::vector<PairRecord> Collect(sqlite3_stmt* stmt);

  sqlite3* db_ = nullptr;
  sqlite3_stmt* exists_stmt_ = nullptr;
  sqlite3_stmt* insert_stmt_ = nullptr;
  std::mutex mutex_;
};
