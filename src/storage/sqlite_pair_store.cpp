#include "storage/sqlite_pair_store.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace {
  const char* kSchema =
    "CREATE TABLE IF NOT EXISTS pairs ("
    " market_address TEXT PRIMARY KEY,"
    " token0 TEXT NOT NULL,"
    " token1 TEXT NOT NULL,"
    " factory_address TEXT NOT NULL,"
    " created_at INTEGER NOT NULL DEFAULT (strftime('%s','now')));"
    "CREATE INDEX IF NOT EXISTS pairs_factory ON pairs(factory_address);";

  // RAII for statements that live only for one query.
  struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
  };

  void BindText(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  }

  std::string ColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
  }
}

SqlitePairStore::SqlitePairStore(const std::string& path) {
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Cannot open pair DB " + path + ": " + msg);
  }
  try {
    sqlite3_busy_timeout(db_, 5000);
    Exec(kSchema);
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM pairs WHERE market_address = ?1;", -1, &exists_stmt_, nullptr) != SQLITE_OK) {
      Fail("prepare exists");
    }
    if (sqlite3_prepare_v2(db_,
          "INSERT OR IGNORE INTO pairs (market_address, token0, token1, factory_address) VALUES (?1, ?2, ?3, ?4);",
          -1, &insert_stmt_, nullptr) != SQLITE_OK) {
      Fail("prepare insert");
    }
  } catch (const std::exception&) {
    if (exists_stmt_) sqlite3_finalize(exists_stmt_);
    if (insert_stmt_) sqlite3_finalize(insert_stmt_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  LOG_INFO("Pair store opened: " + path);
}

SqlitePairStore::~SqlitePairStore() {
  if (exists_stmt_) sqlite3_finalize(exists_stmt_);
  if (insert_stmt_) sqlite3_finalize(insert_stmt_);
  if (db_) sqlite3_close(db_);
}

void SqlitePairStore::Exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("pair DB: " + msg);
  }
}

void SqlitePairStore::Fail(const std::string& what) {
  throw std::runtime_error("pair DB " + what + ": " + sqlite3_errmsg(db_));
}

bool SqlitePairStore::Exists(const std::string& market_address) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_reset(exists_stmt_);
  sqlite3_clear_bindings(exists_stmt_);
  BindText(exists_stmt_, 1, NormalizeAddress(market_address));
  int rc = sqlite3_step(exists_stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  Fail("exists");
}

void SqlitePairStore::Save(const PairRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_reset(insert_stmt_);
  sqlite3_clear_bindings(insert_stmt_);
  BindText(insert_stmt_, 1, NormalizeAddress(record.market_address));
  BindText(insert_stmt_, 2, NormalizeAddress(record.token0));
  BindText(insert_stmt_, 3, NormalizeAddress(record.token1));
  BindText(insert_stmt_, 4, NormalizeAddress(record.factory_address));
  if (sqlite3_step(insert_stmt_) != SQLITE_DONE) Fail("insert " + record.market_address);
}

std::vector<PairRecord> SqlitePairStore::Collect(sqlite3_stmt* stmt) {
  std::vector<PairRecord> out;
  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back({ColumnText(stmt, 0), ColumnText(stmt, 1), ColumnText(stmt, 2), ColumnText(stmt, 3)});
  }
  if (rc != SQLITE_DONE) Fail("select");
  return out;
}

std::vector<PairRecord> SqlitePairStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  StmtGuard g;
  if (sqlite3_prepare_v2(db_, "SELECT market_address, token0, token1, factory_address FROM pairs ORDER BY rowid;",
                         -1, &g.stmt, nullptr) != SQLITE_OK) {
    Fail("prepare select");
  }
  return Collect(g.stmt);
}

std::vector<PairRecord> SqlitePairStore::LoadByFactory(const std::string& factory_address) {
  std::lock_guard<std::mutex> lock(mutex_);
  StmtGuard g;
  if (sqlite3_prepare_v2(db_, "SELECT market_address, token0, token1, factory_address FROM pairs"
                              " WHERE factory_address = ?1 ORDER BY rowid;", -1, &g.stmt, nullptr) != SQLITE_OK) {
    Fail("prepare select");
  }
  BindText(g.stmt, 1, NormalizeAddress(factory_address));
  return Collect(g.stmt);
}

size_t SqlitePairStore::Count() {
  std::lock_guard<std::mutex> lock(mutex_);
  StmtGuard g;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM pairs;", -1, &g.stmt, nullptr) != SQLITE_OK) Fail("prepare count");
  if (sqlite3_step(g.stmt) != SQLITE_ROW) Fail("count");
  return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}
