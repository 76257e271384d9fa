#pragma once
#include <stdexcept>
#include <string>

enum class MarketErrorKind {
  InvalidReserve,
  InsufficientLiquidity,
  UnsupportedToken,
  InvalidAmount,
  MalformedMarket,
  LookupUnavailable,
  SyncUnavailable
};

const char* ToString(MarketErrorKind kind);

// Raised by the market core. Callers treat any MarketError as "this market or
// factory is currently unusable" and drop it rather than aborting a bootstrap.
class MarketError : public std::runtime_error {
public:
  MarketError(MarketErrorKind kind, const std::string& message);
  MarketErrorKind Kind() const { return kind_; }
private:
  MarketErrorKind kind_;
};
