#include "common/errors.hpp"

const char* ToString(MarketErrorKind kind) {
  switch (kind) {
    case MarketErrorKind::InvalidReserve: return "InvalidReserve";
    case MarketErrorKind::InsufficientLiquidity: return "InsufficientLiquidity";
    case MarketErrorKind::UnsupportedToken: return "UnsupportedToken";
    case MarketErrorKind::InvalidAmount: return "InvalidAmount";
    case MarketErrorKind::MalformedMarket: return "MalformedMarket";
    case MarketErrorKind::LookupUnavailable: return "LookupUnavailable";
    case MarketErrorKind::SyncUnavailable: return "SyncUnavailable";
  }
  return "Unknown";
}

MarketError::MarketError(MarketErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(ToString(kind)) + ": " + message), kind_(kind) {}
