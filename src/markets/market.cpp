#include "markets/market.hpp"
#include "common/errors.hpp"
#include <utility>

TokenBalances::TokenBalances(const TokenPair& tokens)
  : tokens_(tokens), balances_{Amount(0), Amount(0)} {}

TokenBalances::TokenBalances(const TokenPair& tokens, const OrderedBalances& balances)
  : tokens_(tokens), balances_(balances) {}

bool TokenBalances::Contains(const std::string& token) const {
  return token == tokens_[0] || token == tokens_[1];
}

const Amount* TokenBalances::Find(const std::string& token) const {
  if (token == tokens_[0]) return &balances_[0];
  if (token == tokens_[1]) return &balances_[1];
  return nullptr;
}

bool TokenBalances::operator==(const TokenBalances& other) const {
  return tokens_ == other.tokens_ && balances_ == other.balances_;
}

Market::Market(std::string market_address, TokenPair tokens, std::string protocol)
  : market_address_(std::move(market_address)), tokens_(std::move(tokens)), protocol_(std::move(protocol)) {
  if (tokens_[0] == tokens_[1]) {
    throw MarketError(MarketErrorKind::MalformedMarket, "market " + market_address_ + " lists token " + tokens_[0] + " twice");
  }
}
