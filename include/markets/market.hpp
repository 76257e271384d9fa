#pragma once
#include <array>
#include <memory>
#include <string>
#include <vector>
#include "amm/amount.hpp"

// token0/token1 in the pool's on-chain order.
using TokenPair = std::array<std::string, 2>;
using OrderedBalances = std::array<Amount, 2>;

// Reserves of exactly the two pool tokens, looked up by address match.
class TokenBalances {
public:
  explicit TokenBalances(const TokenPair& tokens);
  TokenBalances(const TokenPair& tokens, const OrderedBalances& balances);

  bool Contains(const std::string& token) const;
  // nullptr when `token` is not one of the pair.
  const Amount* Find(const std::string& token) const;
  const TokenPair& Tokens() const { return tokens_; }
  const OrderedBalances& Balances() const { return balances_; }

  bool operator==(const TokenBalances& other) const;
  bool operator!=(const TokenBalances& other) const { return !(*this == other); }
private:
  TokenPair tokens_;
  OrderedBalances balances_;
};

struct CallDetails {
  std::string target;
  std::string data;
};

// Parallel arrays consumed by an executor contract: data[i] is sent to targets[i].
struct MultipleCallData {
  std::vector<std::string> targets;
  std::vector<std::string> data;
};

// One two-asset pool. Concrete AMM dialects implement pricing and call construction.
class Market {
public:
  Market(std::string market_address, TokenPair tokens, std::string protocol);
  virtual ~Market() = default;

  const std::string& MarketAddress() const { return market_address_; }
  const TokenPair& Tokens() const { return tokens_; }
  const std::string& Protocol() const { return protocol_; }

  // True when an upstream hop can transfer `token` straight into this pool.
  virtual bool ReceiveDirectly(const std::string& token) const = 0;
  // Calls that must run before `amount_in` of `token` can be swapped here.
  virtual std::vector<CallDetails> PrepareReceive(const std::string& token, const Amount& amount_in) const = 0;

  virtual Amount GetTokensOut(const std::string& token_in, const std::string& token_out, const Amount& amount_in) const = 0;
  virtual Amount GetTokensIn(const std::string& token_in, const std::string& token_out, const Amount& amount_out) const = 0;
  virtual Amount GetBalance(const std::string& token) const = 0;

  // Replaces reserves from balances ordered like Tokens(). Returns false when nothing changed.
  virtual bool SetReserves(const OrderedBalances& balances) = 0;

  virtual std::string BuildSwapCallData(const std::string& token_in, const Amount& amount_in, const std::string& recipient) const = 0;
  virtual MultipleCallData BuildHopCallData(const std::string& token_in, const Amount& amount_in, const Market& next_market) const = 0;

protected:
  std::string market_address_;
  TokenPair tokens_;
  std::string protocol_;
};

using MarketPtr = std::shared_ptr<Market>;
