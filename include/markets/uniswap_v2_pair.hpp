#pragma once
#include <memory>
#include "markets/market.hpp"
#include "amm/reserve_math.hpp"

class SwapEncoder;

// Constant-product pool with the Uniswap V2 swap interface (Sushiswap and other forks included).
class UniswapV2Pair : public Market {
public:
  UniswapV2Pair(std::string market_address,
                TokenPair tokens,
                std::string protocol,
                std::shared_ptr<const SwapEncoder> encoder,
                ReserveMath::FeeSchedule fee = ReserveMath::FeeSchedule());

  bool ReceiveDirectly(const std::string& token) const override;
  std::vector<CallDetails> PrepareReceive(const std::string& token, const Amount& amount_in) const override;

  Amount GetTokensOut(const std::string& token_in, const std::string& token_out, const Amount& amount_in) const override;
  Amount GetTokensIn(const std::string& token_in, const std::string& token_out, const Amount& amount_out) const override;
  Amount GetBalance(const std::string& token) const override;

  bool SetReserves(const OrderedBalances& balances) override;
  // Same as SetReserves with balances keyed by `tokens` in any order; the token set must match the pool's.
  bool SetReservesViaMatchingArray(const TokenPair& tokens, const OrderedBalances& balances);

  std::string BuildSwapCallData(const std::string& token_in, const Amount& amount_in, const std::string& recipient) const override;
  MultipleCallData BuildHopCallData(const std::string& token_in, const Amount& amount_in, const Market& next_market) const override;

  const TokenBalances& Reserves() const { return token_balances_; }

private:
  std::pair<const Amount*, const Amount*> ReservesFor(const std::string& token_in, const std::string& token_out) const;

  std::shared_ptr<const SwapEncoder> encoder_;
  ReserveMath::FeeSchedule fee_;
  TokenBalances token_balances_;
};
