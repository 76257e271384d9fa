#include "markets/uniswap_v2_pair.hpp"
#include "encoding/swap_encoder.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <utility>

UniswapV2Pair::UniswapV2Pair(std::string market_address,
                             TokenPair tokens,
                             std::string protocol,
                             std::shared_ptr<const SwapEncoder> encoder,
                             ReserveMath::FeeSchedule fee)
  : Market(std::move(market_address), std::move(tokens), std::move(protocol)),
    encoder_(std::move(encoder)),
    fee_(fee),
    token_balances_(tokens_) {
  if (!encoder_) throw std::invalid_argument("UniswapV2Pair requires a swap encoder");
}

bool UniswapV2Pair::ReceiveDirectly(const std::string& token) const {
  return token_balances_.Contains(token);
}

std::vector<CallDetails> UniswapV2Pair::PrepareReceive(const std::string& token, const Amount& amount_in) const {
  if (!token_balances_.Contains(token)) {
    throw MarketError(MarketErrorKind::UnsupportedToken, "market " + market_address_ + " does not operate on token " + token);
  }
  if (amount_in <= 0) {
    throw MarketError(MarketErrorKind::InvalidAmount, "invalid amount: " + AmountToString(amount_in));
  }
  // Tokens are transferred straight to the pair before swap(); nothing to prepare.
  return {};
}

std::pair<const Amount*, const Amount*> UniswapV2Pair::ReservesFor(const std::string& token_in, const std::string& token_out) const {
  const Amount* reserve_in = token_balances_.Find(token_in);
  const Amount* reserve_out = token_balances_.Find(token_out);
  if (!reserve_in || !reserve_out) {
    throw MarketError(MarketErrorKind::UnsupportedToken,
                      "market " + market_address_ + " cannot price " + token_in + " -> " + token_out);
  }
  return {reserve_in, reserve_out};
}

Amount UniswapV2Pair::GetTokensOut(const std::string& token_in, const std::string& token_out, const Amount& amount_in) const {
  auto reserves = ReservesFor(token_in, token_out);
  return ReserveMath::GetAmountOut(*reserves.first, *reserves.second, amount_in, fee_);
}

Amount UniswapV2Pair::GetTokensIn(const std::string& token_in, const std::string& token_out, const Amount& amount_out) const {
  auto reserves = ReservesFor(token_in, token_out);
  return ReserveMath::GetAmountIn(*reserves.first, *reserves.second, amount_out, fee_);
}

Amount UniswapV2Pair::GetBalance(const std::string& token) const {
  const Amount* balance = token_balances_.Find(token);
  if (!balance) throw MarketError(MarketErrorKind::UnsupportedToken, "market " + market_address_ + " has no balance for " + token);
  return *balance;
}

bool UniswapV2Pair::SetReserves(const OrderedBalances& balances) {
  return SetReservesViaMatchingArray(tokens_, balances);
}

bool UniswapV2Pair::SetReservesViaMatchingArray(const TokenPair& tokens, const OrderedBalances& balances) {
  if (balances[0] < 0 || balances[1] < 0) {
    throw MarketError(MarketErrorKind::InvalidReserve, "negative reserve for market " + market_address_);
  }
  OrderedBalances ordered;
  if (tokens[0] == tokens_[0] && tokens[1] == tokens_[1]) {
    ordered = balances;
  } else if (tokens[0] == tokens_[1] && tokens[1] == tokens_[0]) {
    ordered = {balances[1], balances[0]};
  } else {
    throw MarketError(MarketErrorKind::UnsupportedToken,
                      "token set " + tokens[0] + "," + tokens[1] + " does not match market " + market_address_);
  }
  TokenBalances updated(tokens_, ordered);
  if (updated == token_balances_) return false;
  token_balances_ = std::move(updated);
  return true;
}

std::string UniswapV2Pair::BuildSwapCallData(const std::string& token_in, const Amount& amount_in, const std::string& recipient) const {
  Amount amount0_out = 0;
  Amount amount1_out = 0;
  if (token_in == tokens_[0]) {
    amount1_out = GetTokensOut(token_in, tokens_[1], amount_in);
  } else if (token_in == tokens_[1]) {
    amount0_out = GetTokensOut(token_in, tokens_[0], amount_in);
  } else {
    throw MarketError(MarketErrorKind::UnsupportedToken, "bad token input address " + token_in + " for market " + market_address_);
  }
  return encoder_->EncodeSwap(amount0_out, amount1_out, recipient, "");
}

MultipleCallData UniswapV2Pair::BuildHopCallData(const std::string& token_in, const Amount& amount_in, const Market& next_market) const {
  // Output always goes straight to the next pool. A market that cannot take
  // the token directly would need an intermediary hop here.
  // TODO: route through the executor when next_market.ReceiveDirectly(token_out) is false.
  MultipleCallData calls;
  calls.data.push_back(BuildSwapCallData(token_in, amount_in, next_market.MarketAddress()));
  calls.targets.push_back(market_address_);
  return calls;
}
