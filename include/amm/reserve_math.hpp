#pragma once
#include "amm/amount.hpp"

// Constant-product pricing as implemented by the Uniswap V2 pair contract.
// All math is exact integer arithmetic so results match on-chain rounding.
namespace ReserveMath {
  struct FeeSchedule {
    unsigned numerator = 997;
    unsigned denominator = 1000;
  };

  // Output received for `amount_in`:
  //   floor(in*997*reserve_out / (reserve_in*1000 + in*997))
  // Throws MarketError(InvalidReserve) if a reserve is zero, InvalidAmount if a value is negative.
  Amount GetAmountOut(const Amount& reserve_in, const Amount& reserve_out, const Amount& amount_in,
                      const FeeSchedule& fee = FeeSchedule());

  // Input required to receive `amount_out`, rounded up by one unit like the router:
  //   floor(reserve_in*out*1000 / ((reserve_out-out)*997)) + 1
  // Throws MarketError(InsufficientLiquidity) when amount_out >= reserve_out.
  Amount GetAmountIn(const Amount& reserve_in, const Amount& reserve_out, const Amount& amount_out,
                     const FeeSchedule& fee = FeeSchedule());
}
