#include "amm/reserve_math.hpp"
#include "common/errors.hpp"

namespace ReserveMath {
  static void CheckReserves(const Amount& reserve_in, const Amount& reserve_out) {
    if (reserve_in < 0 || reserve_out < 0) {
      throw MarketError(MarketErrorKind::InvalidReserve, "negative reserve");
    }
    if (reserve_in == 0 || reserve_out == 0) {
      throw MarketError(MarketErrorKind::InvalidReserve,
                        "zero reserve (in=" + AmountToString(reserve_in) + ", out=" + AmountToString(reserve_out) + ")");
    }
  }

  static void CheckFee(const FeeSchedule& fee) {
    if (fee.denominator == 0 || fee.numerator == 0 || fee.numerator > fee.denominator) {
      throw MarketError(MarketErrorKind::InvalidAmount, "invalid fee schedule");
    }
  }

  Amount GetAmountOut(const Amount& reserve_in, const Amount& reserve_out, const Amount& amount_in,
                      const FeeSchedule& fee) {
    if (amount_in < 0) throw MarketError(MarketErrorKind::InvalidAmount, "negative amount in: " + AmountToString(amount_in));
    CheckReserves(reserve_in, reserve_out);
    CheckFee(fee);
    const Amount amount_in_with_fee = amount_in * fee.numerator;
    const Amount numerator = amount_in_with_fee * reserve_out;
    const Amount denominator = reserve_in * fee.denominator + amount_in_with_fee;
    return numerator / denominator;
  }

  Amount GetAmountIn(const Amount& reserve_in, const Amount& reserve_out, const Amount& amount_out,
                     const FeeSchedule& fee) {
    if (amount_out < 0) throw MarketError(MarketErrorKind::InvalidAmount, "negative amount out: " + AmountToString(amount_out));
    CheckReserves(reserve_in, reserve_out);
    CheckFee(fee);
    if (amount_out >= reserve_out) {
      throw MarketError(MarketErrorKind::InsufficientLiquidity,
                        "amount out " + AmountToString(amount_out) + " >= reserve " + AmountToString(reserve_out));
    }
    const Amount numerator = reserve_in * amount_out * fee.denominator;
    const Amount denominator = (reserve_out - amount_out) * fee.numerator;
    return numerator / denominator + 1;
  }
}
