#include <catch2/catch.hpp>
#include "amm/reserve_math.hpp"
#include "common/errors.hpp"
#include "fakes.hpp"

using testing_fakes::ErrorKindOf;
using testing_fakes::Ether;

TEST_CASE("Amount out with 0.3% fee", "[reserve_math]") {
  SECTION("Worked example: 1 in against 10/5000 reserves") {
    REQUIRE(ReserveMath::GetAmountOut(10, 5000, 1) == 453);
  }

  SECTION("Same trade in wei units") {
    Amount out = ReserveMath::GetAmountOut(Ether(10), Ether(5000), Ether(1));
    REQUIRE(out == Amount("453305446940074565790"));
  }

  SECTION("Zero input yields zero output") {
    REQUIRE(ReserveMath::GetAmountOut(10, 5000, 0) == 0);
  }

  SECTION("uint112 reserves do not overflow") {
    Amount max112 = (Amount(1) << 112) - 1;
    Amount out = ReserveMath::GetAmountOut(max112, max112, max112);
    REQUIRE(out == Amount("2592248356514383147543768072224554"));
    REQUIRE(out < max112);
  }

  SECTION("Zero reserves are rejected") {
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountOut(0, 5000, 1); }) == MarketErrorKind::InvalidReserve);
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountOut(10, 0, 1); }) == MarketErrorKind::InvalidReserve);
  }

  SECTION("Negative input is rejected") {
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountOut(10, 5000, -1); }) == MarketErrorKind::InvalidAmount);
  }
}

TEST_CASE("Amount in rounds up like the router", "[reserve_math]") {
  SECTION("Inverse of the worked example") {
    REQUIRE(ReserveMath::GetAmountIn(10, 5000, 453) == 1);
  }

  SECTION("Wei round trip recovers the input") {
    Amount out = ReserveMath::GetAmountOut(Ether(10), Ether(5000), Ether(1));
    REQUIRE(ReserveMath::GetAmountIn(Ether(10), Ether(5000), out) == Ether(1));
  }

  SECTION("Zero output still costs one unit") {
    REQUIRE(ReserveMath::GetAmountIn(10, 5000, 0) == 1);
  }

  SECTION("Draining almost the whole reserve") {
    REQUIRE(ReserveMath::GetAmountIn(1000, 1000, 999) == 1002007);
  }

  SECTION("Asking for the whole reserve or more fails") {
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountIn(10, 5000, 5000); }) == MarketErrorKind::InsufficientLiquidity);
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountIn(10, 5000, 6000); }) == MarketErrorKind::InsufficientLiquidity);
  }

  SECTION("Zero reserves are rejected before the liquidity check") {
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountIn(0, 5000, 1); }) == MarketErrorKind::InvalidReserve);
    REQUIRE(ErrorKindOf([]{ ReserveMath::GetAmountIn(10, 0, 0); }) == MarketErrorKind::InvalidReserve);
  }
}

TEST_CASE("Amount out is monotonic in amount in", "[reserve_math]") {
  const Amount reserve_in = Ether(10);
  const Amount reserve_out = Ether(5000);
  Amount previous = 0;
  Amount amount_in = 1;
  for (int i = 0; i < 80; ++i) {
    Amount out = ReserveMath::GetAmountOut(reserve_in, reserve_out, amount_in);
    REQUIRE(out >= previous);
    REQUIRE(out < reserve_out);
    previous = out;
    amount_in = amount_in * 3 / 2 + 1;
  }

  for (int x = 0; x < 200; ++x) {
    REQUIRE(ReserveMath::GetAmountOut(10, 5000, x + 1) >= ReserveMath::GetAmountOut(10, 5000, x));
  }
}

TEST_CASE("Inverse formula recovers at least the original input", "[reserve_math]") {
  // Output token priced at or below the input token, so one output unit never
  // costs more than one input unit.
  for (const Amount& reserve_in : {Amount(10), Amount(997), Ether(1)}) {
    const Amount reserve_out = reserve_in * 500;
    for (const Amount& amount_in : {Amount(1), Amount(2), Amount(7), Amount(reserve_in / 3), reserve_in}) {
      Amount out = ReserveMath::GetAmountOut(reserve_in, reserve_out, amount_in);
      REQUIRE(ReserveMath::GetAmountIn(reserve_in, reserve_out, out) >= amount_in);
    }
  }
}
