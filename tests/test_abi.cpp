#include <catch2/catch.hpp>
#include <stdexcept>
#include "crypto/keccak.hpp"
#include "encoding/abi.hpp"
#include "encoding/swap_encoder.hpp"
#include "utils/hex.hpp"
#include "fakes.hpp"

using namespace testing_fakes;

namespace {
  std::string Zeros(size_t n) { return std::string(n, '0'); }
  std::string WordOf(const std::string& low_hex) { return Zeros(Abi::kWordHex - low_hex.size()) + low_hex; }
}

TEST_CASE("Keccak and function selectors", "[abi]") {
  REQUIRE(Crypto::Keccak256Raw("") == "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");

  REQUIRE(Abi::Selector("swap(uint256,uint256,address,bytes)") == "0x022c0d9f");
  REQUIRE(Abi::Selector("getReserves()") == "0x0902f1ac");
  REQUIRE(Abi::Selector("transfer(address,uint256)") == "0xa9059cbb");
}

TEST_CASE("Static word encoding", "[abi]") {
  REQUIRE(Abi::EncodeUint256(0) == Zeros(64));
  REQUIRE(Abi::EncodeUint256(453) == WordOf("1c5"));
  REQUIRE(Abi::EncodeUint256((Amount(1) << 256) - 1) == std::string(64, 'f'));
  REQUIRE_THROWS_AS(Abi::EncodeUint256(Amount(1) << 256), std::out_of_range);
  REQUIRE_THROWS_AS(Abi::EncodeUint256(-1), std::out_of_range);

  REQUIRE(Abi::EncodeAddress("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2") ==
          Zeros(24) + "c02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
  REQUIRE_THROWS_AS(Abi::EncodeAddress("0x1234"), std::invalid_argument);
  REQUIRE_THROWS_AS(Abi::EncodeAddress("0xzz2aaa39b223fe8d0a0e5c4f27ead9083c756cc2"), std::invalid_argument);
}

TEST_CASE("Dynamic tails", "[abi]") {
  REQUIRE(Abi::EncodeBytes("") == Zeros(64));
  REQUIRE(Abi::EncodeBytes("0xABcd") == WordOf("2") + "abcd" + Zeros(60));
  REQUIRE_THROWS_AS(Abi::EncodeBytes("0xabc"), std::invalid_argument);

  auto tail = Abi::EncodeAddressArray({Pool(1), Pool(2)});
  REQUIRE(tail.size() == 3 * Abi::kWordHex);
  REQUIRE(Abi::DecodeUint256(tail, 0) == 2);
  REQUIRE(Abi::DecodeAddress(tail, 1) == Pool(1));
  REQUIRE(Abi::DecodeAddress(tail, 2) == Pool(2));
}

TEST_CASE("Word decoding", "[abi]") {
  std::string data = "0x" + WordOf("1c5") + WordOf("ff");
  REQUIRE(Abi::DecodeUint256(data, 0) == 453);
  REQUIRE(Abi::DecodeUint256(data, 1) == 255);
  REQUIRE_THROWS_AS(Abi::Word(data, 2), std::out_of_range);

  SECTION("Address words must be zero-padded") {
    std::string clean = Abi::EncodeAddress(Pool(3));
    REQUIRE(Abi::DecodeAddress(clean, 0) == Pool(3));
    std::string dirty = "01" + clean.substr(2);
    REQUIRE_THROWS_AS(Abi::DecodeAddress(dirty, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Abi::DecodeAddress(std::string(64, 'f'), 0), std::invalid_argument);
  }

  SECTION("Fixed-width rows") {
    std::string rows = WordOf("20") + WordOf("2") + WordOf("1") + WordOf("2") + WordOf("3") + WordOf("4");
    auto decoded = Abi::DecodeFixedRowArray(rows, 2);
    REQUIRE(decoded.size() == 2);
    REQUIRE(Abi::DecodeUint256(decoded[0][1], 0) == 2);
    REQUIRE(Abi::DecodeUint256(decoded[1][0], 0) == 3);
  }

  SECTION("Truncated rows are rejected") {
    std::string rows = WordOf("20") + WordOf("2") + WordOf("1") + WordOf("2") + WordOf("3");
    REQUIRE_THROWS_AS(Abi::DecodeFixedRowArray(rows, 2), std::out_of_range);
  }

  SECTION("Empty array") {
    REQUIRE(Abi::DecodeFixedRowArray(WordOf("20") + WordOf("0"), 3).empty());
  }
}

TEST_CASE("Uniswap V2 swap call data", "[abi]") {
  UniswapV2SwapEncoder encoder;
  REQUIRE(encoder.Selector() == "0x022c0d9f");

  std::string recipient = Pool(1);
  std::string expected = "0x022c0d9f" + Zeros(64) + WordOf("1c5") + Zeros(24) + Strip0x(recipient) +
                         WordOf("80") + Zeros(64);
  REQUIRE(encoder.EncodeSwap(0, 453, recipient, "") == expected);

  SECTION("Extra data becomes the bytes tail") {
    auto data = encoder.EncodeSwap(1, 0, recipient, "0x01");
    REQUIRE(data.size() == 2 + 8 + 6 * Abi::kWordHex);
    REQUIRE(Abi::DecodeUint256(data.substr(10), 4) == 1);
    REQUIRE(Abi::Word(data.substr(10), 5) == "01" + Zeros(62));
  }

  SECTION("Bad inputs throw") {
    REQUIRE_THROWS_AS(encoder.EncodeSwap(0, 1, "0xnope", ""), std::invalid_argument);
    REQUIRE_THROWS_AS(encoder.EncodeSwap(Amount(1) << 256, 0, recipient, ""), std::out_of_range);
  }
}
