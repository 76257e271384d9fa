#include "encoding/swap_encoder.hpp"
#include "encoding/abi.hpp"

UniswapV2SwapEncoder::UniswapV2SwapEncoder()
  : selector_(Abi::Selector("swap(uint256,uint256,address,bytes)")) {}

std::string UniswapV2SwapEncoder::EncodeSwap(const Amount& amount0_out,
                                             const Amount& amount1_out,
                                             const std::string& recipient,
                                             const std::string& extra_data_hex) const {
  // Head is four words; the bytes tail starts right after it.
  std::string out = selector_;
  out += Abi::EncodeUint256(amount0_out);
  out += Abi::EncodeUint256(amount1_out);
  out += Abi::EncodeAddress(recipient);
  out += Abi::EncodeUint256(Amount(4 * 32));
  out += Abi::EncodeBytes(extra_data_hex);
  return out;
}
