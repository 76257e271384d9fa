#pragma once
#include <string>
#include "amm/amount.hpp"

// Turns a structured swap intent into opaque call bytes (0x hex).
class SwapEncoder {
public:
  virtual ~SwapEncoder() = default;
  virtual std::string EncodeSwap(const Amount& amount0_out,
                                 const Amount& amount1_out,
                                 const std::string& recipient,
                                 const std::string& extra_data_hex) const = 0;
};

// function swap(uint amount0Out, uint amount1Out, address to, bytes calldata data)
class UniswapV2SwapEncoder : public SwapEncoder {
public:
  UniswapV2SwapEncoder();
  std::string EncodeSwap(const Amount& amount0_out,
                         const Amount& amount1_out,
                         const std::string& recipient,
                         const std::string& extra_data_hex) const override;
  const std::string& Selector() const { return selector_; }
private:
  std::string selector_;
};
