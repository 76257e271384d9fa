#pragma once
#include <string>
#include <vector>

namespace MainnetConstants {
  // Wrapped ether, the pivot every discovered pair must contain
  inline const std::string WETH = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";
  // UniswapFlashQuery helper (getPairsByIndexRange / getReservesByPairs)
  inline const std::string UNISWAP_QUERY = "0x5ef1009b9fcd4fec3094a5564047e190d72bd511";
  // V2-style factories
  inline const std::string UNISWAP_V2_FACTORY = "0x5c69bee701ef814a2b6a3edd4b1652cb9cc5aa6f";
  inline const std::string SUSHISWAP_FACTORY = "0xc0aee478e3658e2610c5f7a4a2e1777ce9e4f2ac";

  inline const std::vector<std::string>& DefaultFactories() {
    static const std::vector<std::string> factories{UNISWAP_V2_FACTORY, SUSHISWAP_FACTORY};
    return factories;
  }

  // Tokens known to break transfers or pricing; skipping them only saves startup time.
  inline const std::vector<std::string>& DefaultTokenDenylist() {
    static const std::vector<std::string> tokens{
      "0xd75ea151a61d06868e31f8988d28dfe5e9df57b4",
      "0x0000000000095413afc295d19edeb1ad7b71c952",
      "0x9ea3b5b4ec044b70375236a281986106457b20ef",
      "0x15874d65e649880c2614e7a480cb7c9a55787ff6",
    };
    return tokens;
  }
}
