#pragma once
#include <string>
#include <vector>
#include "amm/amount.hpp"

// Minimal Solidity ABI helpers working on unprefixed lower-case hex.
// One "word" is 32 bytes = 64 hex characters.
namespace Abi {
  constexpr size_t kWordHex = 64;

  // "0x" + first 4 bytes of keccak256(signature).
  std::string Selector(const std::string& signature);

  // Throws std::out_of_range unless 0 <= v < 2^256.
  std::string EncodeUint256(const Amount& v);
  // Left-pads a 20-byte address; throws std::invalid_argument for anything that is not an address.
  std::string EncodeAddress(const std::string& addr);
  // Dynamic `bytes` tail: length word followed by data right-padded to a word boundary.
  std::string EncodeBytes(const std::string& hex_data);
  // Dynamic `address[]` tail: length word followed by one word per address.
  std::string EncodeAddressArray(const std::vector<std::string>& addrs);

  // Word `index` of `hex` (0x optional). Throws std::out_of_range when the data is too short.
  std::string Word(const std::string& hex, size_t index);
  Amount DecodeUint256(const std::string& hex, size_t index);
  // Normalized 0x lower-case address from the low 20 bytes of a word.
  // Throws std::invalid_argument when the upper 12 bytes are not zero.
  std::string DecodeAddress(const std::string& hex, size_t index);

  // Decodes a return value of type T[width][] where T is a static word type.
  // Returns one row of `width` raw words per element.
  std::vector<std::vector<std::string>> DecodeFixedRowArray(const std::string& hex, size_t width);
}
