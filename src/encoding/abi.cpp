#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cctype>
#include <stdexcept>

namespace {
  std::string PadLeft(const std::string& hexNo0x) {
    if (hexNo0x.size() > Abi::kWordHex) throw std::out_of_range("value wider than one ABI word");
    return std::string(Abi::kWordHex - hexNo0x.size(), '0') + hexNo0x;
  }

  size_t WordToSize(const std::string& word) {
    Amount v = Abi::DecodeUint256(word, 0);
    if (v > Amount(1ULL << 32)) throw std::out_of_range("ABI offset/length out of range");
    return static_cast<size_t>(v.convert_to<unsigned long long>());
  }

  const Amount& Uint256Limit() {
    static const Amount limit = Amount(1) << 256;
    return limit;
  }
}

namespace Abi {
  std::string Selector(const std::string& signature) {
    auto hash = Crypto::Keccak256Raw(signature);
    return "0x" + Strip0x(hash).substr(0, 8);
  }

  std::string EncodeUint256(const Amount& v) {
    if (v < 0 || v >= Uint256Limit()) throw std::out_of_range("uint256 out of range: " + AmountToString(v));
    std::string hex = ToLowerHex(v.str(0, std::ios_base::hex));
    return PadLeft(hex);
  }

  std::string EncodeAddress(const std::string& addr) {
    if (!IsAddress(addr)) throw std::invalid_argument("not an address: " + addr);
    return PadLeft(ToLowerHex(Strip0x(addr)));
  }

  std::string EncodeBytes(const std::string& hex_data) {
    std::string body = ToLowerHex(Strip0x(hex_data));
    if (body.size() % 2 != 0 || !IsHexString(body)) throw std::invalid_argument("not a byte string: " + hex_data);
    std::string out = EncodeUint256(Amount(body.size() / 2));
    out += body;
    size_t rem = body.size() % kWordHex;
    if (rem != 0) out.append(kWordHex - rem, '0');
    return out;
  }

  std::string EncodeAddressArray(const std::vector<std::string>& addrs) {
    std::string out;
    out.reserve(kWordHex * (addrs.size() + 1));
    out += EncodeUint256(Amount(addrs.size()));
    for (const auto& a : addrs) out += EncodeAddress(a);
    return out;
  }

  std::string Word(const std::string& hex, size_t index) {
    std::string body = Strip0x(hex);
    if (body.size() < (index + 1) * kWordHex) {
      throw std::out_of_range("ABI data too short for word " + std::to_string(index));
    }
    return body.substr(index * kWordHex, kWordHex);
  }

  Amount DecodeUint256(const std::string& hex, size_t index) {
    std::string w = Word(hex, index);
    if (!IsHexString(w)) throw std::invalid_argument("non-hex ABI word");
    Amount v = 0;
    for (char c : w) {
      int d = (c >= '0' && c <= '9') ? c - '0' : 10 + (std::tolower(static_cast<unsigned char>(c)) - 'a');
      v = (v << 4) | d;
    }
    return v;
  }

  std::string DecodeAddress(const std::string& hex, size_t index) {
    std::string w = Word(hex, index);
    if (w.compare(0, 24, std::string(24, '0')) != 0 || !IsHexString(w)) {
      throw std::invalid_argument("ABI word is not an address: " + w);
    }
    return NormalizeAddress(w.substr(24));
  }

  std::vector<std::vector<std::string>> DecodeFixedRowArray(const std::string& hex, size_t width) {
    std::string body = Strip0x(hex);
    size_t offset = WordToSize(Word(body, 0));
    if (offset % 32 != 0) throw std::invalid_argument("misaligned ABI array offset");
    size_t base = offset / 32;
    size_t length = WordToSize(Word(body, base));
    // Reject lengths the payload cannot possibly hold before reserving.
    if (body.size() < (base + 1 + length * width) * kWordHex) {
      throw std::out_of_range("ABI array truncated: " + std::to_string(length) + " rows declared");
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      std::vector<std::string> row;
      row.reserve(width);
      for (size_t j = 0; j < width; ++j) row.push_back(Word(body, base + 1 + i * width + j));
      rows.push_back(std::move(row));
    }
    return rows;
  }
}
